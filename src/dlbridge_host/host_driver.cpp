/*
* Copyright [2025] [Yue Liu]
*
* Licensed under the Apache License, Version 2.0 (the "License");
* you may not use this file except in compliance with the License.
* You may obtain a copy of the License at
*
* http://www.apache.org/licenses/LICENSE-2.0
*
* Unless required by applicable law or agreed to in writing, software
* distributed under the License is distributed on an "AS IS" BASIS,
* WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
* See the License for the specific language governing permissions and
* limitations under the License.
*/

/**
 * @file host_driver.cpp
 * @brief dlbridge::HostDriver 的实现。
 */

#include "dlbridge/host_driver.h"

#include "dlbridge/log_macros.h"

namespace dlbridge {

    namespace {

        std::shared_ptr<ILogger> DriverLogger() {
            return LogManager::Instance().GetLogger("dlbridge.driver");
        }

        void Fail(DriverOutcome& outcome, BridgeError error, Stage stage, const std::string& message) {
            outcome.error = error;
            outcome.stage = stage;
            outcome.message = message;
            auto logger = DriverLogger();
            DLBRIDGE_LOG_ERROR(logger, "Stage '{}' failed: {} ({})", StageToString(stage), message,
                ResultToString(error));
        }

    }  // namespace

    HostDriver::HostDriver(PluginHost& host, InvocationMarshaler& marshaler)
        : host_(host), marshaler_(marshaler) {
    }

    DriverRequest HostDriver::MakeRequest(std::string plugin_path, std::string input,
        uint32_t repeat_count, const InvocationOptions& options) {
        DriverRequest request;
        request.plugin_path = std::move(plugin_path);
        request.input = std::move(input);
        request.repeat_count = repeat_count;
        request.invocations = options.invocations;
        request.timeout = std::chrono::milliseconds(options.timeout_ms);
        return request;
    }

    DriverOutcome HostDriver::Run(const DriverRequest& request) noexcept {
        DriverOutcome outcome;
        auto logger = DriverLogger();

        try {
            if (request.invocations == 0) {
                Fail(outcome, BridgeError::kErrorInvalidArgument, Stage::kConfigure,
                    "invocations must be at least 1");
                return outcome;
            }

            // 1. open -> resolve -> validate
            outcome.stage = Stage::kOpen;
            PluginHandle handle;
            try {
                handle = host_.Load(request.plugin_path);
            } catch (const BridgeException& e) {
                Fail(outcome, e.GetError(), e.GetStage(), e.GetContext());
                return outcome;
            }
            outcome.plugin_name = handle.Name();
            outcome.stage = Stage::kValidate;

            // 2. encode -> invoke -> decode -> release (可重复)
            for (uint32_t i = 0; i < request.invocations; ++i) {
                outcome.stage = Stage::kEncode;
                InvocationRequest call = InvocationMarshaler::MakeRequest(request.input, request.repeat_count);
                try {
                    std::string value = request.timeout.count() > 0
                        ? marshaler_.CallWithTimeout(handle, call, request.timeout)
                        : marshaler_.Call(handle, call);
                    DLBRIDGE_LOG_DEBUG(logger, "Invocation {}/{} of '{}' returned {} bytes",
                        i + 1, request.invocations, handle.Name(), value.size());
                    outcome.results.push_back(std::move(value));
                    outcome.stage = Stage::kRelease;
                } catch (const BridgeException& e) {
                    Fail(outcome, e.GetError(), e.GetStage(), e.GetContext());
                    break;
                }
            }

            // 3. close (调用失败时也尝试，但保留最先发生的错误)
            if (request.keep_loaded) {
                outcome.handle = handle;
                return outcome;
            }
            if (outcome.error == BridgeError::kErrorTimeout) {
                // 被放弃的调用仍占着模块，不能等它返回
                try {
                    host_.Close(handle, ClosePolicy::kReject);
                } catch (const BridgeException& e) {
                    DLBRIDGE_LOG_WARN(logger, "Plugin '{}' is still running an abandoned call; leaving it mapped: {}",
                        handle.Name(), e.GetContext());
                }
                return outcome;
            }

            BridgeError close_error = host_.TryClose(handle);
            if (close_error != BridgeError::kSuccess) {
                if (outcome.Ok()) {
                    Fail(outcome, close_error, Stage::kClose, "cannot unload '" + handle.Name() + "'");
                } else {
                    DLBRIDGE_LOG_WARN(logger, "Unloading '{}' after failure also failed: {}",
                        handle.Name(), ResultToString(close_error));
                }
            } else if (outcome.Ok()) {
                outcome.stage = Stage::kClose;
            }
        } catch (const std::exception& e) {
            Fail(outcome, BridgeError::kErrorInternal, outcome.stage, e.what());
        }
        return outcome;
    }

}  // namespace dlbridge

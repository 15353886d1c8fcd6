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
 * @file invocation_marshaler.cpp
 * @brief dlbridge::InvocationMarshaler 的实现。
 * @author Yue Liu
 * @date 2025-12-04
 *
 * @details
 * [受众：框架维护者]
 *
 * 核心函数 `PerformInvoke` 只依赖模块记录和账本，
 * 同步调用和 `CallWithTimeout` 的工作线程共用它。
 */

#include "dlbridge/invocation_marshaler.h"

#include <condition_variable>
#include <cstring>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>

#include "dlbridge/log_macros.h"
#include "dlbridge/ownership_ledger.h"
#include "plugin_host_pimpl.h"

namespace dlbridge {

    namespace {

        std::shared_ptr<ILogger> MarshalerLogger() {
            return LogManager::Instance().GetLogger("dlbridge.marshaler");
        }

        /**
         * @brief 登记一个插件分配的缓冲区。
         * @details 释放器捕获模块记录：释放时 live_buffers - 1 并唤醒等待中的 Close。
         * 必须在调用准入期间调用。
         */
        BoundaryString RegisterPluginBuffer(const std::shared_ptr<detail::ModuleRecord>& record,
            OwnershipLedger& ledger, const dlb_buffer_v1& buffer) {
            dlb_release_fn_v1 release = record->descriptor.release;
            record->OnBufferRegistered();
            try {
                return ledger.Register(buffer.data, buffer.size, AllocatorSide::kPlugin, record->id,
                    [record, release](char* data, uint64_t size) {
                        release(data, size);
                        record->OnBufferReleased();
                    });
            } catch (const std::exception&) {
                release(buffer.data, buffer.size);
                record->OnBufferReleased();
                throw;
            }
        }

        /**
         * @brief 调用插件的 `invoke` 并登记结果。
         * @pre 调用方持有该模块的 CallGuard。
         */
        BoundaryString PerformInvoke(const std::shared_ptr<detail::ModuleRecord>& record,
            OwnershipLedger& ledger, const InvocationRequest& request, uint64_t max_result_bytes) {
            dlb_str_view_v1 input{ request.input.data, request.input.size };
            dlb_invoke_result_v1 out{};
            dlb_status_v1 status = DLB_STATUS_OK;
            {
                std::unique_lock<std::mutex> call_lock(record->call_mutex, std::defer_lock);
                if (!record->reentrant) {
                    call_lock.lock();
                }
                status = record->descriptor.invoke(&input, request.repeat_count, &out);
            }

            BoundaryString value;
            BoundaryString error;
            if (out.value.data) value = RegisterPluginBuffer(record, ledger, out.value);
            if (out.error.data && out.error.data == out.value.data) {
                // 同一块内存只能登记一次，否则会被释放两次
                ledger.Release(value);
                throw BridgeException(BridgeError::kErrorInvocationFailure, Stage::kInvoke,
                    "plugin '" + record->name + "' returned one buffer as both value and error");
            }
            if (out.error.data) {
                try {
                    error = RegisterPluginBuffer(record, ledger, out.error);
                } catch (const std::exception&) {
                    if (value.IsOwned()) ledger.Release(value);
                    throw;
                }
            }

            if (status != DLB_STATUS_OK || out.status != DLB_STATUS_OK) {
                std::string message;
                if (error.IsOwned()) {
                    message = ledger.Decode(error);
                    ledger.Release(error);
                }
                if (value.IsOwned()) ledger.Release(value);
                if (message.empty()) {
                    message = fmt::format("plugin '{}' returned status {}", record->name, status);
                }
                throw BridgeException(BridgeError::kErrorInvocationFailure, Stage::kInvoke, message);
            }

            if (error.IsOwned()) ledger.Release(error);

            if (!value.IsOwned()) {
                throw BridgeException(BridgeError::kErrorInvocationFailure, Stage::kInvoke,
                    "plugin '" + record->name + "' returned a null result");
            }
            if (value.size > max_result_bytes) {
                ledger.Release(value);
                throw BridgeException(BridgeError::kErrorInvocationFailure, Stage::kDecode,
                    fmt::format("result of {} bytes exceeds the limit of {} bytes", value.size, max_result_bytes));
            }
            return value;
        }

        /** @brief Decode + Release，Decode 失败时也释放。 */
        std::string DecodeAndRelease(OwnershipLedger& ledger, const BoundaryString& result) {
            std::string text;
            try {
                text = ledger.Decode(result);
            } catch (const std::exception&) {
                ledger.Release(result);
                throw;
            }
            ledger.Release(result);
            return text;
        }

        /** @brief CallWithTimeout 中调用方与工作线程共享的状态。 */
        struct TimedCallState {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            std::string value;
            BridgeError error = BridgeError::kSuccess;
            Stage stage = Stage::kInvoke;
            std::string message;
        };

    }  // namespace

    InvocationMarshaler::InvocationMarshaler(PluginHost& host, InvocationOptions options)
        : host_(host), ledger_(host.Ledger()), options_(options) {
    }

    BoundaryString InvocationMarshaler::Encode(std::string_view text) noexcept {
        BoundaryString str;
        str.data = text.data();
        str.size = static_cast<uint64_t>(text.size());
        str.side = AllocatorSide::kHost;
        return str;
    }

    InvocationRequest InvocationMarshaler::MakeRequest(std::string_view text, uint32_t repeat_count) noexcept {
        InvocationRequest request;
        request.input = Encode(text);
        request.repeat_count = repeat_count;
        return request;
    }

    BoundaryString InvocationMarshaler::Invoke(const PluginHandle& handle, const InvocationRequest& request) {
        detail::CallGuard guard(host_.AdmitCall(handle));
        auto logger = MarshalerLogger();
        DLBRIDGE_LOG_DEBUG(logger, "Invoking '{}' (input {} bytes, repeat {})",
            guard.Record()->name, request.input.size, request.repeat_count);
        return PerformInvoke(guard.Record(), *ledger_, request, options_.max_result_bytes);
    }

    std::string InvocationMarshaler::Decode(const BoundaryString& str) const {
        return ledger_->Decode(str);
    }

    void InvocationMarshaler::Release(const BoundaryString& str) {
        ledger_->Release(str);
    }

    std::string InvocationMarshaler::Call(const PluginHandle& handle, const InvocationRequest& request) {
        BoundaryString result = Invoke(handle, request);
        return DecodeAndRelease(*ledger_, result);
    }

    std::string InvocationMarshaler::CallWithTimeout(const PluginHandle& handle,
        const InvocationRequest& request, std::chrono::milliseconds timeout) {
        if (timeout.count() <= 0) {
            return Call(handle, request);
        }

        auto logger = MarshalerLogger();
        detail::CallGuard guard(host_.AdmitCall(handle));
        const std::string plugin_name = guard.Record()->name;

        // 工作线程可能比调用方活得更久，因此输入必须拷贝到宿主自己的内存
        const uint64_t input_size = request.input.size;
        std::unique_ptr<char[]> input_copy(new char[input_size ? input_size : 1]);
        if (input_size) {
            std::memcpy(input_copy.get(), request.input.data, static_cast<std::size_t>(input_size));
        }
        BoundaryString owned_input = ledger_->Register(input_copy.get(), input_size, AllocatorSide::kHost, 0,
            [](char* data, uint64_t) { delete[] data; });
        input_copy.release();  // 已由账本持有

        auto state = std::make_shared<TimedCallState>();
        auto ledger = ledger_;
        const uint64_t max_result_bytes = options_.max_result_bytes;
        const uint32_t repeat_count = request.repeat_count;

        try {
            std::thread worker([state, ledger, guard = std::move(guard), owned_input, repeat_count, max_result_bytes]() {
                std::string value;
                BridgeError error = BridgeError::kSuccess;
                Stage stage = Stage::kInvoke;
                std::string message;
                try {
                    InvocationRequest owned_request;
                    owned_request.input = owned_input;
                    owned_request.repeat_count = repeat_count;
                    BoundaryString result = PerformInvoke(guard.Record(), *ledger, owned_request, max_result_bytes);
                    value = DecodeAndRelease(*ledger, result);
                } catch (const BridgeException& e) {
                    error = e.GetError();
                    stage = e.GetStage();
                    message = e.GetContext();
                } catch (const std::exception& e) {
                    error = BridgeError::kErrorInternal;
                    message = e.what();
                }

                try {
                    ledger->Release(owned_input);
                } catch (const BridgeException& e) {
                    auto worker_logger = MarshalerLogger();
                    DLBRIDGE_LOG_ERROR(worker_logger, "Failed to release timed call input: {}", e.what());
                }

                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->value = std::move(value);
                    state->error = error;
                    state->stage = stage;
                    state->message = std::move(message);
                    state->done = true;
                }
                state->cv.notify_all();
            });
            worker.detach();
        } catch (const std::system_error& e) {
            ledger_->Release(owned_input);
            throw BridgeException(BridgeError::kErrorInternal, Stage::kInvoke,
                std::string("cannot start call worker: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(state->mutex);
        if (!state->cv.wait_for(lock, timeout, [&state]() { return state->done; })) {
            DLBRIDGE_LOG_WARN(logger, "Call to '{}' abandoned after {} ms; worker keeps the module loaded",
                plugin_name, timeout.count());
            throw BridgeException(BridgeError::kErrorTimeout, Stage::kInvoke,
                fmt::format("plugin '{}' did not return within {} ms", plugin_name, timeout.count()));
        }
        if (state->error != BridgeError::kSuccess) {
            throw BridgeException(state->error, state->stage, state->message);
        }
        return std::move(state->value);
    }

    std::pair<std::string, BridgeError> InvocationMarshaler::TryCall(
        const PluginHandle& handle, const InvocationRequest& request, std::string* out_message) noexcept {
        try {
            return { Call(handle, request), BridgeError::kSuccess };
        } catch (const BridgeException& e) {
            if (out_message) *out_message = e.GetContext();
            return { std::string(), e.GetError() };
        } catch (const std::exception& e) {
            if (out_message) *out_message = e.what();
            return { std::string(), BridgeError::kErrorInternal };
        }
    }

}  // namespace dlbridge

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
 * @file host_driver.h
 * @brief 宿主驱动 HostDriver：打开 -> 调用 -> 解码 -> 释放 -> 卸载 的编排。
 * @author Yue Liu
 * @date 2025-12-04
 *
 * @details
 * `Run` 从不抛出异常：每一种失败都被记录日志，并作为 `DriverOutcome`
 * (错误码 + 阶段 + 信息) 返回。
 */

#pragma once

#ifndef DLBRIDGE_HOST_DRIVER_H_
#define DLBRIDGE_HOST_DRIVER_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "dlbridge/bridge_errors.h"
#include "dlbridge/dlbridge_api.h"
#include "dlbridge/invocation_marshaler.h"
#include "dlbridge/plugin_host.h"

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

namespace dlbridge {

    /**
     * @struct DriverRequest
     * @brief 一次驱动流程的输入。
     */
    struct DriverRequest {
        std::string plugin_path;
        std::string input;
        uint32_t repeat_count = 0;
        uint32_t invocations = 1;                    //!< 同一句柄上的调用次数 (>= 1)
        std::chrono::milliseconds timeout{ 0 };      //!< 0 = 不设期限
        bool keep_loaded = false;                    //!< true 时结束后不卸载
    };

    /**
     * @struct DriverOutcome
     * @brief 一次驱动流程的结果。
     */
    struct DriverOutcome {
        BridgeError error = BridgeError::kSuccess;
        Stage stage = Stage::kConfigure;              //!< 失败阶段；成功时为最后完成的阶段
        std::string message;
        std::string plugin_name;                      //!< 加载成功后填写
        std::vector<std::string> results;             //!< 每次调用的结果
        PluginHandle handle;                          //!< keep_loaded 时有效

        bool Ok() const noexcept { return error == BridgeError::kSuccess; }
    };

    /**
     * @class HostDriver
     * @brief 串起 PluginHost 与 InvocationMarshaler 的编排者。
     */
    class DLBRIDGE_API HostDriver {
    public:
        HostDriver(PluginHost& host, InvocationMarshaler& marshaler);

        /**
         * @brief 执行完整流程。
         * @details
         * 调用阶段失败时仍会尝试卸载 (除非 keep_loaded)，但返回的是最先发生的错误。
         */
        [[nodiscard]] DriverOutcome Run(const DriverRequest& request) noexcept;

        /** @brief 按 InvocationOptions 填好 invocations / timeout 的请求。 */
        static DriverRequest MakeRequest(std::string plugin_path, std::string input,
            uint32_t repeat_count, const InvocationOptions& options);

    private:
        PluginHost& host_;
        InvocationMarshaler& marshaler_;
    };

}  // namespace dlbridge

#ifdef _MSC_VER
#pragma warning(pop)
#endif

#endif  // DLBRIDGE_HOST_DRIVER_H_

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
 * @file invocation_marshaler.h
 * @brief [核心组件] 调用封送器 InvocationMarshaler。
 * @author Yue Liu
 * @date 2025-12-04
 *
 * @details
 * [受众：框架使用者]
 *
 * 一次调用的完整流程：
 * @code
 * dlbridge::InvocationMarshaler marshaler(host);
 * auto request = dlbridge::InvocationMarshaler::MakeRequest("cool", 3);
 * dlbridge::BoundaryString result = marshaler.Invoke(handle, request);
 * std::string text = marshaler.Decode(result);   // 立即拷贝到宿主内存
 * marshaler.Release(result);                     // 通过插件自己的 release 释放
 * @endcode
 *
 * 通常直接使用 `Call()`：它保证在任何路径上都释放结果。
 *
 * [受众：维护者]
 *
 * - 非可重入插件的调用按模块串行化 (模块记录中的 call_mutex)。
 * - 插件缓冲区在调用准入期间登记 (live_buffers + 1)，
 * 因此 `Close` 不可能在 "调用返回" 与 "缓冲区登记" 之间插入。
 * - `CallWithTimeout` 的工作线程只持有模块记录和账本的 shared_ptr，
 * 不引用 PluginHost 或 InvocationMarshaler，超时放弃后双方都可以先销毁。
 */

#pragma once

#ifndef DLBRIDGE_INVOCATION_MARSHALER_H_
#define DLBRIDGE_INVOCATION_MARSHALER_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include "dlbridge/boundary_string.h"
#include "dlbridge/bridge_errors.h"
#include "dlbridge/dlbridge_api.h"
#include "dlbridge/plugin_host.h"

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

namespace dlbridge {

    /** @brief 默认的单个结果大小上限 (64 MiB)。 */
    constexpr uint64_t kDefaultMaxResultBytes = 64ull * 1024 * 1024;

    /**
     * @struct InvocationOptions
     * @brief 调用相关配置 (来自 HostConfig 的 "invocation" 节)。
     */
    struct InvocationOptions {
        uint32_t timeout_ms = 0;       //!< 0 = 不设期限
        uint32_t invocations = 1;      //!< HostDriver 在同一句柄上重复调用的次数
        uint64_t max_result_bytes = kDefaultMaxResultBytes;
    };

    /**
     * @struct InvocationRequest
     * @brief 一次调用的输入。每次调用重新构造。
     */
    struct InvocationRequest {
        BoundaryString input;
        uint32_t repeat_count = 0;
    };

    /**
     * @class InvocationMarshaler
     * @brief 把宿主数据送过边界、把插件结果带回来。
     */
    class DLBRIDGE_API InvocationMarshaler {
    public:
        explicit InvocationMarshaler(PluginHost& host, InvocationOptions options = {});

        /**
         * @brief 零拷贝编码：返回指向 `text` 的借用视图 (kHost, generation 0)。
         * @warning 调用方必须保证 `text` 的底层内存在整个调用期间不变。
         */
        static BoundaryString Encode(std::string_view text) noexcept;

        /** @brief `Encode` + repeat_count。 */
        static InvocationRequest MakeRequest(std::string_view text, uint32_t repeat_count) noexcept;

        /**
         * @brief 调用插件并返回插件分配的结果。
         * @return 已登记的 BoundaryString (kPlugin)，调用方必须 `Release`。
         * @throws BridgeException
         * - kErrorHandleClosed: 句柄过期或模块正在关闭。
         * - kErrorInvocationFailure: 插件返回错误状态、空结果或超大结果。
         *   错误缓冲区在抛出之前已解码并释放。
         */
        [[nodiscard]] BoundaryString Invoke(const PluginHandle& handle, const InvocationRequest& request);

        /**
         * @brief 拷贝到宿主内存。
         * @throws BridgeException (kErrorOwnershipViolation) 缓冲区已释放时。
         */
        [[nodiscard]] std::string Decode(const BoundaryString& str) const;

        /**
         * @brief 通过分配方的释放器释放 (恰好一次)。
         * @throws BridgeException (kErrorOwnershipViolation) 重复释放时。
         */
        void Release(const BoundaryString& str);

        /**
         * @brief Invoke + Decode + Release。无论成功与否结果都会被释放。
         */
        [[nodiscard]] std::string Call(const PluginHandle& handle, const InvocationRequest& request);

        /**
         * @brief 带期限的调用。
         * @details
         * 在分离的工作线程上执行，工作线程持有输入的宿主侧拷贝 (登记为 kHost)。
         * 超过期限后调用被 *放弃* (不会被杀死)，抛出 kErrorTimeout；
         * 工作线程在插件最终返回后自行释放所有缓冲区，在此之前模块不会被卸载。
         * @param timeout 期限。`<= 0` 等同于 `Call()`。
         */
        [[nodiscard]] std::string CallWithTimeout(const PluginHandle& handle,
            const InvocationRequest& request, std::chrono::milliseconds timeout);

        /** @brief `Call` 的不抛异常版本。 */
        [[nodiscard]] std::pair<std::string, BridgeError> TryCall(
            const PluginHandle& handle, const InvocationRequest& request,
            std::string* out_message = nullptr) noexcept;

        [[nodiscard]] const InvocationOptions& Options() const noexcept { return options_; }

    private:
        PluginHost& host_;
        std::shared_ptr<OwnershipLedger> ledger_;
        InvocationOptions options_;
    };

}  // namespace dlbridge

#ifdef _MSC_VER
#pragma warning(pop)
#endif

#endif  // DLBRIDGE_INVOCATION_MARSHALER_H_

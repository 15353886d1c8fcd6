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
 * @file plugin_sdk.h
 * @brief [插件开发者] 插件注册宏 DLBRIDGE_DEFINE_PLUGIN 及其辅助函数。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * [受众：插件开发者]
 *
 * 插件只需要写一个普通的 C++ 函数，再用一行宏导出：
 * @code
 * #include "dlbridge/plugin_sdk.h"
 *
 * static std::string Repeat(std::string_view input, uint32_t count) { ... }
 *
 * DLBRIDGE_DEFINE_PLUGIN("repeat", Repeat, DLB_PLUGIN_FLAG_REENTRANT)
 * @endcode
 *
 * 宏会生成唯一的导出符号 `dlbridge_plugin_entry_v1`，并负责：
 * 1. 校验宿主预填的 `struct_size` / `abi_version`。
 * 2. 把实现函数包装成 C ABI 的 `invoke`：
 *    - 抛出的异常 *绝不* 穿越边界，而是转换成 DLB_STATUS_FAILED + 错误信息。
 *    - 返回的字符串用插件自己的 `new[]` 分配，由插件的 `release` (`delete[]`) 释放。
 *
 * [依赖说明]
 * 只依赖 `dlbridge_abi.h` 和标准库。插件 *不* 链接 dlbridge_host。
 */

#pragma once

#ifndef DLBRIDGE_PLUGIN_SDK_H_
#define DLBRIDGE_PLUGIN_SDK_H_

#include <cstdint>
#include <cstring>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>
#include "dlbridge/dlbridge_abi.h"

namespace dlbridge {
    namespace sdk {

        /** @brief 插件实现函数的签名。 */
        using PluginFunction = std::string (*)(std::string_view input, uint32_t repeat_count);

        /** @brief 声明的签名：(STRING, UINT32) -> STRING。 */
        inline constexpr dlb_type_v1 kStringRepeatParams[2] = { DLB_TYPE_STRING, DLB_TYPE_UINT32 };

        /**
         * @class PluginError
         * @brief 插件实现函数抛出它来报告业务失败 (宿主收到 kErrorInvocationFailure)。
         */
        class PluginError : public std::runtime_error {
        public:
            explicit PluginError(const std::string& message) : std::runtime_error(message) {}
        };

        /**
         * @brief 用插件自己的分配器拷贝一段文本。
         * @details 长度为 0 时也分配 1 字节，保证成功结果的 data 非空。
         * @throws std::bad_alloc
         */
        inline dlb_buffer_v1 AllocateBuffer(std::string_view text) {
            char* data = new char[text.empty() ? 1 : text.size()];
            if (!text.empty()) {
                std::memcpy(data, text.data(), text.size());
            }
            return dlb_buffer_v1{ data, static_cast<uint64_t>(text.size()) };
        }

        /** @brief 不抛异常的 AllocateBuffer，内存不足时返回空缓冲区。 */
        inline dlb_buffer_v1 AllocateBufferNoThrow(std::string_view text) noexcept {
            try {
                return AllocateBuffer(text);
            } catch (const std::bad_alloc&) {
                return dlb_buffer_v1{ nullptr, 0 };
            }
        }

        /** @brief 插件侧的 `release` 入口。 */
        inline void DLB_ABI_CALL ReleaseBuffer(char* data, uint64_t /*size*/) {
            delete[] data;
        }

        /** @brief 以失败状态填写结果。 */
        inline dlb_status_v1 SetFailure(dlb_invoke_result_v1* out, dlb_status_v1 status,
            std::string_view message) noexcept {
            out->status = status;
            out->error = AllocateBufferNoThrow(message);
            return status;
        }

        /**
         * @brief [C ABI 适配] 把 `Impl` 包装成 `dlb_invoke_fn_v1`。
         */
        template <PluginFunction Impl>
        dlb_status_v1 DLB_ABI_CALL InvokeThunk(const dlb_str_view_v1* input, uint32_t repeat_count,
            dlb_invoke_result_v1* out_result) {
            if (!out_result) return DLB_STATUS_INVALID_ARG;
            *out_result = dlb_invoke_result_v1{};

            if (!input || (!input->data && input->size != 0)) {
                return SetFailure(out_result, DLB_STATUS_INVALID_ARG, "invalid input view");
            }

            try {
                std::string_view text(input->data ? input->data : "", static_cast<std::size_t>(input->size));
                std::string value = Impl(text, repeat_count);
                out_result->value = AllocateBuffer(value);
                out_result->status = DLB_STATUS_OK;
                return DLB_STATUS_OK;
            } catch (const std::exception& e) {
                if (out_result->value.data) {
                    ReleaseBuffer(out_result->value.data, out_result->value.size);
                    out_result->value = dlb_buffer_v1{};
                }
                return SetFailure(out_result, DLB_STATUS_FAILED, e.what());
            } catch (...) {
                // 非 std::exception 的异常同样不能穿越边界
                return SetFailure(out_result, DLB_STATUS_FAILED, "function panicked");
            }
        }

        /**
         * @brief 填写描述符。
         * @return 宿主预填的版本/大小不被支持时返回 DLB_STATUS_UNSUPPORTED。
         */
        inline dlb_status_v1 FillDescriptor(dlb_plugin_descriptor_v1* out, const char* name,
            uint32_t flags, dlb_invoke_fn_v1 invoke) noexcept {
            if (!out) return DLB_STATUS_INVALID_ARG;
            if (out->abi_version != DLB_ABI_VERSION_V1 || out->struct_size < sizeof(dlb_plugin_descriptor_v1)) {
                return DLB_STATUS_UNSUPPORTED;
            }
            out->struct_size = static_cast<uint32_t>(sizeof(dlb_plugin_descriptor_v1));
            out->abi_version = DLB_ABI_VERSION_V1;
            out->name = dlb_str_view_v1{ name, static_cast<uint64_t>(std::strlen(name)) };
            out->flags = flags;
            out->param_count = 2;
            out->param_types = kStringRepeatParams;
            out->return_type = DLB_TYPE_STRING;
            out->reserved = 0;
            out->invoke = invoke;
            out->release = &ReleaseBuffer;
            return DLB_STATUS_OK;
        }

    }  // namespace sdk
}  // namespace dlbridge

/**
 * @def DLBRIDGE_DEFINE_PLUGIN
 * @brief 导出插件入口 `dlbridge_plugin_entry_v1`。每个插件只能使用一次。
 * @param plugin_name 字符串字面量 (插件生命周期内有效，宿主不会释放)。
 * @param impl_function `std::string(std::string_view, uint32_t)` 函数。
 * @param plugin_flags 0 或 DLB_PLUGIN_FLAG_REENTRANT。
 */
#define DLBRIDGE_DEFINE_PLUGIN(plugin_name, impl_function, plugin_flags) \
    extern "C" DLB_ABI_EXPORT dlb_status_v1 DLB_ABI_CALL \
    dlbridge_plugin_entry_v1(dlb_plugin_descriptor_v1* out_descriptor) { \
        return dlbridge::sdk::FillDescriptor(out_descriptor, plugin_name, plugin_flags, \
            &dlbridge::sdk::InvokeThunk<&impl_function>); \
    }

#endif  // DLBRIDGE_PLUGIN_SDK_H_

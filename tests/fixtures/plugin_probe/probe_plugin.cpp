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
 * @file probe_plugin.cpp
 * @brief [测试插件] "probe"：行为由输入字符串控制，用于宿主的集成测试。
 *
 * @details
 * 不可重入 (flags = 0)，宿主必须串行化对它的调用。
 *
 * | 输入    | 行为                                                        |
 * |---------|-------------------------------------------------------------|
 * | "sleep" | 睡眠 repeat_count 毫秒后返回 "slept"                        |
 * | "track" | 睡眠 repeat_count 毫秒，返回调用期间观察到的最大并发数       |
 * | "fail"  | 抛出 PluginError("probe failure requested")                 |
 * | "throw" | 抛出非 std::exception 的异常                                |
 * | "null"  | 返回 DLB_STATUS_OK 但结果缓冲区为空                          |
 * | "error-ok" | 返回 DLB_STATUS_OK，同时附带一个多余的错误缓冲区           |
 * | "alias" | value 和 error 指向同一个缓冲区                              |
 * | 其他    | 原样返回输入                                                |
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <thread>

#include "dlbridge/plugin_sdk.h"

namespace {

    std::atomic<int> g_active_calls{ 0 };
    std::atomic<int> g_max_active_calls{ 0 };

    std::string Probe(std::string_view input, uint32_t count) {
        if (input == "sleep") {
            std::this_thread::sleep_for(std::chrono::milliseconds(count));
            return "slept";
        }
        if (input == "track") {
            int active = ++g_active_calls;
            int seen = g_max_active_calls.load();
            while (active > seen && !g_max_active_calls.compare_exchange_weak(seen, active)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(count));
            --g_active_calls;
            return std::to_string(g_max_active_calls.load());
        }
        if (input == "fail") {
            throw dlbridge::sdk::PluginError("probe failure requested");
        }
        if (input == "throw") {
            throw 42;
        }
        return std::string(input);
    }

    dlb_status_v1 DLB_ABI_CALL ProbeInvoke(const dlb_str_view_v1* input, uint32_t count,
        dlb_invoke_result_v1* out_result) {
        if (input && out_result && input->data) {
            std::string_view text(input->data, static_cast<std::size_t>(input->size));
            if (text == "null") {
                *out_result = dlb_invoke_result_v1{};
                out_result->status = DLB_STATUS_OK;
                return DLB_STATUS_OK;
            }
            if (text == "alias") {
                *out_result = dlb_invoke_result_v1{};
                out_result->value = dlbridge::sdk::AllocateBufferNoThrow("shared");
                out_result->error = out_result->value;
                out_result->status = DLB_STATUS_OK;
                return DLB_STATUS_OK;
            }
            if (text == "error-ok") {
                *out_result = dlb_invoke_result_v1{};
                out_result->value = dlbridge::sdk::AllocateBufferNoThrow("ok");
                out_result->error = dlbridge::sdk::AllocateBufferNoThrow("ignored");
                out_result->status = DLB_STATUS_OK;
                return DLB_STATUS_OK;
            }
        }
        return dlbridge::sdk::InvokeThunk<&Probe>(input, count, out_result);
    }

}  // namespace

extern "C" DLB_ABI_EXPORT dlb_status_v1 DLB_ABI_CALL
dlbridge_plugin_entry_v1(dlb_plugin_descriptor_v1* out_descriptor) {
    return dlbridge::sdk::FillDescriptor(out_descriptor, "probe", 0, &ProbeInvoke);
}

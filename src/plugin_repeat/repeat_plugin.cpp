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
 * @file repeat_plugin.cpp
 * @brief [示例插件] "repeat"：把输入字符串重复 N 次。
 * @author Yue Liu
 * @date 2025-12-05
 *
 * @details
 * [受众：插件开发者]
 *
 * 这是一个最小但完整的插件：
 * - 只包含 `dlbridge/plugin_sdk.h`，不链接宿主库。
 * - 没有可变全局状态，因此声明为可重入 (DLB_PLUGIN_FLAG_REENTRANT)。
 */

#include <string>
#include <string_view>

#include "dlbridge/plugin_sdk.h"

namespace {

    std::string Repeat(std::string_view input, uint32_t count) {
        std::string result;
        result.reserve(input.size() * count);
        for (uint32_t i = 0; i < count; ++i) {
            result.append(input.data(), input.size());
        }
        return result;
    }

}  // namespace

DLBRIDGE_DEFINE_PLUGIN("repeat", Repeat, DLB_PLUGIN_FLAG_REENTRANT)

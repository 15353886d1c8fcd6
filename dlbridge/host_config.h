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
 * @file host_config.h
 * @brief 宿主配置 HostConfig (JSON, nlohmann_json)。
 * @author Yue Liu
 * @date 2025-12-04
 *
 * @details
 * [受众：使用者]
 *
 * 配置文件格式：
 * @code
 * {
 *   "loader":     { "close_policy": "block", "close_timeout_ms": 0 },
 *   "invocation": { "timeout_ms": 0, "invocations": 1, "max_result_bytes": 67108864 },
 *   "logging": {
 *     "global_settings": { "format_pattern": "...", "flush_on_level": "error" },
 *     "sinks": { "console": { "type": "stderr_color_sink", "level": "info" } },
 *     "default_rule": { "sinks": ["console"] },
 *     "rules": [ { "matcher": "dlbridge.ownership", "sinks": ["console"] } ]
 *   }
 * }
 * @endcode
 * 缺失的键取默认值。
 *
 * [自校验]
 * 解析之后总是调用 `HostConfig::Validate`；校验失败时抛出 kErrorConfigInvalid。
 */

#pragma once

#ifndef DLBRIDGE_HOST_CONFIG_H_
#define DLBRIDGE_HOST_CONFIG_H_

#include <string>
#include "dlbridge/dlbridge_api.h"
#include "dlbridge/invocation_marshaler.h"
#include "dlbridge/log_service.h"
#include "dlbridge/plugin_host.h"

namespace dlbridge {

    /**
     * @struct HostConfig
     * @brief 宿主的完整配置。
     */
    struct HostConfig {
        LoaderOptions loader;
        InvocationOptions invocation;

        /** @brief 配置文件中是否出现了 "logging" 节。 */
        bool has_logging = false;
        LoggingOptions logging;

        /**
         * @brief 自校验。
         * @param[out] err_msg 失败原因。
         */
        DLBRIDGE_API bool Validate(std::string& err_msg) const;
    };

    /** @brief 全部取默认值的配置 (无 logging 节)。 */
    DLBRIDGE_API HostConfig DefaultHostConfig();

    /**
     * @brief 从 JSON 文本解析。
     * @throws BridgeException kErrorConfigInvalid (Stage::kConfigure)
     */
    DLBRIDGE_API HostConfig ParseHostConfig(const std::string& json_text);

    /**
     * @brief 从文件加载 (路径为 UTF-8)。
     * @throws BridgeException kErrorConfigInvalid (Stage::kConfigure)
     */
    DLBRIDGE_API HostConfig LoadHostConfig(const std::string& path);

    /** @brief 序列化为 JSON 文本 (缩进 4)。 */
    DLBRIDGE_API std::string ToJson(const HostConfig& config);

    DLBRIDGE_API const char* ClosePolicyToString(ClosePolicy policy);

}  // namespace dlbridge

#endif  // DLBRIDGE_HOST_CONFIG_H_

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
 * @file host_config.cpp
 * @brief HostConfig 的 JSON 解析、校验与序列化 (nlohmann_json)。
 * @author Yue Liu
 * @date 2025-12-04
 */

#include "dlbridge/host_config.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "dlbridge/bridge_errors.h"
#include "dlbridge/dlbridge_utils.h"

namespace dlbridge {

    namespace {
        using json = nlohmann::json;

        const std::set<std::string>& KnownSinkTypes() {
            static const std::set<std::string> kTypes = {
                "stderr_color_sink", "stdout_color_sink", "rotating_file_sink", "daily_file_sink"
            };
            return kTypes;
        }

        LogLevel LevelOrThrow(const std::string& text) {
            LogLevel level = LogLevel::Info;
            if (!ParseLogLevel(text, level)) {
                throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure,
                    "unknown log level '" + text + "'");
            }
            return level;
        }

        ClosePolicy PolicyOrThrow(const std::string& text) {
            if (text == "block") return ClosePolicy::kBlock;
            if (text == "reject") return ClosePolicy::kReject;
            throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure,
                "unknown close_policy '" + text + "' (expected \"block\" or \"reject\")");
        }

        /**
         * @brief 读取无符号整数键；缺失时返回默认值。
         * @details 负数、小数和超出 T 范围的值都被拒绝，而不是被截断或回绕。
         */
        template <typename T>
        T UnsignedOrThrow(const json& node, const char* key, T default_value) {
            auto it = node.find(key);
            if (it == node.end()) return default_value;
            if (!it->is_number_unsigned() ||
                it->template get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure,
                    std::string("'") + key + "' must be an unsigned integer no larger than " +
                    std::to_string(std::numeric_limits<T>::max()) + ", got " + it->dump());
            }
            return static_cast<T>(it->template get<uint64_t>());
        }

        /** @brief 解析 "logging" 节 (与日志服务配置文件相同的格式)。 */
        LoggingOptions ParseLogging(const json& node) {
            LoggingOptions options;
            if (node.contains("global_settings")) {
                const auto& gs = node.at("global_settings");
                options.format_pattern = gs.value("format_pattern", options.format_pattern);
                options.flush_level = LevelOrThrow(gs.value("flush_on_level", "error"));
            }

            if (node.contains("sinks")) {
                for (const auto& [name, sink_conf] : node.at("sinks").items()) {
                    SinkOptions sink;
                    sink.name = name;
                    sink.type = sink_conf.value("type", "stderr_color_sink");
                    sink.level = LevelOrThrow(sink_conf.value("level", "info"));
                    if (sink.type.find("file") != std::string::npos) {
                        sink.base_name = sink_conf.value("base_name", "dlbridge.log");
                    }
                    if (sink.type == "rotating_file_sink") {
                        sink.max_size = UnsignedOrThrow(sink_conf, "max_size", sink.max_size);
                        sink.max_files = UnsignedOrThrow(sink_conf, "max_files", sink.max_files);
                    }
                    options.sinks.push_back(sink);
                }
            }

            if (node.contains("default_rule")) {
                options.default_sinks = node.at("default_rule").value("sinks", std::vector<std::string>{});
            }
            if (node.contains("rules")) {
                for (const auto& rule_conf : node.at("rules")) {
                    RuleOptions rule;
                    rule.matcher = rule_conf.value("matcher", "");
                    rule.sinks = rule_conf.value("sinks", std::vector<std::string>{});
                    options.rules.push_back(rule);
                }
            }
            return options;
        }

        json LoggingToJson(const LoggingOptions& options) {
            json node;
            node["global_settings"] = {
                {"format_pattern", options.format_pattern},
                {"flush_on_level", LogLevelToString(options.flush_level)}
            };
            json sinks = json::object();
            for (const auto& sink : options.sinks) {
                json s = { {"type", sink.type}, {"level", LogLevelToString(sink.level)} };
                if (!sink.base_name.empty()) s["base_name"] = sink.base_name;
                if (sink.type == "rotating_file_sink") {
                    s["max_size"] = sink.max_size;
                    s["max_files"] = sink.max_files;
                }
                sinks[sink.name] = s;
            }
            node["sinks"] = sinks;
            node["default_rule"] = { {"sinks", options.default_sinks} };
            json rules = json::array();
            for (const auto& rule : options.rules) {
                rules.push_back({ {"matcher", rule.matcher}, {"sinks", rule.sinks} });
            }
            node["rules"] = rules;
            return node;
        }

    }  // namespace

    const char* ClosePolicyToString(ClosePolicy policy) {
        return policy == ClosePolicy::kReject ? "reject" : "block";
    }

    bool HostConfig::Validate(std::string& err_msg) const {
        if (invocation.invocations == 0) {
            err_msg = "invocation.invocations must be at least 1";
            return false;
        }
        if (invocation.max_result_bytes == 0) {
            err_msg = "invocation.max_result_bytes must be positive";
            return false;
        }
        if (!has_logging) return true;

        std::set<std::string> names;
        for (const auto& sink : logging.sinks) {
            if (!KnownSinkTypes().count(sink.type)) {
                err_msg = "sink '" + sink.name + "' has unsupported type '" + sink.type + "'";
                return false;
            }
            if (sink.type.find("file") != std::string::npos && sink.base_name.empty()) {
                err_msg = "file sink '" + sink.name + "' needs a base_name";
                return false;
            }
            names.insert(sink.name);
        }
        auto check = [&](const std::vector<std::string>& refs, const std::string& where) {
            for (const auto& ref : refs) {
                if (!names.count(ref)) {
                    err_msg = where + " references undefined sink '" + ref + "'";
                    return false;
                }
            }
            return true;
        };
        if (!check(logging.default_sinks, "default_rule")) return false;
        for (const auto& rule : logging.rules) {
            if (rule.matcher.empty()) {
                err_msg = "rule without matcher";
                return false;
            }
            if (!check(rule.sinks, "rule '" + rule.matcher + "'")) return false;
        }
        return true;
    }

    HostConfig DefaultHostConfig() {
        return HostConfig{};
    }

    HostConfig ParseHostConfig(const std::string& json_text) {
        HostConfig config;
        try {
            json root = json::parse(json_text);
            if (!root.is_object()) {
                throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure,
                    "configuration root must be a JSON object");
            }

            if (root.contains("loader")) {
                const auto& loader = root.at("loader");
                config.loader.close_policy = PolicyOrThrow(loader.value("close_policy", "block"));
                config.loader.close_timeout_ms = UnsignedOrThrow(loader, "close_timeout_ms", config.loader.close_timeout_ms);
            }
            if (root.contains("invocation")) {
                const auto& inv = root.at("invocation");
                config.invocation.timeout_ms = UnsignedOrThrow(inv, "timeout_ms", config.invocation.timeout_ms);
                config.invocation.invocations = UnsignedOrThrow(inv, "invocations", config.invocation.invocations);
                config.invocation.max_result_bytes = UnsignedOrThrow(inv, "max_result_bytes", config.invocation.max_result_bytes);
            }
            if (root.contains("logging")) {
                config.logging = ParseLogging(root.at("logging"));
                config.has_logging = true;
            }
        } catch (const json::exception& e) {
            throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure, e.what());
        }

        std::string err_msg;
        if (!config.Validate(err_msg)) {
            throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure, err_msg);
        }
        return config;
    }

    HostConfig LoadHostConfig(const std::string& path) {
        // Utf8ToPath: Windows 上以宽字符路径打开
        std::ifstream f(utils::Utf8ToPath(path));
        if (!f.is_open()) {
            throw BridgeException(BridgeError::kErrorConfigInvalid, Stage::kConfigure,
                "config file not found: " + path);
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        return ParseHostConfig(buffer.str());
    }

    std::string ToJson(const HostConfig& config) {
        json root;
        root["loader"] = {
            {"close_policy", ClosePolicyToString(config.loader.close_policy)},
            {"close_timeout_ms", config.loader.close_timeout_ms}
        };
        root["invocation"] = {
            {"timeout_ms", config.invocation.timeout_ms},
            {"invocations", config.invocation.invocations},
            {"max_result_bytes", config.invocation.max_result_bytes}
        };
        if (config.has_logging) {
            root["logging"] = LoggingToJson(config.logging);
        }
        return root.dump(4);
    }

}  // namespace dlbridge

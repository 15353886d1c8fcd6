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
 * @file main.cpp
 * @brief [宿主] 命令行宿主 `host` 的入口点。
 * @author Yue Liu
 * @date 2025-12-05
 *
 * @details
 * [受众：框架使用者 (宿主开发者)]
 *
 * 用法：`host <plugin-path> <input-string> <repeat-count>`
 *
 * 1. 读取配置 (环境变量 `DLBRIDGE_CONFIG` 指定的 JSON 文件；未设置时使用默认值)。
 * 2. 按配置初始化日志 (日志写到 stderr，stdout 只输出结果)。
 * 3. 交给 `HostDriver` 完成 加载 -> 调用 -> 释放 -> 卸载。
 *
 * 退出码：0 成功；1 加载/解析/调用失败；2 用法或配置错误。
 */

#include "dlbridge/dlbridge.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

namespace {

    constexpr int kExitSuccess = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitUsage = 2;

    void PrintUsage(const char* program) {
        std::cerr << "Usage: " << program << " <plugin-path> <input-string> <repeat-count>" << std::endl;
    }

    /** @brief 解析十进制 uint32；拒绝负数、空串和尾随字符。 */
    bool ParseRepeatCount(const std::string& text, uint32_t& out) {
        if (text.empty() || text[0] == '-' || text[0] == '+') return false;
        errno = 0;
        char* end = nullptr;
        unsigned long long value = std::strtoull(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0') return false;
        if (value > std::numeric_limits<uint32_t>::max()) return false;
        out = static_cast<uint32_t>(value);
        return true;
    }

}  // namespace

int main(int argc, char* argv[]) {
    if (argc != 4) {
        PrintUsage(argc > 0 ? argv[0] : "host");
        return kExitUsage;
    }

    uint32_t repeat_count = 0;
    if (!ParseRepeatCount(argv[3], repeat_count)) {
        std::cerr << "Invalid repeat count '" << argv[3] << "': expected an integer in [0, "
            << std::numeric_limits<uint32_t>::max() << "]" << std::endl;
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    auto& log_manager = dlbridge::LogManager::Instance();
    auto logger = log_manager.GetLogger("dlbridge.cli");

    dlbridge::HostConfig config = dlbridge::DefaultHostConfig();
    if (const char* config_path = std::getenv("DLBRIDGE_CONFIG")) {
        try {
            config = dlbridge::LoadHostConfig(config_path);
        } catch (const dlbridge::BridgeException& e) {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            return kExitUsage;
        }
        if (config.has_logging) {
            std::string log_root = dlbridge::utils::PathToUtf8(dlbridge::utils::GetExecutableDir());
            if (!log_manager.Configure(config.logging, log_root)) {
                std::cerr << "Logging configuration rejected; using stderr fallback" << std::endl;
            }
            logger = log_manager.GetLogger("dlbridge.cli");
        }
        DLBRIDGE_LOG_DEBUG(logger, "Using configuration {}", config_path);
    }

    int exit_code = kExitFailure;
    {
        dlbridge::PluginHost host(config.loader);
        dlbridge::InvocationMarshaler marshaler(host, config.invocation);
        dlbridge::HostDriver driver(host, marshaler);

        dlbridge::DriverRequest request = dlbridge::HostDriver::MakeRequest(
            argv[1], argv[2], repeat_count, config.invocation);
        dlbridge::DriverOutcome outcome = driver.Run(request);

        if (!outcome.plugin_name.empty()) {
            std::cout << "Loaded plugin " << outcome.plugin_name << std::endl;
        }
        for (const auto& value : outcome.results) {
            std::cout << "Plugin returned: " << value << std::endl;
        }

        if (outcome.Ok()) {
            exit_code = kExitSuccess;
        } else {
            std::cerr << "Error [" << dlbridge::StageToString(outcome.stage) << "]: "
                << outcome.message << " (" << dlbridge::ResultToString(outcome.error) << ")" << std::endl;
            exit_code = kExitFailure;
        }
    }

    log_manager.Flush();
    return exit_code;
}

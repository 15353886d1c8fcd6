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
 * @file log_service.h
 * @brief [核心接口] 宿主日志服务 (ILogger, LogManager)。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * [设计思想]
 * 此头文件不包含 spdlog。spdlog 只出现在 `log_manager.cpp` 中 (Type Erasure)，
 * 使用者只看到 `ILogger` 和纯数据的 `LoggingOptions`。
 *
 * [编码契约]
 * 所有 std::string 参数 (日志内容、文件路径) 必须是 UTF-8。
 */

#pragma once

#ifndef DLBRIDGE_LOG_SERVICE_H_
#define DLBRIDGE_LOG_SERVICE_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "dlbridge/dlbridge_api.h"

namespace dlbridge {

    /**
     * @enum LogLevel
     * @brief 通用日志级别。实现层映射到 spdlog 的级别。
     */
    enum class LogLevel {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Fatal
    };

    /**
     * @struct LogSourceLocation
     * @brief 源代码位置。通常由 `DLBRIDGE_LOG_SOURCE_LOCATION()` 生成。
     */
    struct LogSourceLocation {
        const char* file_name;
        int line_number;
        const char* function_name;
    };

    /**
     * @class ILogger
     * @brief 日志记录器接口。
     * @details 通过 `LogManager::GetLogger()` 获取。实现必须保证 `Log` 线程安全。
     */
    class ILogger {
    public:
        virtual ~ILogger() = default;

        /** @brief 指定级别是否启用。宏在格式化之前调用它。 */
        virtual bool IsEnabled(LogLevel level) const noexcept = 0;

        /**
         * @brief 提交一条已格式化的日志。
         * @note 建议使用 `DLBRIDGE_LOG_...` 宏。
         */
        virtual void Log(const LogSourceLocation& loc, LogLevel level, const std::string& message) = 0;
    };

    /**
     * @struct SinkOptions
     * @brief 一个输出目标的配置。
     */
    struct SinkOptions {
        std::string name;
        /** @brief "stderr_color_sink", "stdout_color_sink", "rotating_file_sink", "daily_file_sink" */
        std::string type = "stderr_color_sink";
        std::string base_name;             //!< 文件类 Sink 的相对路径
        std::size_t max_size = 1024 * 1024 * 5;
        std::size_t max_files = 3;
        LogLevel level = LogLevel::Info;
    };

    /**
     * @struct RuleOptions
     * @brief 路由规则：名称以 `matcher` 开头的 Logger 输出到 `sinks`。
     */
    struct RuleOptions {
        std::string matcher;
        std::vector<std::string> sinks;
    };

    /**
     * @struct LoggingOptions
     * @brief 日志系统的完整配置 (由 `host_config.cpp` 从 JSON 解析)。
     */
    struct LoggingOptions {
        std::string format_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%L] [%n] %v";
        LogLevel flush_level = LogLevel::Error;
        std::vector<SinkOptions> sinks;
        std::vector<std::string> default_sinks;
        std::vector<RuleOptions> rules;
    };

    /**
     * @brief 解析级别字符串 ("trace" ... "fatal"，大小写不敏感)。
     * @return 成功返回 true；未知字符串返回 false 且不修改 out_level。
     */
    DLBRIDGE_API bool ParseLogLevel(const std::string& text, LogLevel& out_level);

    /** @brief LogLevel -> 小写名称。 */
    DLBRIDGE_API const char* LogLevelToString(LogLevel level);

    /**
     * @class LogManager
     * @brief [核心服务] 日志系统管理器 (单例)。
     *
     * @section Maintainer 维护者指南
     * - **Fallback**: `Configure` 成功之前 (或失败之后)，`GetLogger` 返回输出到
     * stderr 的备用 Logger，永远不会返回空指针。
     * - **并发**: Logger 缓存由读写锁保护，命中缓存只需读锁。
     * - **动态调级**: `SetLevel` 立即作用于已创建的 Logger，并记录下来，
     * 之后创建的同前缀 Logger 也会应用。
     */
    class DLBRIDGE_API LogManager {
    public:
        static LogManager& Instance();

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        /**
         * @brief 应用配置。
         * @param options 日志配置。
         * @param log_root_directory 文件类 Sink 的根目录 (UTF-8)。
         * @return true 成功；false 配置不可用 (继续使用 Fallback)。
         * @details 可重复调用：每次调用都会替换所有 Sink 并清空 Logger 缓存。
         */
        bool Configure(const LoggingOptions& options, const std::string& log_root_directory);

        /**
         * @brief 获取或创建指定名称的 Logger。
         * @param name 分层命名，如 "dlbridge.loader"。
         */
        [[nodiscard]] std::shared_ptr<ILogger> GetLogger(const std::string& name);

        /**
         * @brief 动态设置日志级别。
         * @param name_prefix Logger 名称前缀；空字符串表示全部。
         */
        void SetLevel(const std::string& name_prefix, LogLevel level);

        /** @brief 当前生效的 SetLevel 覆写条数 (每个前缀至多一条)。 */
        [[nodiscard]] std::size_t LevelOverrideCount() const;

        /** @brief 刷新所有缓冲区。 */
        void Flush();

        /** @brief 回到未配置状态 (清空 Sink、缓存与覆写规则)。 */
        void Reset();

        [[nodiscard]] bool IsConfigured() const;

    private:
        LogManager();
        ~LogManager();

        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

}  // namespace dlbridge

#endif  // DLBRIDGE_LOG_SERVICE_H_

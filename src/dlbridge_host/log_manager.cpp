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
 * @file log_manager.cpp
 * @brief LogManager 的 spdlog 实现。
 * @details
 * 基于配置的前缀路由 (最长前缀优先)、读写锁保护的 Logger 缓存、动态调级。
 */

#include "dlbridge/log_service.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <list>
#include <map>
#include <mutex>
#include <shared_mutex>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "dlbridge/dlbridge_utils.h"

namespace dlbridge {

    namespace {

        spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:  return spdlog::level::info;
            case LogLevel::Warn:  return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Fatal: return spdlog::level::critical;
            }
            return spdlog::level::info;
        }

        bool StartsWith(const std::string& name, const std::string& prefix) {
            return prefix.empty() || name.rfind(prefix, 0) == 0;
        }

        constexpr const char* kFallbackPattern = "[%H:%M:%S] [%n] [%l] %v";

        /**
         * @class LoggerImpl
         * @brief [内部适配器] 将 ILogger 调用转发给 spdlog::logger。
         */
        class LoggerImpl : public ILogger {
        public:
            explicit LoggerImpl(std::shared_ptr<spdlog::logger> logger)
                : logger_(std::move(logger)) {
            }

            bool IsEnabled(LogLevel level) const noexcept override {
                return logger_->should_log(ToSpdlogLevel(level));
            }

            void Log(const LogSourceLocation& loc, LogLevel level, const std::string& message) override {
                spdlog::source_loc spdlog_loc{ loc.file_name, loc.line_number, loc.function_name };
                logger_->log(spdlog_loc, ToSpdlogLevel(level), message);
            }

            spdlog::logger& Underlying() { return *logger_; }

        private:
            std::shared_ptr<spdlog::logger> logger_;
        };

        struct LevelOverride {
            std::string prefix;
            spdlog::level::level_enum level;
        };

    }  // namespace

    bool ParseLogLevel(const std::string& text, LogLevel& out_level) {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace") { out_level = LogLevel::Trace; return true; }
        if (lower == "debug") { out_level = LogLevel::Debug; return true; }
        if (lower == "info") { out_level = LogLevel::Info; return true; }
        if (lower == "warn" || lower == "warning") { out_level = LogLevel::Warn; return true; }
        if (lower == "error") { out_level = LogLevel::Error; return true; }
        if (lower == "fatal" || lower == "critical") { out_level = LogLevel::Fatal; return true; }
        return false;
    }

    const char* LogLevelToString(LogLevel level) {
        switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        }
        return "info";
    }

    /**
     * @struct LogManager::Impl
     * @brief LogManager 的全部状态。`lock` 保护下面所有成员。
     */
    struct LogManager::Impl {
        mutable std::shared_mutex lock;
        bool configured = false;

        std::string format_pattern;
        spdlog::level::level_enum flush_level = spdlog::level::err;

        std::map<std::string, spdlog::sink_ptr> sinks;
        std::vector<std::string> default_sinks;
        std::vector<RuleOptions> rules;   // 按 matcher 长度降序

        std::list<LevelOverride> overrides;
        std::map<std::string, std::shared_ptr<LoggerImpl>> cache;

        spdlog::sink_ptr fallback_sink;

        // 必须持有写锁
        std::shared_ptr<LoggerImpl> CreateLogger_UNLOCKED(const std::string& name) {
            std::vector<spdlog::sink_ptr> selected;
            if (configured) {
                const std::vector<std::string>* sink_names = &default_sinks;
                for (const auto& rule : rules) {
                    if (StartsWith(name, rule.matcher)) {
                        sink_names = &rule.sinks;
                        break;
                    }
                }
                for (const auto& sink_name : *sink_names) {
                    auto it = sinks.find(sink_name);
                    if (it != sinks.end()) selected.push_back(it->second);
                }
            } else {
                selected.push_back(fallback_sink);
            }

            auto spd_logger = std::make_shared<spdlog::logger>(name, selected.begin(), selected.end());
            if (configured) {
                // 默认全开，由 Sink 级别过滤
                spd_logger->set_level(spdlog::level::trace);
                spd_logger->flush_on(flush_level);
            } else {
                spd_logger->set_level(spdlog::level::info);
                spd_logger->flush_on(spdlog::level::warn);
            }

            // 后设置的覆写规则优先
            for (const auto& ov : overrides) {
                if (StartsWith(name, ov.prefix)) spd_logger->set_level(ov.level);
            }

            auto wrapper = std::make_shared<LoggerImpl>(spd_logger);
            cache[name] = wrapper;
            return wrapper;
        }

        static spdlog::sink_ptr MakeSink(const SinkOptions& opt, const std::filesystem::path& root) {
            spdlog::sink_ptr sink;
            if (opt.type == "stderr_color_sink") {
                sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            } else if (opt.type == "stdout_color_sink") {
                sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            } else if (opt.type == "rotating_file_sink" || opt.type == "daily_file_sink") {
                std::filesystem::path full_path = root / utils::Utf8ToPath(opt.base_name);
                if (full_path.has_parent_path()) {
                    std::error_code ec;
                    std::filesystem::create_directories(full_path.parent_path(), ec);
                }
                if (opt.type == "rotating_file_sink") {
                    sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        full_path.string(), opt.max_size, opt.max_files);
                } else {
                    sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(full_path.string(), 0, 0);
                }
            } else {
                throw std::runtime_error("Unsupported sink type: " + opt.type);
            }
            sink->set_level(ToSpdlogLevel(opt.level));
            return sink;
        }
    };

    LogManager& LogManager::Instance() {
        static LogManager instance;
        return instance;
    }

    LogManager::LogManager() : impl_(std::make_unique<Impl>()) {
        impl_->fallback_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        impl_->fallback_sink->set_pattern(kFallbackPattern);
    }

    LogManager::~LogManager() {
        try {
            Flush();
        } catch (const std::exception& e) {
            std::cerr << "[dlbridge] Log flush at exit failed: " << e.what() << std::endl;
        }
    }

    bool LogManager::Configure(const LoggingOptions& options, const std::string& log_root_directory) {
        std::map<std::string, spdlog::sink_ptr> new_sinks;
        try {
            std::filesystem::path root = utils::Utf8ToPath(log_root_directory);
            for (const auto& sink_opt : options.sinks) {
                auto sink = Impl::MakeSink(sink_opt, root);
                sink->set_pattern(options.format_pattern);
                new_sinks[sink_opt.name] = sink;
            }
            auto check_names = [&new_sinks](const std::vector<std::string>& names) {
                for (const auto& n : names) {
                    if (!new_sinks.count(n)) throw std::runtime_error("Undefined sink: " + n);
                }
            };
            check_names(options.default_sinks);
            for (const auto& rule : options.rules) check_names(rule.sinks);
        } catch (const std::exception& e) {
            auto fb = GetLogger("dlbridge.log");
            fb->Log(LogSourceLocation{ __FILE__, __LINE__, __func__ }, LogLevel::Error,
                std::string("Logging configuration rejected: ") + e.what());
            return false;
        }

        std::unique_lock<std::shared_mutex> lock(impl_->lock);
        impl_->sinks = std::move(new_sinks);
        impl_->format_pattern = options.format_pattern;
        impl_->flush_level = ToSpdlogLevel(options.flush_level);
        impl_->default_sinks = options.default_sinks;
        impl_->rules.clear();
        for (const auto& rule : options.rules) {
            if (!rule.matcher.empty()) impl_->rules.push_back(rule);
        }
        std::sort(impl_->rules.begin(), impl_->rules.end(), [](const RuleOptions& a, const RuleOptions& b) {
            return a.matcher.length() > b.matcher.length();
            });
        impl_->cache.clear();
        impl_->configured = true;
        return true;
    }

    std::shared_ptr<ILogger> LogManager::GetLogger(const std::string& name) {
        {
            std::shared_lock<std::shared_mutex> read_lock(impl_->lock);
            auto it = impl_->cache.find(name);
            if (it != impl_->cache.end()) return it->second;
        }

        std::unique_lock<std::shared_mutex> write_lock(impl_->lock);
        auto it = impl_->cache.find(name);
        if (it != impl_->cache.end()) return it->second;
        return impl_->CreateLogger_UNLOCKED(name);
    }

    void LogManager::SetLevel(const std::string& name_prefix, LogLevel level) {
        auto spd_level = ToSpdlogLevel(level);
        std::unique_lock<std::shared_mutex> lock(impl_->lock);
        // 同一前缀只保留最新的一条，并移到末尾 (后设置的优先)
        impl_->overrides.remove_if([&name_prefix](const LevelOverride& ov) { return ov.prefix == name_prefix; });
        impl_->overrides.push_back({ name_prefix, spd_level });
        for (auto& [name, logger] : impl_->cache) {
            if (StartsWith(name, name_prefix)) logger->Underlying().set_level(spd_level);
        }
    }

    std::size_t LogManager::LevelOverrideCount() const {
        std::shared_lock<std::shared_mutex> lock(impl_->lock);
        return impl_->overrides.size();
    }

    void LogManager::Flush() {
        std::shared_lock<std::shared_mutex> lock(impl_->lock);
        for (auto& [name, logger] : impl_->cache) {
            logger->Underlying().flush();
        }
    }

    void LogManager::Reset() {
        std::unique_lock<std::shared_mutex> lock(impl_->lock);
        for (auto& [name, logger] : impl_->cache) {
            logger->Underlying().flush();
        }
        impl_->cache.clear();
        impl_->sinks.clear();
        impl_->default_sinks.clear();
        impl_->rules.clear();
        impl_->overrides.clear();
        impl_->configured = false;
    }

    bool LogManager::IsConfigured() const {
        std::shared_lock<std::shared_mutex> lock(impl_->lock);
        return impl_->configured;
    }

}  // namespace dlbridge

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
 * @file log_macros.h
 * @brief 便捷日志宏 (DLBRIDGE_LOG_...)。
 * @author Yue Liu
 *
 * @details
 * [设计意图]
 * 1. **自动上下文**: `__FILE__` / `__LINE__` / 函数名自动填充。
 * 2. **零开销检查**: 级别未启用时，`fmt::format` 不会执行。
 *
 * [依赖说明]
 * 引入 `<spdlog/fmt/fmt.h>`，使用者需要链接 spdlog (dlbridge_host 会传递此依赖)。
 */

#pragma once

#ifndef DLBRIDGE_LOG_MACROS_H_
#define DLBRIDGE_LOG_MACROS_H_

#include <spdlog/fmt/fmt.h>
#include "dlbridge/log_service.h"

#if defined(_MSC_VER)
#define DLBRIDGE_CURRENT_FUNCTION __FUNCTION__
#elif defined(__GNUC__) || defined(__clang__)
#define DLBRIDGE_CURRENT_FUNCTION __PRETTY_FUNCTION__
#else
#define DLBRIDGE_CURRENT_FUNCTION __func__
#endif

#define DLBRIDGE_LOG_SOURCE_LOCATION() \
    dlbridge::LogSourceLocation{__FILE__, __LINE__, DLBRIDGE_CURRENT_FUNCTION}

#define DLBRIDGE_LOG_IMPL(logger_ptr, level, ...) \
    do { \
        if ((logger_ptr) && (logger_ptr)->IsEnabled(level)) { \
            std::string dlbridge_formatted_msg_ = fmt::format(__VA_ARGS__); \
            (logger_ptr)->Log(DLBRIDGE_LOG_SOURCE_LOCATION(), level, dlbridge_formatted_msg_); \
        } \
    } while (0)

/**
 * @name 日志记录宏
 * @param logger_ptr `std::shared_ptr<ILogger>`。
 * @param ... 格式化字符串及参数 (fmt 语法)。
 *
 * @example
 * auto logger = dlbridge::LogManager::Instance().GetLogger("dlbridge.loader");
 * DLBRIDGE_LOG_INFO(logger, "Loaded plugin '{}' from {}", name, path);
 */
///@{
#define DLBRIDGE_LOG_TRACE(logger_ptr, ...) DLBRIDGE_LOG_IMPL(logger_ptr, dlbridge::LogLevel::Trace, __VA_ARGS__)
#define DLBRIDGE_LOG_DEBUG(logger_ptr, ...) DLBRIDGE_LOG_IMPL(logger_ptr, dlbridge::LogLevel::Debug, __VA_ARGS__)
#define DLBRIDGE_LOG_INFO(logger_ptr, ...)  DLBRIDGE_LOG_IMPL(logger_ptr, dlbridge::LogLevel::Info,  __VA_ARGS__)
#define DLBRIDGE_LOG_WARN(logger_ptr, ...)  DLBRIDGE_LOG_IMPL(logger_ptr, dlbridge::LogLevel::Warn,  __VA_ARGS__)
#define DLBRIDGE_LOG_ERROR(logger_ptr, ...) DLBRIDGE_LOG_IMPL(logger_ptr, dlbridge::LogLevel::Error, __VA_ARGS__)
#define DLBRIDGE_LOG_FATAL(logger_ptr, ...) DLBRIDGE_LOG_IMPL(logger_ptr, dlbridge::LogLevel::Fatal, __VA_ARGS__)
///@}

#endif  // DLBRIDGE_LOG_MACROS_H_

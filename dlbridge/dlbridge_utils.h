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
 * @file dlbridge_utils.h
 * @brief [通用工具] 宿主使用的跨平台辅助函数。
 * @details
 * 实现分别位于 `platform_posix.cpp` 和 `platform_win.cpp`。
 */

#pragma once

#ifndef DLBRIDGE_UTILS_H_
#define DLBRIDGE_UTILS_H_

#include <filesystem>
#include <string>
#include "dlbridge/dlbridge_api.h"

namespace dlbridge {
    namespace utils {

        /**
         * @brief [跨平台] 将 UTF-8 字符串转换为 filesystem::path。
         * @details
         * - **Windows**: 执行 UTF-8 -> UTF-16 (WideChar) 转换。
         * - **POSIX**: 直接透传。
         */
        DLBRIDGE_API std::filesystem::path Utf8ToPath(const std::string& utf8_str);

        /**
         * @brief [跨平台] 将 filesystem::path 转换为 UTF-8 字符串。
         */
        DLBRIDGE_API std::string PathToUtf8(const std::filesystem::path& path);

        /**
         * @brief [跨平台] 获取当前可执行文件的绝对路径。
         * @details
         * - **Windows**: GetModuleFileNameW。
         * - **Linux**: 读取 /proc/self/exe。
         * - **macOS**: _NSGetExecutablePath。
         * @return 失败时返回空 path。
         */
        DLBRIDGE_API std::filesystem::path GetExecutablePath();

        /** @brief 等同于 GetExecutablePath().parent_path()。 */
        inline std::filesystem::path GetExecutableDir() {
            return GetExecutablePath().parent_path();
        }

        /**
         * @brief 当前平台的动态库后缀名。
         * @return Windows: ".dll", Linux: ".so", macOS: ".dylib"
         * @note 加载器从不自动追加后缀，此函数仅供工具和测试拼接路径。
         */
        DLBRIDGE_API const char* GetSharedLibraryExtension();

        /**
         * @brief 最近一次系统错误的描述 (GetLastError / errno)，UTF-8。
         */
        DLBRIDGE_API std::string GetLastSystemError();

    }  // namespace utils
}  // namespace dlbridge

#endif  // DLBRIDGE_UTILS_H_

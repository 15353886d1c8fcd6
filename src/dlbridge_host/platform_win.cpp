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
 * @file platform_win.cpp
 * @brief dlbridge::PluginHost 与 dlbridge::utils 的 Windows 平台实现。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * [受众：框架维护者]
 *
 * [设计思想：平台抽象层 (PAL)]
 * 此文件封装了所有 Win32 API 调用 (`LoadLibraryW` / `GetProcAddress` / `FreeLibrary`)。
 * 它 *只* 在 Windows 平台 (检测到 `_WIN32`) 时才被编译。
 */

 // 仅在 Windows 平台上编译此文件
#ifdef _WIN32

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

#include "plugin_host_pimpl.h"

#include <string>
#include <vector>

#include "dlbridge/dlbridge_utils.h"

namespace dlbridge {
    namespace utils {

        namespace {
            std::string WideToUtf8(const std::wstring& wstr) {
                if (wstr.empty()) return "";
                int size_needed = ::WideCharToMultiByte(CP_UTF8, 0, wstr.data(), (int)wstr.size(), NULL, 0, NULL, NULL);
                if (size_needed <= 0) return "";
                std::string str(size_needed, 0);
                ::WideCharToMultiByte(CP_UTF8, 0, wstr.data(), (int)wstr.size(), &str[0], size_needed, NULL, NULL);
                return str;
            }
        }  // namespace

        std::filesystem::path Utf8ToPath(const std::string& utf8_path) {
            if (utf8_path.empty()) return std::filesystem::path();
            int size_needed = ::MultiByteToWideChar(CP_UTF8, 0, &utf8_path[0], (int)utf8_path.size(), NULL, 0);
            if (size_needed <= 0) return std::filesystem::path();
            std::wstring wstr(size_needed, 0);
            ::MultiByteToWideChar(CP_UTF8, 0, &utf8_path[0], (int)utf8_path.size(), &wstr[0], size_needed);
            return std::filesystem::path(wstr);
        }

        std::string PathToUtf8(const std::filesystem::path& path) {
            return WideToUtf8(path.wstring());
        }

        std::filesystem::path GetExecutablePath() {
            std::vector<wchar_t> buffer(MAX_PATH);
            while (true) {
                DWORD length = ::GetModuleFileNameW(NULL, buffer.data(), static_cast<DWORD>(buffer.size()));
                if (length == 0) {
                    return std::filesystem::path();
                }
                if (length < buffer.size()) {
                    return std::filesystem::path(buffer.data());
                }
                // 可能被截断，扩容重试
                buffer.resize(buffer.size() * 2);
            }
        }

        const char* GetSharedLibraryExtension() {
            return ".dll";
        }

        std::string GetLastSystemError() {
            DWORD error_id = ::GetLastError();
            if (error_id == 0) return "No error";

            LPWSTR buffer = nullptr;
            size_t size = ::FormatMessageW(
                FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                NULL, error_id, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                (LPWSTR)&buffer, 0, NULL);
            if (size == 0) return "Unknown error (Code: " + std::to_string(error_id) + ")";

            std::wstring w_msg(buffer, size);
            ::LocalFree(buffer);

            // 移除末尾的换行符
            while (!w_msg.empty() && (w_msg.back() == L'\r' || w_msg.back() == L'\n')) {
                w_msg.pop_back();
            }
            return WideToUtf8(w_msg);
        }

    }  // namespace utils

    // --- 平台抽象层实现 ---

    PluginHost::LibHandle PluginHost::PlatformLoadLibrary(const std::filesystem::path& path) {
        // `path.c_str()` 在 Windows 上直接提供 `const wchar_t*`
        return ::LoadLibraryW(path.c_str());
    }

    void* PluginHost::PlatformGetFunction(LibHandle handle, const char* func_name) {
        return reinterpret_cast<void*>(::GetProcAddress(static_cast<HMODULE>(handle), func_name));
    }

    void PluginHost::PlatformUnloadLibrary(LibHandle handle) {
        if (handle) {
            ::FreeLibrary(static_cast<HMODULE>(handle));
        }
    }

    std::string PluginHost::PlatformLastLoaderError() {
        return utils::GetLastSystemError();
    }

}  // namespace dlbridge

#endif  // _WIN32

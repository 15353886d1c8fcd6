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
 * @file platform_posix.cpp
 * @brief dlbridge::PluginHost 与 dlbridge::utils 的 POSIX (Linux/macOS) 平台实现。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * [受众：框架维护者]
 *
 * [设计思想：平台抽象层 (PAL)]
 * 此文件封装了所有 POSIX 特定的 API 调用 (`dlfcn.h`)。
 * 它 *只* 在非 Windows 平台上编译。`plugin_host.cpp` 通过 `Platform...`
 * 函数完成打开/解析/关闭，而无需知道底层的 `dlopen` 或 `dlsym`。
 */

 // 仅在非 Windows 平台上编译此文件
#if !defined(_WIN32)

#include "plugin_host_pimpl.h"

#include <dlfcn.h>
#include <unistd.h>
#include <cerrno>
#include <climits>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

#include "dlbridge/dlbridge_utils.h"

namespace dlbridge {
    namespace utils {

        std::filesystem::path Utf8ToPath(const std::string& utf8_path) {
            return std::filesystem::path(utf8_path);
        }

        std::string PathToUtf8(const std::filesystem::path& path) {
            return path.string();
        }

        std::filesystem::path GetExecutablePath() {
            char buffer[PATH_MAX];
#ifdef __linux__
            // Linux: 读取 /proc/self/exe 符号链接
            ssize_t len = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
            if (len != -1) {
                buffer[len] = '\0';
                return std::filesystem::path(buffer);
            }
#elif defined(__APPLE__)
            // _NSGetExecutablePath 可能返回包含 .. 的路径
            uint32_t size = sizeof(buffer);
            std::vector<char> dynamic_buf;
            const char* raw = buffer;
            if (_NSGetExecutablePath(buffer, &size) != 0) {
                dynamic_buf.resize(size);
                if (_NSGetExecutablePath(dynamic_buf.data(), &size) != 0) {
                    return std::filesystem::path();
                }
                raw = dynamic_buf.data();
            }
            std::error_code ec;
            auto canonical = std::filesystem::canonical(raw, ec);
            return ec ? std::filesystem::path(raw) : canonical;
#endif
            return std::filesystem::path();
        }

        const char* GetSharedLibraryExtension() {
#ifdef __APPLE__
            return ".dylib";
#else
            return ".so";
#endif
        }

        std::string GetLastSystemError() {
            return std::system_category().message(errno);
        }

    }  // namespace utils

    // --- 平台抽象层实现 ---

    /**
     * @brief [平台实现-POSIX] 加载一个 .so/.dylib。
     * @details
     * RTLD_NOW: 立即解析所有符号 (缺失依赖时在这里失败，而不是在调用时)。
     * RTLD_LOCAL: 插件符号不暴露给其他模块。
     */
    PluginHost::LibHandle PluginHost::PlatformLoadLibrary(const std::filesystem::path& path) {
        // 在调用 dlopen 之前清除旧的 dlerror 状态
        (void)::dlerror();
        return ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    }

    void* PluginHost::PlatformGetFunction(LibHandle handle, const char* func_name) {
        (void)::dlerror();
        return ::dlsym(handle, func_name);
    }

    void PluginHost::PlatformUnloadLibrary(LibHandle handle) {
        if (handle) {
            ::dlclose(handle);
        }
    }

    std::string PluginHost::PlatformLastLoaderError() {
        const char* err = ::dlerror();
        return err ? std::string(err) : std::string("unknown dynamic loader error");
    }

}  // namespace dlbridge

#endif  // !defined(_WIN32)

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
 * @file plugin_host.h
 * @brief [核心类] 动态加载器 PluginHost 与插件句柄 PluginHandle。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * **文件作用：**
 * `PluginHost` 负责插件模块的整个生命周期：打开 -> 解析入口 -> 校验描述符 -> 关闭。
 *
 * **设计模式：**
 * 1. **Pimpl 惯用法**: 句柄表、模块记录都藏在 `plugin_host_pimpl.h` 中。
 * 2. **平台抽象层 (PAL)**: `Platform...` 私有函数在 `platform_posix.cpp` /
 * `platform_win.cpp` 中实现，本文件和 `plugin_host.cpp` 不包含任何系统头文件。
 * 3. **双风格 API**: `Load` / `Close` 失败时抛出 `BridgeException`；
 * `TryLoad` / `TryClose` 是不抛异常的版本。
 *
 * **模块何时被卸载：**
 * 只有显式 `Close` / `Unload` / `UnloadAll` (析构时也会调用) 才会卸载。
 * 只要还有调用在执行、或还有未释放的插件缓冲区，模块就保持映射状态。
 */

#pragma once

#ifndef DLBRIDGE_PLUGIN_HOST_H_
#define DLBRIDGE_PLUGIN_HOST_H_

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "dlbridge/bridge_errors.h"
#include "dlbridge/dlbridge_api.h"

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4251)
#endif

namespace dlbridge {

    class OwnershipLedger;
    class PluginHost;
    class InvocationMarshaler;

    namespace detail {
        struct ModuleRecord;
    }

    /**
     * @enum ClosePolicy
     * @brief 关闭一个仍然繁忙的模块时的策略。
     */
    enum class ClosePolicy {
        kBlock,   //!< 等待所有调用结束、所有缓冲区释放 (可选超时)
        kReject   //!< 立即返回 kErrorBusy
    };

    /**
     * @struct LoaderOptions
     * @brief PluginHost 的配置 (来自 HostConfig 的 "loader" 节)。
     */
    struct LoaderOptions {
        ClosePolicy close_policy = ClosePolicy::kBlock;
        /** @brief kBlock 的最长等待时间 (毫秒)。0 = 无限等待。 */
        uint32_t close_timeout_ms = 0;
    };

    /**
     * @class PluginHandle
     * @brief 已加载插件的句柄 (值类型，可自由拷贝)。
     * @details
     * 句柄共享一个宿主私有的模块记录。模块关闭后句柄变为 *过期* 状态：
     * 查询函数仍然可用，但任何调用都会以 `kErrorHandleClosed` 拒绝。
     */
    class DLBRIDGE_API PluginHandle {
    public:
        PluginHandle() = default;

        /** @brief 描述符中声明的插件名。空句柄返回空字符串。 */
        const std::string& Name() const;

        /** @brief 规范化后的模块路径 (UTF-8)。 */
        const std::string& Path() const;

        /** @brief 宿主分配的模块 ID (从 1 开始，进程内不重复)。 */
        uint64_t Id() const;

        /** @brief 插件是否声明了 DLB_PLUGIN_FLAG_REENTRANT。 */
        bool IsReentrant() const;

        /** @brief 模块是否仍然加载且没有正在关闭。 */
        bool IsOpen() const;

        explicit operator bool() const noexcept { return record_ != nullptr; }

        bool operator==(const PluginHandle& other) const noexcept { return record_ == other.record_; }
        bool operator!=(const PluginHandle& other) const noexcept { return record_ != other.record_; }

    private:
        friend class PluginHost;
        friend class InvocationMarshaler;

        explicit PluginHandle(std::shared_ptr<detail::ModuleRecord> record)
            : record_(std::move(record)) {
        }

        std::shared_ptr<detail::ModuleRecord> record_;
    };

    /**
     * @class PluginHost
     * @brief [宿主核心] 动态加载器与句柄表。
     *
     * @section Concurrency 并发模型
     * - 句柄表由 `std::shared_mutex` 保护：加载/卸载持写锁，
     * 调用准入与查询持读锁。
     * - 每个模块记录有自己的 mutex + condition_variable，保护
     * `in_flight` / `live_buffers` 计数和 `closing` 标志。
     * - `Close` 在 *不* 持有表锁的情况下等待计数归零，然后才取写锁摘除并 dlclose。
     */
    class DLBRIDGE_API PluginHost {
    public:
        using LibHandle = void*;  // 动态库句柄 (Windows HMODULE / Linux void*)

        explicit PluginHost(LoaderOptions options = {});

        /** @brief 析构时调用 `UnloadAll()`。 */
        ~PluginHost();

        PluginHost(const PluginHost&) = delete;
        PluginHost& operator=(const PluginHost&) = delete;
        PluginHost(PluginHost&&) = delete;
        PluginHost& operator=(PluginHost&&) = delete;

        /**
         * @brief 加载一个插件模块。
         * @param[in] path 模块路径 (UTF-8)。不会自动追加平台后缀。
         * @return 有效的句柄。同一路径重复加载返回已有句柄。
         * @throws BridgeException
         * - kErrorLoadNotFound / kErrorLoadNotALibrary (Stage::kOpen)
         * - kErrorSymbolMissing (Stage::kResolve)
         * - kErrorVersionMismatch (Stage::kValidate)
         * - kErrorBusy (同一路径的模块正在关闭)
         */
        [[nodiscard]] PluginHandle Load(const std::string& path);

        /**
         * @brief `Load` 的不抛异常版本。
         * @param[out] out_message 可选，失败时写入详细原因。
         */
        [[nodiscard]] std::pair<PluginHandle, BridgeError> TryLoad(
            const std::string& path, std::string* out_message = nullptr) noexcept;

        /**
         * @brief 按配置的 ClosePolicy 关闭模块。
         * @throws BridgeException kErrorBusy / kErrorHandleClosed (Stage::kClose)
         */
        void Close(const PluginHandle& handle);

        /** @brief 以指定策略关闭模块。 */
        void Close(const PluginHandle& handle, ClosePolicy policy);

        /** @brief `Close` 的不抛异常版本。 */
        [[nodiscard]] BridgeError TryClose(const PluginHandle& handle) noexcept;

        /**
         * @brief 按路径卸载。
         * @throws BridgeException kErrorHandleClosed 如果该路径未加载。
         */
        void Unload(const std::string& path);

        /**
         * @brief 按 LIFO 顺序卸载所有空闲模块。
         * @details 繁忙的模块不会被卸载，而是保持映射 (泄漏) 并记录警告。
         */
        void UnloadAll();

        /** @brief 按路径查找。未加载时返回空句柄。 */
        [[nodiscard]] PluginHandle Find(const std::string& path) const;

        [[nodiscard]] bool IsLoaded(const std::string& path) const;

        /** @brief 所有已加载模块的规范化路径 (按加载顺序)。 */
        [[nodiscard]] std::vector<std::string> GetLoadedPluginFiles() const;

        /** @brief 所有跨边界缓冲区共用的所有权账本。 */
        [[nodiscard]] std::shared_ptr<OwnershipLedger> Ledger() const;

        [[nodiscard]] const LoaderOptions& Options() const;

    private:
        friend class InvocationMarshaler;

        struct Impl;
        std::unique_ptr<Impl> pimpl_;

        /**
         * @brief [调用准入] 校验句柄仍在表中且未在关闭，然后 in_flight + 1。
         * @throws BridgeException kErrorHandleClosed (Stage::kInvoke)
         */
        std::shared_ptr<detail::ModuleRecord> AdmitCall(const PluginHandle& handle) const;

        /** @brief 打开、解析、校验。失败时模块已关闭，不登记任何东西。 */
        std::shared_ptr<detail::ModuleRecord> OpenAndValidate(const std::filesystem::path& path);

        void CloseRecord(const std::shared_ptr<detail::ModuleRecord>& record, ClosePolicy policy);

        // --- 平台抽象层 (platform_*.cpp) ---
        [[nodiscard]] static LibHandle PlatformLoadLibrary(const std::filesystem::path& path);
        [[nodiscard]] static void* PlatformGetFunction(LibHandle handle, const char* func_name);
        static void PlatformUnloadLibrary(LibHandle handle);
        /** @brief 最近一次加载器错误 (dlerror / GetLastError)，UTF-8。 */
        [[nodiscard]] static std::string PlatformLastLoaderError();
    };

}  // namespace dlbridge

#ifdef _MSC_VER
#pragma warning(pop)
#endif

#endif  // DLBRIDGE_PLUGIN_HOST_H_

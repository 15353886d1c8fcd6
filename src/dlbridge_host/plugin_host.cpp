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
 * @file plugin_host.cpp
 * @brief dlbridge::PluginHost 的核心实现 (与平台无关的部分)。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * [受众：框架维护者]
 *
 * 加载流程：存在性检查 -> PlatformLoadLibrary -> PlatformGetFunction(入口)
 * -> 调用入口填写描述符 -> 校验 -> 登记。
 * 任何一步失败都会关闭模块，不在句柄表中留下任何东西。
 */

#include "plugin_host_pimpl.h"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "dlbridge/dlbridge_utils.h"
#include "dlbridge/log_macros.h"

namespace dlbridge {

    namespace {

        std::shared_ptr<ILogger> LoaderLogger() {
            return LogManager::Instance().GetLogger("dlbridge.loader");
        }

        /**
         * @brief 用于句柄表键的规范化路径。
         * @details 文件不存在时 weakly_canonical 仍可用；失败时退回原路径。
         */
        std::filesystem::path CanonicalPath(const std::filesystem::path& path) {
            std::error_code ec;
            std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
            if (ec) return path;
            return canonical;
        }

        /**
         * @brief 校验入口函数填写的描述符。
         * @return 空字符串表示通过；否则为不兼容的原因。
         */
        std::string CheckDescriptor(dlb_status_v1 status, const dlb_plugin_descriptor_v1& desc) {
            if (status != DLB_STATUS_OK) {
                return fmt::format("entry point refused the host ABI (status {})", status);
            }
            if (desc.abi_version != DLB_ABI_VERSION_V1) {
                return fmt::format("plugin ABI version {} != host ABI version {}",
                    desc.abi_version, DLB_ABI_VERSION_V1);
            }
            if (desc.struct_size != sizeof(dlb_plugin_descriptor_v1)) {
                return fmt::format("descriptor size {} != expected {}",
                    desc.struct_size, sizeof(dlb_plugin_descriptor_v1));
            }
            if (!desc.name.data || desc.name.size == 0) {
                return "descriptor has no name";
            }
            if (!desc.invoke || !desc.release) {
                return "descriptor capability table is incomplete";
            }
            if (desc.param_count != 2 || !desc.param_types ||
                desc.param_types[0] != DLB_TYPE_STRING || desc.param_types[1] != DLB_TYPE_UINT32 ||
                desc.return_type != DLB_TYPE_STRING) {
                return "declared signature is not (STRING, UINT32) -> STRING";
            }
            return std::string();
        }

    }  // namespace

    // --- PluginHandle ---

    const std::string& PluginHandle::Name() const {
        static const std::string kEmpty;
        return record_ ? record_->name : kEmpty;
    }

    const std::string& PluginHandle::Path() const {
        static const std::string kEmpty;
        return record_ ? record_->path : kEmpty;
    }

    uint64_t PluginHandle::Id() const {
        return record_ ? record_->id : 0;
    }

    bool PluginHandle::IsReentrant() const {
        return record_ && record_->reentrant;
    }

    bool PluginHandle::IsOpen() const {
        if (!record_) return false;
        std::lock_guard<std::mutex> lock(record_->state_mutex);
        return !record_->closed && !record_->closing;
    }

    // --- PluginHost ---

    PluginHost::PluginHost(LoaderOptions options) : pimpl_(std::make_unique<Impl>()) {
        pimpl_->options = options;
        pimpl_->ledger = std::make_shared<OwnershipLedger>();
    }

    PluginHost::~PluginHost() {
        try {
            UnloadAll();
        } catch (const std::exception& e) {
            auto logger = LoaderLogger();
            DLBRIDGE_LOG_ERROR(logger, "UnloadAll during host teardown failed: {}", e.what());
        }
    }

    PluginHandle PluginHost::Load(const std::string& path) {
        auto logger = LoaderLogger();
        if (path.empty()) {
            throw BridgeException(BridgeError::kErrorInvalidArgument, Stage::kOpen, "empty plugin path");
        }

        std::filesystem::path fs_path = utils::Utf8ToPath(path);
        std::error_code ec;
        if (!std::filesystem::exists(fs_path, ec)) {
            DLBRIDGE_LOG_WARN(logger, "Plugin file not found: {}", path);
            throw BridgeException(BridgeError::kErrorLoadNotFound, Stage::kOpen, path);
        }

        std::filesystem::path canonical = CanonicalPath(fs_path);
        std::string key = utils::PathToUtf8(canonical);

        std::unique_lock<std::shared_mutex> lock(pimpl_->table_mutex);
        auto it = pimpl_->modules.find(key);
        if (it != pimpl_->modules.end()) {
            const auto& existing = it->second;
            std::lock_guard<std::mutex> state_lock(existing->state_mutex);
            if (existing->closing) {
                throw BridgeException(BridgeError::kErrorBusy, Stage::kOpen,
                    "plugin is being closed: " + key);
            }
            DLBRIDGE_LOG_DEBUG(logger, "Plugin '{}' already loaded from {}", existing->name, key);
            return PluginHandle(existing);
        }

        auto record = OpenAndValidate(canonical);
        record->id = pimpl_->next_module_id++;
        record->path = key;
        pimpl_->modules[key] = record;
        pimpl_->load_order.push_back(record);

        DLBRIDGE_LOG_INFO(logger, "Loaded plugin '{}' (id {}, {}) from {}", record->name, record->id,
            record->reentrant ? "reentrant" : "serialized", key);
        return PluginHandle(record);
    }

    std::shared_ptr<detail::ModuleRecord> PluginHost::OpenAndValidate(const std::filesystem::path& path) {
        auto logger = LoaderLogger();
        std::string path_str = utils::PathToUtf8(path);

        LibHandle lib = PlatformLoadLibrary(path);
        if (!lib) {
            std::string reason = PlatformLastLoaderError();
            DLBRIDGE_LOG_WARN(logger, "OS loader refused {}: {}", path_str, reason);
            throw BridgeException(BridgeError::kErrorLoadNotALibrary, Stage::kOpen,
                path_str + ": " + reason);
        }

        auto entry = reinterpret_cast<dlb_entry_fn_v1>(PlatformGetFunction(lib, DLB_ENTRY_SYMBOL_V1));
        if (!entry) {
            DLBRIDGE_LOG_WARN(logger, "Entry point '{}' not found in {}", DLB_ENTRY_SYMBOL_V1, path_str);
            PlatformUnloadLibrary(lib);
            throw BridgeException(BridgeError::kErrorSymbolMissing, Stage::kResolve,
                std::string(DLB_ENTRY_SYMBOL_V1) + " in " + path_str);
        }

        // 宿主先清零并预填版本信息，插件据此判断是否支持
        dlb_plugin_descriptor_v1 desc{};
        desc.struct_size = static_cast<uint32_t>(sizeof(dlb_plugin_descriptor_v1));
        desc.abi_version = DLB_ABI_VERSION_V1;
        dlb_status_v1 status = entry(&desc);

        std::string incompatibility = CheckDescriptor(status, desc);
        if (!incompatibility.empty()) {
            DLBRIDGE_LOG_WARN(logger, "Rejected {}: {}", path_str, incompatibility);
            PlatformUnloadLibrary(lib);
            throw BridgeException(BridgeError::kErrorVersionMismatch, Stage::kValidate,
                path_str + ": " + incompatibility);
        }

        auto record = std::make_shared<detail::ModuleRecord>();
        record->lib = lib;
        record->descriptor = desc;
        record->name.assign(desc.name.data, static_cast<std::size_t>(desc.name.size));
        record->reentrant = (desc.flags & DLB_PLUGIN_FLAG_REENTRANT) != 0;
        return record;
    }

    std::pair<PluginHandle, BridgeError> PluginHost::TryLoad(
        const std::string& path, std::string* out_message) noexcept {
        try {
            return { Load(path), BridgeError::kSuccess };
        } catch (const BridgeException& e) {
            if (out_message) *out_message = e.GetContext();
            return { PluginHandle(), e.GetError() };
        } catch (const std::exception& e) {
            if (out_message) *out_message = e.what();
            return { PluginHandle(), BridgeError::kErrorInternal };
        }
    }

    void PluginHost::Close(const PluginHandle& handle) {
        Close(handle, pimpl_->options.close_policy);
    }

    void PluginHost::Close(const PluginHandle& handle, ClosePolicy policy) {
        if (!handle.record_) {
            throw BridgeException(BridgeError::kErrorHandleClosed, Stage::kClose, "empty plugin handle");
        }
        CloseRecord(handle.record_, policy);
    }

    BridgeError PluginHost::TryClose(const PluginHandle& handle) noexcept {
        try {
            Close(handle);
            return BridgeError::kSuccess;
        } catch (const BridgeException& e) {
            return e.GetError();
        } catch (const std::exception& e) {
            auto logger = LoaderLogger();
            DLBRIDGE_LOG_ERROR(logger, "Unexpected failure closing '{}': {}", handle.Name(), e.what());
            return BridgeError::kErrorInternal;
        }
    }

    void PluginHost::CloseRecord(const std::shared_ptr<detail::ModuleRecord>& record, ClosePolicy policy) {
        auto logger = LoaderLogger();
        std::unique_lock<std::mutex> lifecycle_lock(record->lifecycle_mutex, std::defer_lock);
        if (policy == ClosePolicy::kReject) {
            // 另一个 Close 正在等待时不排队
            if (!lifecycle_lock.try_lock()) {
                throw BridgeException(BridgeError::kErrorBusy, Stage::kClose,
                    "plugin '" + record->name + "' is already being closed");
            }
        } else {
            lifecycle_lock.lock();
        }

        {
            std::shared_lock<std::shared_mutex> table_lock(pimpl_->table_mutex);
            auto it = pimpl_->modules.find(record->path);
            if (it == pimpl_->modules.end() || it->second != record) {
                throw BridgeException(BridgeError::kErrorHandleClosed, Stage::kClose,
                    "plugin '" + record->name + "' is not loaded");
            }
        }

        // 1. 等待空闲 (不持有表锁)
        {
            std::unique_lock<std::mutex> state_lock(record->state_mutex);
            if (!record->IsIdle_UNLOCKED()) {
                if (policy == ClosePolicy::kReject) {
                    throw BridgeException(BridgeError::kErrorBusy, Stage::kClose,
                        fmt::format("plugin '{}' has {} call(s) in flight and {} buffer(s) outstanding",
                            record->name, record->in_flight, record->live_buffers));
                }

                record->closing = true;
                DLBRIDGE_LOG_DEBUG(logger, "Close of '{}' waiting for {} call(s), {} buffer(s)",
                    record->name, record->in_flight, record->live_buffers);

                auto idle = [&record]() { return record->IsIdle_UNLOCKED(); };
                const uint32_t timeout_ms = pimpl_->options.close_timeout_ms;
                if (timeout_ms == 0) {
                    record->state_cv.wait(state_lock, idle);
                } else if (!record->state_cv.wait_for(state_lock, std::chrono::milliseconds(timeout_ms), idle)) {
                    record->closing = false;
                    throw BridgeException(BridgeError::kErrorBusy, Stage::kClose,
                        fmt::format("plugin '{}' still busy after {} ms", record->name, timeout_ms));
                }
            }
            record->closing = true;
        }

        // 2. 摘除并卸载
        LibHandle lib = nullptr;
        {
            std::unique_lock<std::shared_mutex> table_lock(pimpl_->table_mutex);
            pimpl_->modules.erase(record->path);
            auto& order = pimpl_->load_order;
            order.erase(std::remove(order.begin(), order.end(), record), order.end());

            std::lock_guard<std::mutex> state_lock(record->state_mutex);
            record->closed = true;
            lib = record->lib;
            record->lib = nullptr;
        }
        PlatformUnloadLibrary(lib);
        DLBRIDGE_LOG_INFO(logger, "Unloaded plugin '{}' (id {})", record->name, record->id);
    }

    void PluginHost::Unload(const std::string& path) {
        std::string key = utils::PathToUtf8(CanonicalPath(utils::Utf8ToPath(path)));
        std::shared_ptr<detail::ModuleRecord> record;
        {
            std::shared_lock<std::shared_mutex> lock(pimpl_->table_mutex);
            auto it = pimpl_->modules.find(key);
            if (it != pimpl_->modules.end()) record = it->second;
        }
        if (!record) {
            throw BridgeException(BridgeError::kErrorHandleClosed, Stage::kClose, "not loaded: " + path);
        }
        CloseRecord(record, pimpl_->options.close_policy);
    }

    void PluginHost::UnloadAll() {
        auto logger = LoaderLogger();
        std::vector<std::shared_ptr<detail::ModuleRecord>> order;
        {
            std::shared_lock<std::shared_mutex> lock(pimpl_->table_mutex);
            order = pimpl_->load_order;
        }

        // [设计] 按 LIFO (后进先出) 顺序卸载
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            const auto& record = *it;
            try {
                CloseRecord(record, ClosePolicy::kReject);
            } catch (const BridgeException& e) {
                if (e.GetError() != BridgeError::kErrorBusy) {
                    DLBRIDGE_LOG_DEBUG(logger, "Skipping '{}' during UnloadAll: {}", record->name, e.what());
                    continue;
                }
                // 繁忙的模块保持映射，从表中摘除后不再接受调用
                std::unique_lock<std::shared_mutex> table_lock(pimpl_->table_mutex);
                auto found = pimpl_->modules.find(record->path);
                if (found != pimpl_->modules.end() && found->second == record) {
                    pimpl_->modules.erase(found);
                }
                auto& lo = pimpl_->load_order;
                lo.erase(std::remove(lo.begin(), lo.end(), record), lo.end());
                pimpl_->leaked.push_back(record);
                {
                    std::lock_guard<std::mutex> state_lock(record->state_mutex);
                    record->closing = true;
                }
                DLBRIDGE_LOG_WARN(logger, "Plugin '{}' is busy; leaving it mapped: {}", record->name, e.GetContext());
            }
        }
    }

    PluginHandle PluginHost::Find(const std::string& path) const {
        std::string key = utils::PathToUtf8(CanonicalPath(utils::Utf8ToPath(path)));
        std::shared_lock<std::shared_mutex> lock(pimpl_->table_mutex);
        auto it = pimpl_->modules.find(key);
        if (it == pimpl_->modules.end()) return PluginHandle();
        return PluginHandle(it->second);
    }

    bool PluginHost::IsLoaded(const std::string& path) const {
        return static_cast<bool>(Find(path));
    }

    std::vector<std::string> PluginHost::GetLoadedPluginFiles() const {
        std::shared_lock<std::shared_mutex> lock(pimpl_->table_mutex);
        std::vector<std::string> files;
        files.reserve(pimpl_->load_order.size());
        for (const auto& record : pimpl_->load_order) {
            files.push_back(record->path);
        }
        return files;
    }

    std::shared_ptr<OwnershipLedger> PluginHost::Ledger() const {
        return pimpl_->ledger;
    }

    const LoaderOptions& PluginHost::Options() const {
        return pimpl_->options;
    }

    std::shared_ptr<detail::ModuleRecord> PluginHost::AdmitCall(const PluginHandle& handle) const {
        const auto& record = handle.record_;
        if (!record) {
            throw BridgeException(BridgeError::kErrorHandleClosed, Stage::kInvoke, "empty plugin handle");
        }

        std::shared_lock<std::shared_mutex> table_lock(pimpl_->table_mutex);
        auto it = pimpl_->modules.find(record->path);
        if (it == pimpl_->modules.end() || it->second != record) {
            throw BridgeException(BridgeError::kErrorHandleClosed, Stage::kInvoke,
                "plugin '" + record->name + "' is not loaded");
        }

        std::lock_guard<std::mutex> state_lock(record->state_mutex);
        if (record->closing || record->closed) {
            throw BridgeException(BridgeError::kErrorHandleClosed, Stage::kInvoke,
                "plugin '" + record->name + "' is closing");
        }
        ++record->in_flight;
        return record;
    }

}  // namespace dlbridge

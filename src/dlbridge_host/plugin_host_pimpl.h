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
 * @file plugin_host_pimpl.h
 * @brief [私有头文件] PluginHost 的内部数据结构：模块记录与句柄表。
 * @details
 * 这个文件 *不* 会被安装或暴露给插件开发者，只在 dlbridge_host 内部编译。
 * `invocation_marshaler.cpp` 也包含它，以便直接访问模块记录的计数器。
 */

#pragma once

#ifndef DLBRIDGE_SRC_PLUGIN_HOST_PIMPL_H_
#define DLBRIDGE_SRC_PLUGIN_HOST_PIMPL_H_

#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "dlbridge/dlbridge_abi.h"
#include "dlbridge/ownership_ledger.h"
#include "dlbridge/plugin_host.h"

namespace dlbridge {
    namespace detail {

        /**
         * @struct ModuleRecord
         * @brief 一个已加载模块的全部状态。由句柄表和所有 PluginHandle 共享。
         *
         * [锁]
         * - `state_mutex` 保护 in_flight / live_buffers / closing / closed / lib。
         * - `call_mutex` 只用于串行化非可重入插件的调用。
         * - `lifecycle_mutex` 串行化同一模块上的多个 Close。
         * 加锁顺序：表锁 -> state_mutex。
         */
        struct ModuleRecord {
            uint64_t id = 0;
            std::string path;                       //!< 规范化路径 (UTF-8)，句柄表的键
            std::string name;                       //!< 描述符名称的宿主侧拷贝
            bool reentrant = false;
            PluginHost::LibHandle lib = nullptr;
            dlb_plugin_descriptor_v1 descriptor{};  //!< 描述符的宿主侧拷贝

            std::mutex call_mutex;
            std::mutex lifecycle_mutex;

            std::mutex state_mutex;
            std::condition_variable state_cv;
            uint64_t in_flight = 0;
            uint64_t live_buffers = 0;
            bool closing = false;
            bool closed = false;

            /** @brief 必须持有 state_mutex。 */
            bool IsIdle_UNLOCKED() const { return in_flight == 0 && live_buffers == 0; }

            void OnCallFinished() {
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    --in_flight;
                }
                state_cv.notify_all();
            }

            /** @brief 调用方必须处于调用准入期间 (in_flight > 0)。 */
            void OnBufferRegistered() {
                std::lock_guard<std::mutex> lock(state_mutex);
                ++live_buffers;
            }

            void OnBufferReleased() {
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    --live_buffers;
                }
                state_cv.notify_all();
            }
        };

        /**
         * @class CallGuard
         * @brief [RAII] 调用准入凭证。析构时 in_flight - 1 并唤醒等待中的 Close。
         */
        class CallGuard {
        public:
            explicit CallGuard(std::shared_ptr<ModuleRecord> record) : record_(std::move(record)) {}
            ~CallGuard() {
                if (record_) record_->OnCallFinished();
            }

            CallGuard(const CallGuard&) = delete;
            CallGuard& operator=(const CallGuard&) = delete;

            CallGuard(CallGuard&& other) noexcept : record_(std::move(other.record_)) {}
            CallGuard& operator=(CallGuard&&) = delete;

            const std::shared_ptr<ModuleRecord>& Record() const { return record_; }

        private:
            std::shared_ptr<ModuleRecord> record_;
        };

    }  // namespace detail

    /**
     * @struct PluginHost::Impl
     * @brief PluginHost 的 "肚子"。
     */
    struct PluginHost::Impl {
        LoaderOptions options;
        std::shared_ptr<OwnershipLedger> ledger;

        /** @brief 保护 modules / load_order。 */
        mutable std::shared_mutex table_mutex;
        std::map<std::string, std::shared_ptr<detail::ModuleRecord>> modules;
        std::vector<std::shared_ptr<detail::ModuleRecord>> load_order;  // LIFO 卸载

        /** @brief 被 UnloadAll 放弃 (保持映射) 的繁忙模块。 */
        std::vector<std::shared_ptr<detail::ModuleRecord>> leaked;

        uint64_t next_module_id = 1;
    };

}  // namespace dlbridge

#endif  // DLBRIDGE_SRC_PLUGIN_HOST_PIMPL_H_

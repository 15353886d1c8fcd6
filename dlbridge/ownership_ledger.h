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
 * @file ownership_ledger.h
 * @brief [核心组件] 跨边界缓冲区的所有权账本 OwnershipLedger。
 * @author Yue Liu
 * @date 2025-12-03
 *
 * @details
 * =============================================================================
 * [受众：使用者]
 * =============================================================================
 *
 * 生命周期：已分配 (插件侧) -> 已解码 -> 已释放 (恰好一次) -> 无效。
 *
 * 每个需要释放的缓冲区在登记时获得一个单调递增的 generation，
 * 以及一个绑定到分配方的释放器 (插件的 `release` 入口，或宿主的 `delete[]`)。
 * `Release` 移除登记并 *恰好* 调用一次对应的释放器。
 *
 * 以下情况属于所有权违规 (OwnershipViolation)：
 * - 释放一个不存活的 generation (重复释放、伪造或借用的代号)。
 * - 访问 (Decode) 一个已释放的 generation。
 *
 * =============================================================================
 * [受众：维护者]
 * =============================================================================
 *
 * [违规处理]
 * 账本把违规交给 ViolationHandler。默认处理器记录 critical 日志后 `std::abort()`。
 * 如果自定义处理器返回了，操作以 `BridgeException(kErrorOwnershipViolation)` 拒绝，
 * 并且不会触碰任何内存。
 *
 * [为何不需要墓碑]
 * generation 单调递增且从不复用：小于 `next_generation_` 但不在表中的代号
 * 一定是已经释放过的。
 *
 * [锁]
 * 释放器和违规处理器都在锁外调用 (释放器会回调插件代码)。
 */

#pragma once

#ifndef DLBRIDGE_OWNERSHIP_LEDGER_H_
#define DLBRIDGE_OWNERSHIP_LEDGER_H_

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include "dlbridge/boundary_string.h"
#include "dlbridge/bridge_errors.h"
#include "dlbridge/dlbridge_api.h"

namespace dlbridge {

    /**
     * @struct OwnershipViolation
     * @brief 一次所有权违规的描述 (交给 ViolationHandler)。
     */
    struct OwnershipViolation {
        Stage stage;              //!< kDecode 或 kRelease
        uint64_t generation;
        AllocatorSide side;
        uint64_t module_id;
        std::string detail;
    };

    /**
     * @brief 违规处理器。返回即表示 "拒绝该操作并抛出异常"。
     */
    using ViolationHandler = std::function<void(const OwnershipViolation&)>;

    /**
     * @brief 释放器：用分配方自己的分配器释放 (data, size)。必须不抛异常。
     */
    using Deallocator = std::function<void(char*, uint64_t)>;

    /**
     * @class OwnershipLedger
     * @brief 所有跨边界缓冲区的登记簿 (线程安全)。
     */
    class DLBRIDGE_API OwnershipLedger {
    public:
        OwnershipLedger();

        /**
         * @brief 析构。
         * @details 仍存活的登记会被视为泄漏：记录警告并通过各自的释放器释放。
         */
        ~OwnershipLedger();

        OwnershipLedger(const OwnershipLedger&) = delete;
        OwnershipLedger& operator=(const OwnershipLedger&) = delete;

        /**
         * @brief 登记一个需要释放的缓冲区。
         * @param[in] data 缓冲区指针 (不能为空)。
         * @param[in] size 字节数。
         * @param[in] side 分配方。
         * @param[in] module_id 所属模块 (kHost 时为 0)。
         * @param[in] deallocator 分配方提供的释放器。
         * @return 带新 generation 的 BoundaryString。
         * @throws BridgeException (kErrorInvalidArgument) 如果 data 或 deallocator 为空。
         */
        BoundaryString Register(char* data, uint64_t size, AllocatorSide side,
            uint64_t module_id, Deallocator deallocator);

        /**
         * @brief 释放一个已登记的缓冲区 (恰好一次)。
         * @throws BridgeException (kErrorOwnershipViolation) 违规且处理器返回时。
         */
        void Release(const BoundaryString& str);

        /**
         * @brief 将缓冲区内容拷贝为宿主 std::string。
         * @details 借用视图 (generation 0) 直接拷贝；已登记的缓冲区先检查存活。
         * @throws BridgeException (kErrorOwnershipViolation) 访问已释放的缓冲区时。
         */
        std::string Decode(const BoundaryString& str) const;

        /** @brief generation 是否仍存活。 */
        bool IsLive(uint64_t generation) const;

        /** @brief 当前存活的登记数。 */
        std::size_t LiveCount() const;

        /**
         * @brief 安装违规处理器。
         * @param handler 为空时恢复默认处理器。
         */
        void SetViolationHandler(ViolationHandler handler);

        /**
         * @brief 默认处理器：记录 critical 日志、刷新日志后 `std::abort()`。
         */
        static void DefaultViolationHandler(const OwnershipViolation& violation);

    private:
        struct Entry {
            char* data;
            uint64_t size;
            AllocatorSide side;
            uint64_t module_id;
            Deallocator deallocator;
        };

        /** @brief 调用处理器；处理器返回时抛出异常。 */
        [[noreturn]] void ReportViolation(OwnershipViolation violation) const;

        mutable std::mutex mutex_;
        std::unordered_map<uint64_t, Entry> entries_;
        uint64_t next_generation_ = 1;
        ViolationHandler handler_;
    };

}  // namespace dlbridge

#endif  // DLBRIDGE_OWNERSHIP_LEDGER_H_

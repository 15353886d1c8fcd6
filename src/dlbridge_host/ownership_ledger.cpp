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
 * @file ownership_ledger.cpp
 * @brief dlbridge::OwnershipLedger 的实现。
 */

#include "dlbridge/ownership_ledger.h"

#include <cstdlib>
#include <utility>
#include <vector>

#include "dlbridge/log_macros.h"

namespace dlbridge {

    namespace {
        std::shared_ptr<ILogger> OwnershipLogger() {
            return LogManager::Instance().GetLogger("dlbridge.ownership");
        }
    }  // namespace

    OwnershipLedger::OwnershipLedger() = default;

    OwnershipLedger::~OwnershipLedger() {
        std::unordered_map<uint64_t, Entry> leftovers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            leftovers.swap(entries_);
        }
        if (leftovers.empty()) return;

        auto logger = OwnershipLogger();
        DLBRIDGE_LOG_WARN(logger, "{} boundary buffer(s) were never released; releasing at ledger teardown",
            leftovers.size());
        for (auto& [generation, entry] : leftovers) {
            DLBRIDGE_LOG_DEBUG(logger, "Releasing leaked generation {} ({} bytes, {} side)",
                generation, entry.size, AllocatorSideToString(entry.side));
            entry.deallocator(entry.data, entry.size);
        }
    }

    BoundaryString OwnershipLedger::Register(char* data, uint64_t size, AllocatorSide side,
        uint64_t module_id, Deallocator deallocator) {
        if (!data || !deallocator) {
            throw BridgeException(BridgeError::kErrorInvalidArgument, Stage::kInvoke,
                "cannot register a null buffer or a buffer without deallocator");
        }

        BoundaryString str;
        str.data = data;
        str.size = size;
        str.side = side;
        str.module_id = module_id;

        std::lock_guard<std::mutex> lock(mutex_);
        str.generation = next_generation_++;
        entries_.emplace(str.generation, Entry{ data, size, side, module_id, std::move(deallocator) });
        return str;
    }

    void OwnershipLedger::Release(const BoundaryString& str) {
        Deallocator deallocator;
        char* data = nullptr;
        uint64_t size = 0;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            auto it = entries_.find(str.generation);
            if (str.generation == 0 || it == entries_.end()) {
                std::string detail;
                if (str.generation == 0) {
                    detail = "release of a borrowed view";
                } else if (str.generation < next_generation_) {
                    detail = "double release";
                } else {
                    detail = "release of a generation that was never issued";
                }
                lock.unlock();
                ReportViolation({ Stage::kRelease, str.generation, str.side, str.module_id, detail });
            }
            if (it->second.data != str.data || it->second.side != str.side) {
                lock.unlock();
                ReportViolation({ Stage::kRelease, str.generation, str.side, str.module_id,
                    "buffer does not match its registration" });
            }
            data = it->second.data;
            size = it->second.size;
            deallocator = std::move(it->second.deallocator);
            entries_.erase(it);
        }
        // 锁外调用：释放器会回到插件代码
        deallocator(data, size);
    }

    std::string OwnershipLedger::Decode(const BoundaryString& str) const {
        if (str.generation != 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            auto it = entries_.find(str.generation);
            if (it == entries_.end() || it->second.data != str.data) {
                lock.unlock();
                ReportViolation({ Stage::kDecode, str.generation, str.side, str.module_id,
                    "access to a released buffer" });
            }
        }
        if (!str.data) return std::string();
        return std::string(str.data, static_cast<std::size_t>(str.size));
    }

    bool OwnershipLedger::IsLive(uint64_t generation) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(generation) != 0;
    }

    std::size_t OwnershipLedger::LiveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void OwnershipLedger::SetViolationHandler(ViolationHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void OwnershipLedger::DefaultViolationHandler(const OwnershipViolation& violation) {
        auto logger = OwnershipLogger();
        DLBRIDGE_LOG_FATAL(logger, "Ownership violation during {}: {} (generation {}, {} side, module {})",
            StageToString(violation.stage), violation.detail, violation.generation,
            AllocatorSideToString(violation.side), violation.module_id);
        LogManager::Instance().Flush();
        std::abort();
    }

    void OwnershipLedger::ReportViolation(OwnershipViolation violation) const {
        ViolationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler) {
            handler(violation);
        } else {
            DefaultViolationHandler(violation);
        }

        auto logger = OwnershipLogger();
        DLBRIDGE_LOG_ERROR(logger, "Refused {} of generation {}: {}",
            StageToString(violation.stage), violation.generation, violation.detail);
        throw BridgeException(BridgeError::kErrorOwnershipViolation, violation.stage, violation.detail);
    }

}  // namespace dlbridge

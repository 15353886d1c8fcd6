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
 * @file boundary_string.h
 * @brief 跨边界字符串 BoundaryString 及其分配方标签。
 * @author Yue Liu
 * @date 2025-12-02
 *
 * @details
 * [受众：框架使用者]
 *
 * `BoundaryString` 是宿主侧对一段跨边界内存的描述：指针 + 显式长度，
 * 外加 "谁分配的" (`AllocatorSide`) 和所有权账本签发的代号 (generation)。
 *
 * - generation == 0：借用视图 (例如 `InvocationMarshaler::Encode` 的结果)，
 * 从不释放，底层内存由调用方保证在调用期间有效。
 * - generation != 0：已在 `OwnershipLedger` 登记，必须且只能释放一次。
 */

#pragma once

#ifndef DLBRIDGE_BOUNDARY_STRING_H_
#define DLBRIDGE_BOUNDARY_STRING_H_

#include <cstdint>
#include <string_view>

namespace dlbridge {

    /**
     * @enum AllocatorSide
     * @brief 内存由哪一侧的分配器分配。释放时必须回到同一侧。
     */
    enum class AllocatorSide : uint8_t {
        kHost = 0,
        kPlugin = 1
    };

    inline const char* AllocatorSideToString(AllocatorSide side) {
        return side == AllocatorSide::kHost ? "host" : "plugin";
    }

    /**
     * @struct BoundaryString
     * @brief 跨边界字符串 (不假设以 '\0' 结尾)。
     * @details 普通值类型，可以拷贝；拷贝不会转移或复制所有权，
     * 账本只认 generation。
     */
    struct BoundaryString {
        const char* data = nullptr;
        uint64_t size = 0;
        AllocatorSide side = AllocatorSide::kHost;
        uint64_t module_id = 0;   //!< kPlugin 时为所属模块的 ID
        uint64_t generation = 0;  //!< 0 = 借用视图

        /** @brief 是否为登记过的 (需要释放的) 缓冲区。 */
        bool IsOwned() const noexcept { return generation != 0; }

        /**
         * @brief 原始视图。
         * @warning 不做存活检查。需要检查时使用 `InvocationMarshaler::Decode`。
         */
        std::string_view View() const noexcept {
            return data ? std::string_view(data, static_cast<std::size_t>(size)) : std::string_view();
        }
    };

}  // namespace dlbridge

#endif  // DLBRIDGE_BOUNDARY_STRING_H_

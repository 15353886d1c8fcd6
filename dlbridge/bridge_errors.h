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
 * @file bridge_errors.h
 * @brief 定义错误码枚举 BridgeError、阶段枚举 Stage 和异常类 BridgeException。
 * @author Yue Liu
 * @date 2025-12-02
 *
 * @details
 * [受众：所有人]
 *
 * 宿主侧的标准错误处理机制：
 * 1. `dlbridge::BridgeError` (枚举)：`Try...` API 的返回值。
 * 2. `dlbridge::Stage` (枚举)：错误发生在 加载 -> 调用 -> 卸载 流程中的哪一步。
 * 3. `dlbridge::BridgeException` (异常)：非 `Try` API 失败时抛出。
 *
 * 除 `kErrorOwnershipViolation` 外，所有错误都是可恢复的：
 * 抛出后宿主状态 (句柄表、计数器) 保持一致。
 */

#pragma once

#ifndef DLBRIDGE_BRIDGE_ERRORS_H_
#define DLBRIDGE_BRIDGE_ERRORS_H_

#include <cstdint>
#include <stdexcept>
#include <string>
#include "dlbridge/dlbridge_api.h"

namespace dlbridge {

    /**
     * @enum BridgeError
     * @brief 宿主 API 可能返回的详细错误码。
     */
    enum class BridgeError : uint32_t {
        /** @brief 操作成功。 */
        kSuccess = 0,

        /** @brief [LoadError] 路径不存在。 */
        kErrorLoadNotFound = 1,

        /**
         * @brief [LoadError] 文件存在，但操作系统拒绝加载
         * (不是有效的 ELF/PE，或依赖缺失)。
         */
        kErrorLoadNotALibrary = 2,

        /** @brief [SymbolError] 模块中没有 `dlbridge_plugin_entry_v1`。 */
        kErrorSymbolMissing = 3,

        /**
         * @brief [VersionMismatch] 描述符的 ABI 版本、结构体大小或函数签名不兼容。
         * @note 此时宿主绝不会暴露插件的函数指针。
         */
        kErrorVersionMismatch = 4,

        /** @brief [InvocationFailure] 插件通过返回约定报告失败 (错误状态或空结果)。 */
        kErrorInvocationFailure = 5,

        /**
         * @brief [OwnershipViolation] 重复释放、释放后访问等内部不变量被破坏。
         * @warning 这是编程缺陷，不是可恢复错误。默认处理器会直接 abort。
         */
        kErrorOwnershipViolation = 6,

        /** @brief 卸载被拒绝：仍有调用在执行或仍有未释放的插件缓冲区。 */
        kErrorBusy = 7,

        /** @brief 调用超过期限，已被放弃 (工作线程仍在后台运行)。 */
        kErrorTimeout = 8,

        /** @brief 句柄已关闭或从未注册 (过期句柄)。 */
        kErrorHandleClosed = 9,

        /** @brief API 参数不合法。 */
        kErrorInvalidArgument = 10,

        /** @brief 配置文件无法读取或校验未通过。 */
        kErrorConfigInvalid = 11,

        /** @brief 宿主内部错误。 */
        kErrorInternal = 12
    };

    /**
     * @enum Stage
     * @brief 宿主流程中的阶段，用于标注错误发生的位置。
     */
    enum class Stage : uint32_t {
        kConfigure = 0,
        kOpen,
        kResolve,
        kValidate,
        kEncode,
        kInvoke,
        kDecode,
        kRelease,
        kClose
    };

    /**
     * @brief 将 BridgeError 转换为人类可读的字符串。
     * @param[in] error 错误码。
     */
    inline std::string ResultToString(BridgeError error) {
        switch (error) {
        case BridgeError::kSuccess:
            return "kSuccess";
        case BridgeError::kErrorLoadNotFound:
            return "kErrorLoadNotFound (Plugin file not found)";
        case BridgeError::kErrorLoadNotALibrary:
            return "kErrorLoadNotALibrary (Not a loadable module)";
        case BridgeError::kErrorSymbolMissing:
            return "kErrorSymbolMissing (Entry symbol not exported)";
        case BridgeError::kErrorVersionMismatch:
            return "kErrorVersionMismatch (Incompatible plugin ABI)";
        case BridgeError::kErrorInvocationFailure:
            return "kErrorInvocationFailure (Plugin reported failure)";
        case BridgeError::kErrorOwnershipViolation:
            return "kErrorOwnershipViolation (Boundary buffer misuse)";
        case BridgeError::kErrorBusy:
            return "kErrorBusy (Plugin has calls or buffers outstanding)";
        case BridgeError::kErrorTimeout:
            return "kErrorTimeout (Call abandoned after deadline)";
        case BridgeError::kErrorHandleClosed:
            return "kErrorHandleClosed (Stale or unknown plugin handle)";
        case BridgeError::kErrorInvalidArgument:
            return "kErrorInvalidArgument";
        case BridgeError::kErrorConfigInvalid:
            return "kErrorConfigInvalid (Configuration rejected)";
        case BridgeError::kErrorInternal:
            return "kErrorInternal";
        default:
            return "Unknown ErrorCode";
        }
    }

    /** @brief 将 Stage 转换为简短名称 (用于日志和 CLI 诊断)。 */
    inline const char* StageToString(Stage stage) {
        switch (stage) {
        case Stage::kConfigure: return "configure";
        case Stage::kOpen: return "open";
        case Stage::kResolve: return "resolve";
        case Stage::kValidate: return "validate";
        case Stage::kEncode: return "encode";
        case Stage::kInvoke: return "invoke";
        case Stage::kDecode: return "decode";
        case Stage::kRelease: return "release";
        case Stage::kClose: return "close";
        }
        return "unknown";
    }

    /**
     * @brief 错误是否可恢复。
     * @details 只有所有权违规不可恢复：检测到时内存可能已经损坏。
     */
    inline bool IsRecoverable(BridgeError error) noexcept {
        return error != BridgeError::kErrorOwnershipViolation;
    }

    /**
     * @class BridgeException
     * @brief 宿主侧的标准异常类型。
     *
     * [受众：框架使用者]
     * 携带错误码、阶段和上下文 (插件路径或符号名)。
     */
    class DLBRIDGE_API BridgeException : public std::exception {
    public:
        /**
         * @param[in] error 错误码。
         * @param[in] stage 发生阶段。
         * @param[in] message 附加上下文 (路径、符号名、插件给出的错误信息)。
         */
        BridgeException(BridgeError error, Stage stage, const std::string& message = "")
            : error_(error), stage_(stage), message_(message) {
            full_message_ = "[dlbridge::BridgeException] ";
            full_message_ += StageToString(stage_);
            full_message_ += ": ";
            if (!message_.empty()) {
                full_message_ += message_ + " (Reason: ";
            }
            full_message_ += ResultToString(error_);
            if (!message_.empty()) {
                full_message_ += ")";
            }
        }

        const char* what() const noexcept override;

        BridgeError GetError() const noexcept;

        Stage GetStage() const noexcept;

        /** @brief 不带格式前缀的原始上下文信息。 */
        const std::string& GetContext() const noexcept;

    private:
        BridgeError error_;
        Stage stage_;
        std::string message_;
        std::string full_message_;
    };

    inline const char* BridgeException::what() const noexcept {
        return full_message_.c_str();
    }

    inline BridgeError BridgeException::GetError() const noexcept {
        return error_;
    }

    inline Stage BridgeException::GetStage() const noexcept {
        return stage_;
    }

    inline const std::string& BridgeException::GetContext() const noexcept {
        return message_;
    }

}  // namespace dlbridge

#endif  // DLBRIDGE_BRIDGE_ERRORS_H_

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
 * @file dlbridge_abi.h
 * @brief [ABI 契约] 宿主与插件之间唯一共享的 C 语言布局定义 (v1)。
 * @author Yue Liu
 * @date 2025-12-02
 *
 * @details
 * [受众：插件开发者 和 框架维护者]
 *
 * 此文件同时被宿主 (dlbridge_host) 和插件 (.so/.dll) 编译。
 * 它是整个系统中 *唯一* 的可信边界：
 * 两侧必须基于同一份定义编译，否则宿主的版本检查会拒绝该插件。
 *
 * [边界安全类型 (Boundary-safe types)]
 * 只允许以下类型跨越模块边界：
 * 1. 定宽整数 (`uint32_t`, `uint64_t`)。
 * 2. 裸指针 + 显式长度 (`dlb_str_view_v1`, `dlb_buffer_v1`)，不假设结尾有 '\0'。
 * 3. 字段顺序冻结的扁平结构体 (下方的 `static_assert` 固定了 64 位布局)。
 *
 * `std::string`、虚函数表、异常 *绝不* 跨越边界。
 *
 * [版本规则]
 * v1 一经发布即冻结。任何布局变化都必须引入新的 `_v2` 结构体、
 * 新的入口符号和新的 `DLB_ABI_VERSION_V2`。
 */

#pragma once

#ifndef DLBRIDGE_ABI_H_
#define DLBRIDGE_ABI_H_

#include <stddef.h>
#include <stdint.h>

// --- 调用约定与导出宏 ---
#if defined(_WIN32)
#define DLB_ABI_CALL __cdecl
#define DLB_ABI_EXPORT __declspec(dllexport)
#else
#define DLB_ABI_CALL
#define DLB_ABI_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/** @brief 当前 ABI 版本号。嵌入描述符，由宿主在信任函数指针之前校验。 */
#define DLB_ABI_VERSION_V1 1u

/** @brief 插件唯一导出的入口符号名 (带版本号)。 */
#define DLB_ENTRY_SYMBOL_V1 "dlbridge_plugin_entry_v1"

/**
 * @name 状态码
 * @brief 跨边界返回的状态码。使用 uint32_t 而不是 enum，保证两侧宽度一致。
 */
///@{
typedef uint32_t dlb_status_v1;
#define DLB_STATUS_OK 0u             //!< 成功
#define DLB_STATUS_INVALID_ARG 1u    //!< 参数不合法 (插件侧校验失败)
#define DLB_STATUS_FAILED 2u         //!< 插件业务失败 (error 字段携带原因)
#define DLB_STATUS_UNSUPPORTED 3u    //!< 插件不支持宿主请求的 ABI
///@}

/**
 * @name 参数类型标签
 * @brief 描述符中声明的参数/返回值类型。
 * @details
 * v1 宿主只接受签名 (STRING, UINT32) -> STRING。
 * BOOL / INT64 / UINT64 / DOUBLE 是保留的标签值，v1 中不能跨边界传递：
 * 声明了它们的描述符会被宿主以 kErrorVersionMismatch 拒绝。
 */
///@{
typedef uint32_t dlb_type_v1;
#define DLB_TYPE_BOOL 0u     //!< 保留
#define DLB_TYPE_INT64 1u    //!< 保留
#define DLB_TYPE_UINT64 2u   //!< 保留
#define DLB_TYPE_DOUBLE 3u   //!< 保留
#define DLB_TYPE_STRING 4u
#define DLB_TYPE_UINT32 5u
///@}

/** @brief 描述符标志位：插件无隐藏的可变全局状态，允许多线程并发调用。 */
#define DLB_PLUGIN_FLAG_REENTRANT 0x1u

/**
 * @struct dlb_str_view_v1
 * @brief 只读字符串视图 (指针 + 长度)。不拥有内存。
 */
typedef struct dlb_str_view_v1 {
    const char* data;
    uint64_t size;
} dlb_str_view_v1;

/**
 * @struct dlb_buffer_v1
 * @brief 由插件分配器分配的缓冲区。
 * @warning 只能通过同一插件描述符中的 `release` 释放。
 */
typedef struct dlb_buffer_v1 {
    char* data;
    uint64_t size;
} dlb_buffer_v1;

/**
 * @struct dlb_invoke_result_v1
 * @brief 一次调用的输出。
 * @details
 * - status == DLB_STATUS_OK: `value` 为结果 (size 为 0 时 data 仍必须非空)。
 * - 其他状态: `error` 可选地携带 UTF-8 错误信息。
 * 两个缓冲区都由插件分配，宿主负责各调用一次 `release`。
 */
typedef struct dlb_invoke_result_v1 {
    dlb_status_v1 status;
    uint32_t reserved;
    dlb_buffer_v1 value;
    dlb_buffer_v1 error;
} dlb_invoke_result_v1;

/** @brief 插件调用函数：(输入字符串, 重复次数) -> 结果。 */
typedef dlb_status_v1(DLB_ABI_CALL* dlb_invoke_fn_v1)(
    const dlb_str_view_v1* input, uint32_t repeat_count, dlb_invoke_result_v1* out_result);

/** @brief 插件释放函数：使用插件自己的分配器释放 `dlb_buffer_v1`。 */
typedef void(DLB_ABI_CALL* dlb_release_fn_v1)(char* data, uint64_t size);

/**
 * @struct dlb_plugin_descriptor_v1
 * @brief 插件描述符 (能力表)。
 * @details
 * 宿主先清零并预填 `struct_size` / `abi_version`，再交给入口函数填写。
 * `name` 和 `param_types` 指向插件内部的静态数据，宿主从不释放它们。
 */
typedef struct dlb_plugin_descriptor_v1 {
    uint32_t struct_size;
    uint32_t abi_version;
    dlb_str_view_v1 name;
    uint32_t flags;
    uint32_t param_count;
    const dlb_type_v1* param_types;
    dlb_type_v1 return_type;
    uint32_t reserved;
    dlb_invoke_fn_v1 invoke;
    dlb_release_fn_v1 release;
} dlb_plugin_descriptor_v1;

/** @brief 入口函数签名。符号名见 `DLB_ENTRY_SYMBOL_V1`。 */
typedef dlb_status_v1(DLB_ABI_CALL* dlb_entry_fn_v1)(dlb_plugin_descriptor_v1* out_descriptor);

#ifdef __cplusplus
}  // extern "C"
#endif

// --- 布局冻结检查 (仅 C++ 编译单元，且仅 64 位) ---
#if defined(__cplusplus) && (UINTPTR_MAX == 0xFFFFFFFFFFFFFFFFu)
static_assert(sizeof(dlb_str_view_v1) == 16, "dlb_str_view_v1 layout changed");
static_assert(sizeof(dlb_buffer_v1) == 16, "dlb_buffer_v1 layout changed");
static_assert(offsetof(dlb_invoke_result_v1, value) == 8, "dlb_invoke_result_v1 layout changed");
static_assert(sizeof(dlb_invoke_result_v1) == 40, "dlb_invoke_result_v1 layout changed");
static_assert(offsetof(dlb_plugin_descriptor_v1, name) == 8, "descriptor layout changed");
static_assert(offsetof(dlb_plugin_descriptor_v1, param_types) == 32, "descriptor layout changed");
static_assert(offsetof(dlb_plugin_descriptor_v1, invoke) == 48, "descriptor layout changed");
static_assert(sizeof(dlb_plugin_descriptor_v1) == 64, "descriptor layout changed");
#endif

#endif  // DLBRIDGE_ABI_H_

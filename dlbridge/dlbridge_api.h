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
 * @file dlbridge_api.h
 * @brief 定义宿主核心库 (dlbridge_host) 的 DLL 导出/导入宏。
 * @author Yue Liu
 * @date 2025-12-02
 *
 * @details
 * [受众：框架维护者]
 *
 * `dlbridge_host` 的 `CMakeLists.txt` 定义了 `DLBRIDGE_HOST_AS_DLL`。
 * 编译核心库时 `DLBRIDGE_API` 为 `dllexport`，
 * 宿主程序和测试包含头文件时为 `dllimport`。
 * POSIX 平台统一为 `visibility("default")`。
 *
 * @note 插件 *不* 链接此库，也不需要此宏。插件侧只使用 `dlbridge_abi.h`
 * 中的 `DLB_ABI_EXPORT`。
 */

#pragma once

#ifndef DLBRIDGE_API_H_
#define DLBRIDGE_API_H_

#ifdef _WIN32
#ifdef DLBRIDGE_HOST_AS_DLL
#define DLBRIDGE_API __declspec(dllexport)
#else
#define DLBRIDGE_API __declspec(dllimport)
#endif
#else
#define DLBRIDGE_API __attribute__((visibility("default")))
#endif

#endif  // DLBRIDGE_API_H_

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
 * @file dlbridge.h
 * @brief [宿主专用] 一站式头文件。
 * @details 宿主程序包含此文件即可使用全部宿主 API。插件请包含 `plugin_sdk.h`。
 */

#pragma once

#ifndef DLBRIDGE_H_
#define DLBRIDGE_H_

#include "dlbridge/bridge_errors.h"
#include "dlbridge/boundary_string.h"
#include "dlbridge/dlbridge_abi.h"
#include "dlbridge/dlbridge_utils.h"
#include "dlbridge/host_config.h"
#include "dlbridge/host_driver.h"
#include "dlbridge/invocation_marshaler.h"
#include "dlbridge/log_macros.h"
#include "dlbridge/log_service.h"
#include "dlbridge/ownership_ledger.h"
#include "dlbridge/plugin_host.h"

#endif  // DLBRIDGE_H_

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
 * @file plugin_test_base.h
 * @brief [测试基建] 插件测试的公共基类 (Test Fixture)。
 * @details
 *
 * [GTest 核心概念解析]
 * 1. **Test Fixture (测试夹具)**:
 * - GTest 会为每一个 `TEST_F` 创建一个 **新** 的 `PluginTestBase` 对象，
 * 因此每个用例都拥有自己的 `PluginHost` (句柄表和账本)，互不影响。
 *
 * 2. **生命周期函数**:
 * - `SetUp()`: 创建宿主、封送器，定位构建目录 (bin)。
 * - `TearDown()`: 卸载所有插件，销毁宿主 (无论测试是否通过)。
 *
 * 3. **插件位置**:
 * CMake 把所有插件和测试可执行文件输出到同一个 bin 目录。
 */

#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "dlbridge/dlbridge.h"

class PluginTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        host_ = std::make_unique<dlbridge::PluginHost>(LoaderOptionsForTest());
        marshaler_ = std::make_unique<dlbridge::InvocationMarshaler>(*host_, InvocationOptionsForTest());
        bin_dir_ = dlbridge::utils::GetExecutableDir();
    }

    void TearDown() override {
        marshaler_.reset();
        if (host_) {
            host_->UnloadAll();
            host_.reset();
        }
    }

    /** @brief 子类可覆写以使用不同的加载器配置。 */
    virtual dlbridge::LoaderOptions LoaderOptionsForTest() const {
        return dlbridge::LoaderOptions{};
    }

    virtual dlbridge::InvocationOptions InvocationOptionsForTest() const {
        return dlbridge::InvocationOptions{};
    }

    /**
     * @brief [自适应] 拼接插件文件的完整路径。
     * @param plugin_base_name 插件目标名 (如 "plugin_repeat")
     */
    std::string PluginPath(const std::string& plugin_base_name) const {
        std::stringstream ss;

        // Linux/Mac 上模块以 lib 开头
#ifndef _WIN32
        ss << "lib";
#endif
        ss << plugin_base_name;
        ss << dlbridge::utils::GetSharedLibraryExtension();

        std::filesystem::path path = bin_dir_ / ss.str();

        // [容错] 不带前缀的文件名
        if (!std::filesystem::exists(path)) {
            std::filesystem::path fallback_path = bin_dir_ / (plugin_base_name +
                dlbridge::utils::GetSharedLibraryExtension());
            if (std::filesystem::exists(fallback_path)) {
                path = fallback_path;
            }
        }
        return dlbridge::utils::PathToUtf8(path);
    }

    /** @brief 加载插件；失败时打印原因并返回空句柄。 */
    dlbridge::PluginHandle LoadPlugin(const std::string& plugin_base_name) {
        std::string err;
        auto [handle, error] = host_->TryLoad(PluginPath(plugin_base_name), &err);
        if (error != dlbridge::BridgeError::kSuccess) {
            std::cerr << "[TestBase] Failed to load " << plugin_base_name << ": "
                << dlbridge::ResultToString(error) << " " << err << std::endl;
        }
        return handle;
    }

    std::unique_ptr<dlbridge::PluginHost> host_;
    std::unique_ptr<dlbridge::InvocationMarshaler> marshaler_;
    std::filesystem::path bin_dir_;
};

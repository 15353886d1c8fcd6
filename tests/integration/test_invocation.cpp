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
  * @file test_invocation.cpp
  * @brief [集成测试] 跨边界调用：编码 -> 调用 -> 解码 -> 释放
  * @details
  * 1. **示例插件**: "cool" x3 / x0 / x1。
  * 2. **插件报告失败**: 错误状态、异常、空结果都成为 kErrorInvocationFailure。
  * 3. **所有权**: 结果缓冲区登记在账本中，释放后计数归零。
  */

#include "common/plugin_test_base.h"

#include <vector>

using namespace dlbridge;

class InvocationTest : public PluginTestBase {
protected:
    void SetUp() override {
        PluginTestBase::SetUp();
        repeat_ = LoadPlugin("plugin_repeat");
        ASSERT_TRUE(repeat_);
    }

    PluginHandle repeat_;
};

/**
 * @test 示例插件的基本行为
 */
TEST_F(InvocationTest, RepeatsInput) {
    EXPECT_EQ(marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest("cool", 3)), "coolcoolcool");
    EXPECT_EQ(marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest("cool", 1)), "cool");
    EXPECT_EQ(marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest("cool", 0)), "");
    EXPECT_EQ(marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest("", 5)), "");
}

/**
 * @test 输入不假设以 '\0' 结尾
 * @brief 只传入缓冲区的前 2 个字节。
 */
TEST_F(InvocationTest, InputIsLengthDelimited) {
    const char buffer[] = { 'a', 'b', 'X', 'Y' };
    std::string_view prefix(buffer, 2);
    EXPECT_EQ(marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest(prefix, 3)), "ababab");
}

/**
 * @test 嵌入的 '\0' 被原样保留
 */
TEST_F(InvocationTest, EmbeddedNulBytesSurvive) {
    std::string input("a\0b", 3);
    std::string result = marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest(input, 2));
    EXPECT_EQ(result, std::string("a\0ba\0b", 6));
}

/**
 * @test 手动的 Invoke / Decode / Release 流程
 */
TEST_F(InvocationTest, ExplicitLifecycle) {
    auto ledger = host_->Ledger();
    BoundaryString result = marshaler_->Invoke(repeat_, InvocationMarshaler::MakeRequest("xy", 2));

    EXPECT_EQ(result.side, AllocatorSide::kPlugin);
    EXPECT_EQ(result.module_id, repeat_.Id());
    EXPECT_TRUE(result.IsOwned());
    EXPECT_TRUE(ledger->IsLive(result.generation));
    EXPECT_EQ(ledger->LiveCount(), 1u);

    EXPECT_EQ(marshaler_->Decode(result), "xyxy");
    marshaler_->Release(result);

    EXPECT_FALSE(ledger->IsLive(result.generation));
    EXPECT_EQ(ledger->LiveCount(), 0u);
}

/**
 * @test 结果未释放时，kReject 策略拒绝关闭
 */
TEST_F(InvocationTest, OutstandingBufferBlocksReject) {
    BoundaryString result = marshaler_->Invoke(repeat_, InvocationMarshaler::MakeRequest("z", 1));

    try {
        host_->Close(repeat_, ClosePolicy::kReject);
        FAIL() << "Close must be refused while a plugin buffer is outstanding";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorBusy);
    }
    EXPECT_TRUE(repeat_.IsOpen());

    marshaler_->Release(result);
    EXPECT_NO_THROW(host_->Close(repeat_, ClosePolicy::kReject));
}

/**
 * @test 插件抛出 PluginError
 * @brief 错误信息跨边界传回，错误缓冲区在抛出前已释放。
 */
TEST_F(InvocationTest, PluginErrorBecomesInvocationFailure) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    try {
        (void)marshaler_->Call(probe, InvocationMarshaler::MakeRequest("fail", 1));
        FAIL() << "probe 'fail' must report failure";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorInvocationFailure);
        EXPECT_EQ(e.GetContext(), "probe failure requested");
    }
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

/**
 * @test 插件抛出非 std::exception 的异常
 */
TEST_F(InvocationTest, ForeignExceptionDoesNotCrossBoundary) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    std::string err;
    auto [value, error] = marshaler_->TryCall(probe, InvocationMarshaler::MakeRequest("throw", 1), &err);
    EXPECT_EQ(error, BridgeError::kErrorInvocationFailure);
    EXPECT_EQ(err, "function panicked");
    EXPECT_TRUE(value.empty());
}

/**
 * @test 插件返回空结果
 */
TEST_F(InvocationTest, NullResultIsInvocationFailure) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    auto [value, error] = marshaler_->TryCall(probe, InvocationMarshaler::MakeRequest("null", 1));
    EXPECT_EQ(error, BridgeError::kErrorInvocationFailure);
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

/**
 * @test 成功结果附带多余的错误缓冲区时，两者都被释放
 */
TEST_F(InvocationTest, StrayErrorBufferIsReleased) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    EXPECT_EQ(marshaler_->Call(probe, InvocationMarshaler::MakeRequest("error-ok", 1)), "ok");
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
    EXPECT_NO_THROW(host_->Close(probe, ClosePolicy::kReject));
}

/**
 * @test 结果缓冲区无法登记时，已登记的缓冲区被释放，模块仍可关闭
 */
TEST_F(InvocationTest, AliasedResultBuffersAreReleasedOnce) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    auto [value, error] = marshaler_->TryCall(probe, InvocationMarshaler::MakeRequest("alias", 1));
    EXPECT_EQ(error, BridgeError::kErrorInvocationFailure);
    EXPECT_TRUE(value.empty());
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
    EXPECT_NO_THROW(host_->Close(probe, ClosePolicy::kReject));
}

/**
 * @test 同一句柄上多次调用
 */
TEST_F(InvocationTest, RepeatedInvocationsOnOneHandle) {
    for (uint32_t i = 0; i < 50; ++i) {
        EXPECT_EQ(marshaler_->Call(repeat_, InvocationMarshaler::MakeRequest("q", i)), std::string(i, 'q'));
    }
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

class SmallResultLimitTest : public PluginTestBase {
protected:
    InvocationOptions InvocationOptionsForTest() const override {
        InvocationOptions options;
        options.max_result_bytes = 8;
        return options;
    }
};

/**
 * @test 超过 max_result_bytes 的结果被释放并报告失败
 */
TEST_F(SmallResultLimitTest, OversizedResultIsRejected) {
    PluginHandle repeat = LoadPlugin("plugin_repeat");
    ASSERT_TRUE(repeat);

    EXPECT_EQ(marshaler_->Call(repeat, InvocationMarshaler::MakeRequest("cool", 2)), "coolcool");

    auto [value, error] = marshaler_->TryCall(repeat, InvocationMarshaler::MakeRequest("cool", 3));
    EXPECT_EQ(error, BridgeError::kErrorInvocationFailure);
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

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
  * @file test_concurrency.cpp
  * @brief [集成测试] 并发调用、关闭策略与超时
  * @details
  * 场景：
  * 1. 可重入插件被多个线程同时调用。
  * 2. 非可重入插件的调用被宿主串行化。
  * 3. 调用进行中关闭模块：kReject 立即拒绝；kBlock 等待调用结束，绝不在调用下方卸载。
  * 4. 超时调用被放弃，模块保持加载直到工作线程结束。
  */

#include "common/plugin_test_base.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace dlbridge;
using namespace std::chrono_literals;

class ConcurrencyTest : public PluginTestBase {
protected:
    /** @brief 等待条件成立 (最多 timeout)。 */
    template <typename Pred>
    static bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }
};

/**
 * @test 多线程并发调用可重入插件
 */
TEST_F(ConcurrencyTest, ConcurrentCallsOnReentrantPlugin) {
    PluginHandle repeat = LoadPlugin("plugin_repeat");
    ASSERT_TRUE(repeat);
    ASSERT_TRUE(repeat.IsReentrant());

    const int kThreadCount = 16;
    const int kCallsPerThread = 50;
    std::vector<std::thread> threads;
    std::atomic<int> mismatch_count{ 0 };
    std::atomic<int> exception_count{ 0 };

    for (int t = 0; t < kThreadCount; ++t) {
        threads.emplace_back([&, t]() {
            std::string input = "t" + std::to_string(t);
            for (int i = 0; i < kCallsPerThread; ++i) {
                try {
                    uint32_t count = static_cast<uint32_t>(i % 5);
                    std::string expected;
                    for (uint32_t k = 0; k < count; ++k) expected += input;
                    if (marshaler_->Call(repeat, InvocationMarshaler::MakeRequest(input, count)) != expected) {
                        mismatch_count++;
                    }
                } catch (const BridgeException&) {
                    exception_count++;
                }
            }
            });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(exception_count, 0);
    EXPECT_EQ(mismatch_count, 0);
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

/**
 * @test 非可重入插件的调用被串行化
 * @brief probe 的 "track" 模式报告调用期间观察到的最大并发数，必须始终为 1。
 */
TEST_F(ConcurrencyTest, NonReentrantPluginIsSerialized) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);
    ASSERT_FALSE(probe.IsReentrant());

    const int kThreadCount = 6;
    std::vector<std::thread> threads;
    std::vector<std::string> results(kThreadCount);

    for (int t = 0; t < kThreadCount; ++t) {
        threads.emplace_back([&, t]() {
            results[t] = marshaler_->TryCall(probe, InvocationMarshaler::MakeRequest("track", 10)).first;
            });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        EXPECT_EQ(r, "1");
    }
}

/**
 * @test kReject：调用进行中关闭被立即拒绝
 */
TEST_F(ConcurrencyTest, RejectPolicyRefusesCloseDuringCall) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    auto call = std::async(std::launch::async, [&]() {
        return marshaler_->Call(probe, InvocationMarshaler::MakeRequest("sleep", 300));
        });

    // 给调用足够的时间进入插件
    std::this_thread::sleep_for(100ms);
    try {
        host_->Close(probe, ClosePolicy::kReject);
        FAIL() << "close must be refused while a call is in flight";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorBusy);
    }
    EXPECT_TRUE(probe.IsOpen());

    EXPECT_EQ(call.get(), "slept");
    EXPECT_NO_THROW(host_->Close(probe, ClosePolicy::kReject));
    EXPECT_FALSE(probe.IsOpen());
}

/**
 * @test kBlock：关闭等待调用结束，并拒绝新的调用
 */
TEST_F(ConcurrencyTest, BlockPolicyWaitsForCall) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    auto call = std::async(std::launch::async, [&]() {
        return marshaler_->Call(probe, InvocationMarshaler::MakeRequest("sleep", 300));
        });
    std::this_thread::sleep_for(100ms);

    auto closer = std::async(std::launch::async, [&]() {
        host_->Close(probe, ClosePolicy::kBlock);
        });

    // 关闭挂起期间，新调用被拒绝
    ASSERT_TRUE(WaitUntil([&]() { return !probe.IsOpen(); }));
    auto [value, error] = marshaler_->TryCall(probe, InvocationMarshaler::MakeRequest("x", 1));
    EXPECT_EQ(error, BridgeError::kErrorHandleClosed);

    // 调用在模块仍然映射时完成了解码和释放
    EXPECT_EQ(call.get(), "slept");
    closer.get();
    EXPECT_FALSE(host_->IsLoaded(PluginPath("plugin_probe")));
}

/**
 * @test kReject 不排在另一个挂起的 kBlock 关闭之后
 */
TEST_F(ConcurrencyTest, RejectCloseDoesNotWaitForPendingClose) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    BoundaryString held = marshaler_->Invoke(probe, InvocationMarshaler::MakeRequest("held", 1));

    auto blocking_close = std::async(std::launch::async, [&]() {
        return host_->TryClose(probe);
        });
    ASSERT_TRUE(WaitUntil([&]() { return !probe.IsOpen(); }));

    auto start = std::chrono::steady_clock::now();
    BridgeError reject_error = BridgeError::kSuccess;
    try {
        host_->Close(probe, ClosePolicy::kReject);
    } catch (const BridgeException& e) {
        reject_error = e.GetError();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(reject_error, BridgeError::kErrorBusy);
    EXPECT_LT(elapsed, 500ms);

    // 释放缓冲区后，挂起的关闭完成
    marshaler_->Release(held);
    EXPECT_EQ(blocking_close.get(), BridgeError::kSuccess);
    EXPECT_FALSE(host_->IsLoaded(PluginPath("plugin_probe")));
}

class CloseTimeoutTest : public ConcurrencyTest {
protected:
    LoaderOptions LoaderOptionsForTest() const override {
        LoaderOptions options;
        options.close_policy = ClosePolicy::kBlock;
        options.close_timeout_ms = 50;
        return options;
    }
};

/**
 * @test kBlock + 超时：等待超时后报告 kErrorBusy，模块仍可用
 */
TEST_F(CloseTimeoutTest, BlockingCloseTimesOut) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    BoundaryString held = marshaler_->Invoke(probe, InvocationMarshaler::MakeRequest("held", 1));

    EXPECT_EQ(host_->TryClose(probe), BridgeError::kErrorBusy);
    EXPECT_TRUE(probe.IsOpen()) << "a timed-out close must reopen the handle for calls";
    EXPECT_EQ(marshaler_->Call(probe, InvocationMarshaler::MakeRequest("again", 1)), "again");

    marshaler_->Release(held);
    EXPECT_EQ(host_->TryClose(probe), BridgeError::kSuccess);
}

/**
 * @test 超时的调用被放弃，模块保持加载直到工作线程结束
 */
TEST_F(ConcurrencyTest, TimedOutCallIsAbandoned) {
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);

    try {
        (void)marshaler_->CallWithTimeout(probe, InvocationMarshaler::MakeRequest("sleep", 300), 30ms);
        FAIL() << "call must time out";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorTimeout);
    }

    // 工作线程仍在插件中：模块不能被卸载
    EXPECT_TRUE(probe.IsOpen());
    try {
        host_->Close(probe, ClosePolicy::kReject);
        FAIL() << "close must be refused while the abandoned call runs";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorBusy);
    }

    // 工作线程结束后一切都被释放
    EXPECT_NO_THROW(host_->Close(probe, ClosePolicy::kBlock));
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

/**
 * @test 期限内完成的调用正常返回
 */
TEST_F(ConcurrencyTest, CallWithinDeadlineSucceeds) {
    PluginHandle repeat = LoadPlugin("plugin_repeat");
    ASSERT_TRUE(repeat);

    std::string input = "abc";
    EXPECT_EQ(marshaler_->CallWithTimeout(repeat, InvocationMarshaler::MakeRequest(input, 2), 2000ms), "abcabc");

    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(probe);
    try {
        (void)marshaler_->CallWithTimeout(probe, InvocationMarshaler::MakeRequest("fail", 1), 2000ms);
        FAIL() << "plugin failure must propagate through the worker";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorInvocationFailure);
        EXPECT_EQ(e.GetContext(), "probe failure requested");
    }
    EXPECT_TRUE(WaitUntil([&]() { return host_->Ledger()->LiveCount() == 0; }));
}

/**
 * @test UnloadAll 不卸载繁忙的模块
 */
TEST_F(ConcurrencyTest, UnloadAllLeavesBusyModuleMapped) {
    PluginHandle repeat = LoadPlugin("plugin_repeat");
    PluginHandle probe = LoadPlugin("plugin_probe");
    ASSERT_TRUE(repeat);
    ASSERT_TRUE(probe);

    BoundaryString held = marshaler_->Invoke(probe, InvocationMarshaler::MakeRequest("held", 1));

    host_->UnloadAll();
    EXPECT_TRUE(host_->GetLoadedPluginFiles().empty());
    EXPECT_FALSE(repeat.IsOpen());

    // 模块仍然映射：缓冲区可以安全地解码和释放
    EXPECT_EQ(marshaler_->Decode(held), "held");
    marshaler_->Release(held);
    EXPECT_EQ(host_->Ledger()->LiveCount(), 0u);
}

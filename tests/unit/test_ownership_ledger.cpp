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
  * @file test_ownership_ledger.cpp
  * @brief [单元测试] OwnershipLedger：登记、恰好一次释放、违规检测
  */

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <thread>
#include <vector>

#include "dlbridge/ownership_ledger.h"

using namespace dlbridge;

namespace {

    /** @brief 用 new[] 分配并登记一段宿主缓冲区，统计释放次数。 */
    BoundaryString RegisterHostText(OwnershipLedger& ledger, const std::string& text, int* release_count) {
        char* data = new char[text.size() + 1];
        std::memcpy(data, text.data(), text.size());
        return ledger.Register(data, text.size(), AllocatorSide::kHost, 0,
            [release_count](char* p, uint64_t) {
                ++*release_count;
                delete[] p;
            });
    }

}  // namespace

class OwnershipLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_.SetViolationHandler([this](const OwnershipViolation& v) {
            violations_.push_back(v);
            });
    }

    OwnershipLedger ledger_;
    std::vector<OwnershipViolation> violations_;
};

/**
 * @test 正常生命周期
 */
TEST_F(OwnershipLedgerTest, RegisterDecodeRelease) {
    int released = 0;
    BoundaryString str = RegisterHostText(ledger_, "payload", &released);

    EXPECT_TRUE(str.IsOwned());
    EXPECT_TRUE(ledger_.IsLive(str.generation));
    EXPECT_EQ(ledger_.LiveCount(), 1u);
    EXPECT_EQ(ledger_.Decode(str), "payload");

    ledger_.Release(str);
    EXPECT_EQ(released, 1);
    EXPECT_FALSE(ledger_.IsLive(str.generation));
    EXPECT_EQ(ledger_.LiveCount(), 0u);
    EXPECT_TRUE(violations_.empty());
}

/**
 * @test generation 单调递增
 */
TEST_F(OwnershipLedgerTest, GenerationsAreMonotonic) {
    int released = 0;
    BoundaryString a = RegisterHostText(ledger_, "a", &released);
    ledger_.Release(a);
    BoundaryString b = RegisterHostText(ledger_, "b", &released);
    BoundaryString c = RegisterHostText(ledger_, "c", &released);

    EXPECT_LT(a.generation, b.generation);
    EXPECT_LT(b.generation, c.generation);

    ledger_.Release(c);
    ledger_.Release(b);
    EXPECT_EQ(released, 3);
}

/**
 * @test 重复释放：自定义处理器收到违规，操作被拒绝，内存不被触碰
 */
TEST_F(OwnershipLedgerTest, DoubleReleaseIsRefused) {
    int released = 0;
    BoundaryString str = RegisterHostText(ledger_, "once", &released);
    ledger_.Release(str);

    try {
        ledger_.Release(str);
        FAIL() << "double release must be refused";
    } catch (const BridgeException& e) {
        EXPECT_EQ(e.GetError(), BridgeError::kErrorOwnershipViolation);
        EXPECT_EQ(e.GetStage(), Stage::kRelease);
    }

    EXPECT_EQ(released, 1) << "the deallocator must run exactly once";
    ASSERT_EQ(violations_.size(), 1u);
    EXPECT_EQ(violations_[0].generation, str.generation);
    EXPECT_EQ(violations_[0].detail, "double release");
}

/**
 * @test 释放后访问
 */
TEST_F(OwnershipLedgerTest, DecodeAfterReleaseIsRefused) {
    int released = 0;
    BoundaryString str = RegisterHostText(ledger_, "gone", &released);
    ledger_.Release(str);

    EXPECT_THROW((void)ledger_.Decode(str), BridgeException);
    ASSERT_EQ(violations_.size(), 1u);
    EXPECT_EQ(violations_[0].stage, Stage::kDecode);
}

/**
 * @test 借用视图不能释放，但可以解码
 */
TEST_F(OwnershipLedgerTest, BorrowedViewCannotBeReleased) {
    std::string text = "borrowed";
    BoundaryString view;
    view.data = text.data();
    view.size = text.size();

    EXPECT_EQ(ledger_.Decode(view), "borrowed");
    EXPECT_THROW(ledger_.Release(view), BridgeException);
    ASSERT_EQ(violations_.size(), 1u);
    EXPECT_EQ(violations_[0].detail, "release of a borrowed view");
}

/**
 * @test 伪造的代号
 */
TEST_F(OwnershipLedgerTest, ForgedGenerationIsRefused) {
    int released = 0;
    BoundaryString real = RegisterHostText(ledger_, "real", &released);

    BoundaryString forged = real;
    forged.generation = real.generation + 1000;
    EXPECT_THROW(ledger_.Release(forged), BridgeException);

    BoundaryString mismatched = real;
    mismatched.side = AllocatorSide::kPlugin;
    EXPECT_THROW(ledger_.Release(mismatched), BridgeException);

    EXPECT_EQ(released, 0);
    EXPECT_TRUE(ledger_.IsLive(real.generation));
    ledger_.Release(real);
    EXPECT_EQ(released, 1);
    EXPECT_EQ(violations_.size(), 2u);
}

/**
 * @test 非法登记
 */
TEST_F(OwnershipLedgerTest, RegisterRejectsNullInputs) {
    char byte = 0;
    EXPECT_THROW(ledger_.Register(nullptr, 0, AllocatorSide::kHost, 0, [](char*, uint64_t) {}), BridgeException);
    EXPECT_THROW(ledger_.Register(&byte, 1, AllocatorSide::kHost, 0, Deallocator()), BridgeException);
    EXPECT_EQ(ledger_.LiveCount(), 0u);
}

/**
 * @test 析构时释放泄漏的登记
 */
TEST(OwnershipLedgerTeardownTest, LeakedEntriesAreReleasedAtTeardown) {
    int released = 0;
    {
        OwnershipLedger ledger;
        (void)RegisterHostText(ledger, "leak1", &released);
        (void)RegisterHostText(ledger, "leak2", &released);
    }
    EXPECT_EQ(released, 2);
}

/**
 * @test 并发登记与释放
 */
TEST(OwnershipLedgerConcurrencyTest, ConcurrentRegisterRelease) {
    OwnershipLedger ledger;
    std::atomic<int> released{ 0 };
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                char* data = new char[4];
                BoundaryString s = ledger.Register(data, 4, AllocatorSide::kHost, 0,
                    [&released](char* p, uint64_t) { ++released; delete[] p; });
                ledger.Release(s);
            }
            });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(released.load(), 8 * 200);
    EXPECT_EQ(ledger.LiveCount(), 0u);
}

/**
 * @test 默认处理器：重复释放直接终止进程
 */
TEST(OwnershipLedgerDeathTest, DefaultHandlerAbortsOnDoubleRelease) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_DEATH({
        OwnershipLedger ledger;
        char* data = new char[1];
        BoundaryString s = ledger.Register(data, 1, AllocatorSide::kHost, 0,
            [](char* p, uint64_t) { delete[] p; });
        ledger.Release(s);
        ledger.Release(s);
        }, "Ownership violation");
}

/**
 * @test 默认处理器：释放后访问直接终止进程
 */
TEST(OwnershipLedgerDeathTest, DefaultHandlerAbortsOnUseAfterRelease) {
    ::testing::FLAGS_gtest_death_test_style = "threadsafe";
    EXPECT_DEATH({
        OwnershipLedger ledger;
        char* data = new char[1];
        BoundaryString s = ledger.Register(data, 1, AllocatorSide::kHost, 0,
            [](char* p, uint64_t) { delete[] p; });
        ledger.Release(s);
        (void)ledger.Decode(s);
        }, "Ownership violation");
}

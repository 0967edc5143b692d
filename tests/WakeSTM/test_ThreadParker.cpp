#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>

#include "WakeSTM/ThreadParker.hpp"

using namespace WakeSTM;
using namespace std::chrono_literals;

// 测试：每个线程有自己的 parker，同线程多次获取是同一个
TEST(ThreadParkerTest, CurrentIsPerThread) {
    const auto& mine = ThreadParker::current();
    ASSERT_EQ(mine.get(), ThreadParker::current().get());

    ThreadParker* other = nullptr;
    std::thread t([&other] { other = ThreadParker::current().get(); });
    t.join();

    ASSERT_NE(other, nullptr);
    ASSERT_NE(other, mine.get());
}

// 测试：先 unpark 再 park，令牌不会丢
TEST(ThreadParkerTest, UnparkBeforePark) {
    ThreadParker parker;
    parker.unpark();

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(parker.parkFor(1000ms));
    ASSERT_LT(std::chrono::steady_clock::now() - start, 100ms);
}

// 测试：多次 unpark 只留下一个令牌
TEST(ThreadParkerTest, TokensDoNotAccumulate) {
    ThreadParker parker;
    parker.unpark();
    parker.unpark();
    parker.unpark();

    ASSERT_TRUE(parker.parkFor(10ms));
    ASSERT_FALSE(parker.parkFor(10ms));
}

// 测试：没有令牌时超时返回
TEST(ThreadParkerTest, ParkForTimesOut) {
    ThreadParker parker;

    auto start = std::chrono::steady_clock::now();
    ASSERT_FALSE(parker.parkFor(50ms));
    ASSERT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

// 测试：另一个线程唤醒
TEST(ThreadParkerTest, CrossThreadUnpark) {
    auto parker = std::make_shared<ThreadParker>();

    std::thread waker([parker] {
        std::this_thread::sleep_for(50ms);
        parker->unpark();
    });

    parker->park();
    waker.join();
    SUCCEED();
}

// 测试：线程退出后它的 parker 仍可被 unpark
TEST(ThreadParkerTest, UnparkAfterThreadExit) {
    std::shared_ptr<ThreadParker> orphan;
    std::thread t([&orphan] { orphan = ThreadParker::current(); });
    t.join();

    ASSERT_EQ(orphan.use_count(), 1);
    orphan->unpark();
    ASSERT_TRUE(orphan->parkFor(10ms));
}

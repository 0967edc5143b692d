#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace WakeSTM {

// 每个线程一个，用来挂起 / 唤醒该线程。
// 只有一个唤醒令牌：unpark 多次不会累积，park 消费令牌。
class ThreadParker {
public:
    ThreadParker() = default;

    ThreadParker(const ThreadParker&) = delete;
    ThreadParker& operator=(const ThreadParker&) = delete;

    // 当前线程的 parker。shared_ptr 保证线程退出后别人 unpark 也是安全的
    static const std::shared_ptr<ThreadParker>& current();

    // 没有令牌就一直挂起
    void park();

    // 最多挂起 timeout；返回是否消费到了令牌 (false 表示超时)
    bool parkFor(std::chrono::milliseconds timeout);

    // 任意线程可调用
    void unpark();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool notified_ = false;
};

}

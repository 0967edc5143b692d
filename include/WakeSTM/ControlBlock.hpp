#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "WakeSTM/ThreadParker.hpp"

#ifndef WAKESTM_DEFAULT_PARK_TIMEOUT_MS
#define WAKESTM_DEFAULT_PARK_TIMEOUT_MS 1000
#endif

namespace WakeSTM {

// 一次 retry 阻塞周期的控制块。
//
// 事务 retry 时在它读过的所有 Var 上注册同一个控制块，
// 任一 Var 被别的事务修改后调用 setChanged() 唤醒等待线程。
//
// wait() 只能由构造它的线程调用。别的线程调用不会死锁，
// 但唤醒信号发给的是 owner，调用者只能靠 park 超时轮询。
class ControlBlock {
public:
    static constexpr std::chrono::milliseconds kDefaultParkTimeout{WAKESTM_DEFAULT_PARK_TIMEOUT_MS};

    ControlBlock();
    explicit ControlBlock(std::chrono::milliseconds park_timeout);

    // 禁止拷贝和移动：Var 的唤醒列表按地址共享它
    ControlBlock(const ControlBlock&) = delete;
    ControlBlock& operator=(const ControlBlock&) = delete;
    ControlBlock(ControlBlock&&) = delete;
    ControlBlock& operator=(ControlBlock&&) = delete;

    // 通知某个 Var 已变化。任意线程、任意次数，只有第一次会唤醒线程
    void setChanged();

    // 阻塞到至少一个 Var 变化。已经 setChanged 过则立即返回
    void wait() const;

    bool isChanged() const noexcept {
        return !blocked_.load(std::memory_order_acquire);
    }

    std::thread::id owner() const noexcept {
        return owner_id_;
    }

    std::chrono::milliseconds parkTimeout() const noexcept {
        return park_timeout_;
    }

    // 只能在共享给其他线程之前调用
    void setParkTimeout(std::chrono::milliseconds park_timeout) noexcept {
        park_timeout_ = park_timeout;
    }

private:
    std::shared_ptr<ThreadParker> owner_parker_;
    std::thread::id owner_id_;

    // true: 仍在阻塞；false: 已有变化
    std::atomic<bool> blocked_;

    // 防死锁的兜底：park 超时后重新检查
    std::chrono::milliseconds park_timeout_;

    mutable std::atomic<bool> misuse_reported_{false};
};

}

#include "WakeSTM/ThreadParker.hpp"

namespace WakeSTM {

const std::shared_ptr<ThreadParker>& ThreadParker::current() {
    static thread_local std::shared_ptr<ThreadParker> parker = std::make_shared<ThreadParker>();
    return parker;
}

void ThreadParker::park() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return notified_; });
    notified_ = false;
}

bool ThreadParker::parkFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool woken = cv_.wait_for(lock, timeout, [this] { return notified_; });
    notified_ = false;
    return woken;
}

void ThreadParker::unpark() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notified_ = true;
    }
    cv_.notify_one();
}

}

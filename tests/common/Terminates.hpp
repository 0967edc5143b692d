#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace WakeSTM {
namespace test {

// 在新线程上运行 f，返回它是否在 timeout_ms 内结束。
// 超时的线程会被 detach，f 捕获的对象必须自己持有所有权。
inline bool terminates(long timeout_ms, std::function<void()> f) {
    std::packaged_task<void()> task(std::move(f));
    std::future<void> done = task.get_future();
    std::thread worker(std::move(task));

    bool finished = done.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready;
    if (finished) {
        worker.join();
    } else {
        worker.detach();
    }
    return finished;
}

// 与 terminates 相同，同时在当前线程上运行 g
inline bool terminatesAsync(long timeout_ms, std::function<void()> f, std::function<void()> g) {
    std::packaged_task<void()> task(std::move(f));
    std::future<void> done = task.get_future();
    std::thread worker(std::move(task));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    g();

    bool finished = done.wait_until(deadline) == std::future_status::ready;
    if (finished) {
        worker.join();
    } else {
        worker.detach();
    }
    return finished;
}

}
}

#include "WakeSTM/ControlBlock.hpp"
#include "WakeSTM/Log.hpp"

#include <cstdio>
#include <functional>

namespace WakeSTM {

ControlBlock::ControlBlock()
    : ControlBlock(kDefaultParkTimeout)
{}

ControlBlock::ControlBlock(std::chrono::milliseconds park_timeout)
    : owner_parker_(ThreadParker::current())
    , owner_id_(std::this_thread::get_id())
    , blocked_(true)
    , park_timeout_(park_timeout)
{
    WAKESTM_LOG("[T%zu] [CTRL-CONSTRUCT] Ctrl:%p | ParkTimeout:%lldms\n", detail::shortTid(), (void*)this,
                static_cast<long long>(park_timeout_.count()));
}

void ControlBlock::setChanged() {
    // 只唤醒一次
    if (blocked_.exchange(false, std::memory_order_acq_rel)) {
        WAKESTM_LOG("[T%zu] [CTRL-WAKE] Ctrl:%p | Unparking owner\n", detail::shortTid(), (void*)this);
        owner_parker_->unpark();
    }
}

void ControlBlock::wait() const {
    if (std::this_thread::get_id() != owner_id_ && !misuse_reported_.exchange(true, std::memory_order_relaxed)) {
        std::fprintf(stderr, "[CRITICAL] Ctrl:%p | wait() called off the owner thread (T%zu, owner T%zu), falling back to %lldms polling\n",
                     (void*)this, detail::shortTid(), std::hash<std::thread::id>{}(owner_id_) % 1000,
                     static_cast<long long>(park_timeout_.count()));
    }

    const std::shared_ptr<ThreadParker>& parker = ThreadParker::current();

    // 先检查再 park：setChanged 发生在 wait 之前也不会丢失唤醒
    while (blocked_.load(std::memory_order_acquire)) {
        // 非 owner 线程调用，或 unpark 被之前遗留的令牌吞掉时，
        // 都靠超时保证不会永久挂起
        if (!parker->parkFor(park_timeout_)) {
            WAKESTM_LOG("[T%zu] [CTRL-TIMEOUT] Ctrl:%p | Park timed out, rechecking\n", detail::shortTid(), (void*)this);
        }
    }
}

}

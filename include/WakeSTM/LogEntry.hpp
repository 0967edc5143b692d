#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <variant>

#include "WakeSTM/SharedValue.hpp"

namespace WakeSTM {

namespace detail {

template<typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

template<typename... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

}

// 一次事务尝试中，某个 Var 的读写记录。
// 只属于创建它的那次尝试 (单线程独占)，提交或进入 retry 后丢弃。
class LogEntry {
public:
    // 只读过
    struct Read {
        SharedValue value;
    };

    // 只写过，没有原值，提交时不需要一致性检查
    struct Write {
        SharedValue value;
    };

    // 先读后写，提交时需要检查 original
    struct ReadWrite {
        SharedValue original;
        SharedValue pending;
    };

    // 在阻塞路径上读到的值：不做一致性检查，只用来注册唤醒
    struct ReadObsolete {
        SharedValue original;
    };

    // 阻塞路径上读过，随后又写过
    struct ReadObsoleteWrite {
        SharedValue original;
        SharedValue pending;
    };

    // WriteObsolete 不存在：只写的记录在 retry 时直接丢掉
    using State = std::variant<Read, Write, ReadWrite, ReadObsolete, ReadObsoleteWrite>;

    enum class Kind : uint8_t {
        READ = 0,
        WRITE = 1,
        READ_WRITE = 2,
        READ_OBSOLETE = 3,
        READ_OBSOLETE_WRITE = 4
    };

    struct ReadResult {
        SharedValue value;                    // 事务此刻应看到的值
        std::optional<SharedValue> original;  // 读到的原值，只写过则为空
    };

    explicit LogEntry(State state)
        : state_(std::move(state))
    {}

    static LogEntry makeRead(SharedValue val) {
        return LogEntry(Read{std::move(val)});
    }

    static LogEntry makeWrite(SharedValue val) {
        return LogEntry(Write{std::move(val)});
    }

    // 读取，必要时把 Obsolete 升级为普通的读
    ReadResult read();

    // 写入，总是成功。写不会清除 Obsolete 标记
    void write(SharedValue val);

    // 转成阻塞路径上的版本；只写过的记录没有可等待的值，返回空
    std::optional<LogEntry> obsolete() &&;

    // 忽略所有待写值，取出原值
    std::optional<SharedValue> intoReadValue() &&;

    // 提交时要发布的值
    std::optional<SharedValue> pendingWrite() const;

    Kind kind() const noexcept {
        return static_cast<Kind>(state_.index());
    }

    bool needsValidation() const noexcept {
        return std::holds_alternative<Read>(state_) || std::holds_alternative<ReadWrite>(state_);
    }

    bool isObsolete() const noexcept {
        return std::holds_alternative<ReadObsolete>(state_) || std::holds_alternative<ReadObsoleteWrite>(state_);
    }

    template<typename S>
    const S* as() const noexcept {
        return std::get_if<S>(&state_);
    }

    const State& state() const noexcept {
        return state_;
    }

    static const char* kindName(Kind kind) noexcept;

private:
    State state_;
};

}

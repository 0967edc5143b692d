#include "WakeSTM/LogEntry.hpp"
#include "WakeSTM/Log.hpp"

namespace WakeSTM {

LogEntry::ReadResult LogEntry::read() {
    // 只在 Obsolete 时改写 state_，其余情况只拷贝需要返回的句柄，
    // 尽量少碰共享的引用计数
    std::optional<State> upgraded;

    ReadResult result = std::visit(detail::Overloaded{
        [](const Read& s) -> ReadResult {
            return {s.value, s.value};
        },
        [](const Write& s) -> ReadResult {
            return {s.value, std::nullopt};
        },
        [](const ReadWrite& s) -> ReadResult {
            return {s.pending, s.original};
        },
        // 升级为真正的 Read
        [&upgraded](const ReadObsolete& s) -> ReadResult {
            upgraded = Read{s.original};
            return {s.original, s.original};
        },
        // 升级为真正的 ReadWrite
        [&upgraded](const ReadObsoleteWrite& s) -> ReadResult {
            upgraded = ReadWrite{s.original, s.pending};
            return {s.pending, s.original};
        }
    }, state_);

    if (upgraded) {
        WAKESTM_LOG("[T%zu] [ENTRY-UPGRADE] Entry:%p | %s -> %s\n", detail::shortTid(), (void*)this,
                    kindName(kind()), kindName(static_cast<Kind>(upgraded->index())));
        state_ = std::move(*upgraded);
    }
    return result;
}

void LogEntry::write(SharedValue val) {
    state_ = std::visit(detail::Overloaded{
        [&val](Write&) -> State {
            return Write{std::move(val)};
        },
        [&val](Read& s) -> State {
            return ReadWrite{std::move(s.value), std::move(val)};
        },
        [&val](ReadWrite& s) -> State {
            return ReadWrite{std::move(s.original), std::move(val)};
        },
        [&val](ReadObsolete& s) -> State {
            return ReadObsoleteWrite{std::move(s.original), std::move(val)};
        },
        [&val](ReadObsoleteWrite& s) -> State {
            return ReadObsoleteWrite{std::move(s.original), std::move(val)};
        }
    }, state_);
}

std::optional<LogEntry> LogEntry::obsolete() && {
    std::optional<SharedValue> original = std::move(*this).intoReadValue();
    if (!original) {
        WAKESTM_LOG("[T%zu] [ENTRY-OBSOLETE] Entry:%p | write-only, dropped from wake set\n", detail::shortTid(), (void*)this);
        return std::nullopt;
    }
    return LogEntry(ReadObsolete{std::move(*original)});
}

std::optional<SharedValue> LogEntry::intoReadValue() && {
    return std::visit(detail::Overloaded{
        [](Read& s) -> std::optional<SharedValue> { return std::move(s.value); },
        [](Write&) -> std::optional<SharedValue> { return std::nullopt; },
        [](ReadWrite& s) -> std::optional<SharedValue> { return std::move(s.original); },
        [](ReadObsolete& s) -> std::optional<SharedValue> { return std::move(s.original); },
        [](ReadObsoleteWrite& s) -> std::optional<SharedValue> { return std::move(s.original); }
    }, state_);
}

std::optional<SharedValue> LogEntry::pendingWrite() const {
    return std::visit(detail::Overloaded{
        [](const Read&) -> std::optional<SharedValue> { return std::nullopt; },
        [](const Write& s) -> std::optional<SharedValue> { return s.value; },
        [](const ReadWrite& s) -> std::optional<SharedValue> { return s.pending; },
        [](const ReadObsolete&) -> std::optional<SharedValue> { return std::nullopt; },
        [](const ReadObsoleteWrite& s) -> std::optional<SharedValue> { return s.pending; }
    }, state_);
}

const char* LogEntry::kindName(Kind kind) noexcept {
    switch (kind) {
        case Kind::READ:                return "Read";
        case Kind::WRITE:               return "Write";
        case Kind::READ_WRITE:          return "ReadWrite";
        case Kind::READ_OBSOLETE:       return "ReadObsolete";
        case Kind::READ_OBSOLETE_WRITE: return "ReadObsoleteWrite";
    }
    return "Unknown";
}

}

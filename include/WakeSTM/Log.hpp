#pragma once

#include <cstdio>
#include <cstddef>
#include <functional>
#include <thread>

// =============================================================
// 日志控制开关
// 0: 关闭日志 (默认，热路径上不产生任何开销)
// 1: 开启日志 (调试用，park / wake 频繁时输出量很大)
// =============================================================
#ifndef WAKESTM_ENABLE_LOGGING
#define WAKESTM_ENABLE_LOGGING 0
#endif

#if WAKESTM_ENABLE_LOGGING
    #define WAKESTM_LOG(...) std::fprintf(stderr, __VA_ARGS__)
#else
    #define WAKESTM_LOG(...) ((void)0)
#endif

namespace WakeSTM {
namespace detail {

// 日志辅助：获取短线程ID
inline size_t shortTid() {
    return std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000;
}

}
}

#ifndef SIM_CORE_HH
#define SIM_CORE_HH

#include <cstdint>
#include <cinttypes>
#include <cstdio>
#include <limits>

// 仿真时间的最小单位
using Tick = int64_t;

constexpr Tick MAX_TICK = std::numeric_limits<Tick>::max();

// 常用的事件优先级（数值越小越先执行）
constexpr int PRIORITY_CONDITION = 0;
constexpr int PRIORITY_NOTIFY = 2;
constexpr int PRIORITY_WORK = 5;

//
#ifdef DEBUG_PRINT
#define DPRINTF(name, fmt, ...) \
    do { \
        printf("[%s] ", #name); \
        printf(fmt, ##__VA_ARGS__); \
    } while(0)
#else
#define DPRINTF(name, fmt, ...) do {} while(0)
#endif

#endif // SIM_CORE_HH

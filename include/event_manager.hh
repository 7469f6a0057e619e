// include/event_manager.hh
#ifndef EVENT_MANAGER_HH
#define EVENT_MANAGER_HH

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "event_queue.hh"

/**
 * 事件调度器：驱动虚拟时钟，按 (tick, priority, fifo) 顺序分发事件
 *
 * 所有实体行为都运行在调用 run() 的线程上，任一时刻只有一个进程在执行。
 * 进程通过 schedule / wait / waitUntil 把续体交给调度器，然后返回，即为挂起。
 */
class EventManager {
public:
    enum class RunState { Idle, Running, Paused, Terminated };

private:
    std::string name;
    EventQueue event_queue;
    std::vector<std::unique_ptr<Event>> cond_events;  // 按注册顺序
    Tick cur_tick = 0;
    double ticks_per_second;
    RunState run_state = RunState::Idle;
    bool pause_requested = false;
    uint64_t dispatch_count = 0;
    std::function<void()> dispatch_hook;     // 每个事件处理完后调用

    Tick calcSchedTick(Tick ticks) const;
    void insert(std::unique_ptr<Event> ev, Tick ticks, int priority, bool fifo);
    std::unique_ptr<Event> detach(Event* ev);
    void evaluateConditions();

public:
    explicit EventManager(const std::string& n = "EventManager", double tps = 1.0e6);
    ~EventManager();

    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;

    // 安排事件
    void scheduleTicks(Tick ticks, int priority, bool fifo, ProcessTarget* t, EventHandle* handle = nullptr);
    void scheduleTicks(Tick ticks, int priority, bool fifo, std::function<void()> f, EventHandle* handle = nullptr);
    void scheduleSeconds(double secs, int priority, bool fifo, ProcessTarget* t, EventHandle* handle = nullptr);
    void scheduleSeconds(double secs, int priority, bool fifo, std::function<void()> f, EventHandle* handle = nullptr);

    // 立即运行一个新进程，结束后回到调用者
    void startProcess(ProcessTarget* t);

    // 等待一段时间后继续执行 cont（调用者必须随即返回）
    void waitTicks(Tick ticks, int priority, bool fifo, EventHandle* handle, std::function<void()> cont);
    void waitSeconds(double secs, int priority, bool fifo, EventHandle* handle, std::function<void()> cont);

    // 条件满足时继续执行；若条件已成立则立即执行
    void waitUntil(Conditional* cond, EventHandle* handle, ProcessTarget* t);
    void waitUntil(std::function<bool()> cond, EventHandle* handle, std::function<void()> cont);

    void killEvent(EventHandle* handle);
    void interruptEvent(EventHandle* handle);

    // 运行控制
    void run(Tick end_tick);
    void pause();
    void resume(Tick end_tick);
    void terminate();
    void clear();

    RunState getRunState() const { return run_state; }
    bool isRunning() const { return run_state == RunState::Running; }

    Tick simTicks() const { return cur_tick; }
    double simSeconds() const { return ticksToSeconds(cur_tick); }

    double getTicksPerSecond() const { return ticks_per_second; }
    void setTicksPerSecond(double tps);

    // 此时没有进程在执行，可以安全地回收实体
    void setDispatchHook(std::function<void()> f) { dispatch_hook = std::move(f); }

    Tick secondsToNearestTick(double secs) const;
    double ticksToSeconds(Tick ticks) const;

    Tick getNextEventTick() const { return event_queue.nextTick(); }
    size_t getEventCount() const { return event_queue.size(); }
    size_t getConditionalCount() const { return cond_events.size(); }
    uint64_t getDispatchCount() const { return dispatch_count; }
    const std::string& getName() const { return name; }
};

#endif // EVENT_MANAGER_HH

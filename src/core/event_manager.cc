// src/core/event_manager.cc
#include "event_manager.hh"
#include "error_exception.hh"

#include <cmath>
#include <exception>

EventManager::EventManager(const std::string& n, double tps)
    : name(n), ticks_per_second(tps) {
    if (!(tps > 0.0)) {
        throw ErrorException(name, "Ticks per second must be positive");
    }
}

EventManager::~EventManager() {
    clear();
}

void EventManager::setTicksPerSecond(double tps) {
    if (run_state != RunState::Idle) {
        throw ErrorException(name, "Cannot change the tick length once the run has started");
    }
    if (!(tps > 0.0)) {
        throw ErrorException(name, "Ticks per second must be positive");
    }
    ticks_per_second = tps;
}

Tick EventManager::secondsToNearestTick(double secs) const {
    double ticks = std::round(secs * ticks_per_second);
    if (ticks >= static_cast<double>(MAX_TICK)) return MAX_TICK;
    if (ticks <= -static_cast<double>(MAX_TICK)) return -MAX_TICK;
    return static_cast<Tick>(ticks);
}

double EventManager::ticksToSeconds(Tick ticks) const {
    return static_cast<double>(ticks) / ticks_per_second;
}

Tick EventManager::calcSchedTick(Tick ticks) const {
    if (ticks < 0) {
        throw ErrorException(name, formatMessage(
            "Attempted to schedule an event in the past: delay=%" PRId64 " ticks", ticks));
    }
    // 饱和，避免溢出
    if (ticks > MAX_TICK - cur_tick) return MAX_TICK;
    return cur_tick + ticks;
}

void EventManager::insert(std::unique_ptr<Event> ev, Tick ticks, int priority, bool fifo) {
    ev->sched_tick = calcSchedTick(ticks);
    ev->priority = priority;
    ev->fifo = fifo;
    DPRINTF(EVENT, "[%s] t=%" PRId64 " schedule %s at %" PRId64 " prio=%d\n",
            name.c_str(), cur_tick, ev->target->getDescription().c_str(), ev->sched_tick, priority);
    event_queue.push(std::move(ev));
}

static void checkHandle(const std::string& name, EventHandle* handle) {
    if (handle && handle->isScheduled()) {
        throw ErrorException(name, "Tried to schedule using an EventHandle already in use");
    }
}

void EventManager::scheduleTicks(Tick ticks, int priority, bool fifo, ProcessTarget* t, EventHandle* handle) {
    checkHandle(name, handle);
    calcSchedTick(ticks);
    insert(std::make_unique<Event>(t, handle), ticks, priority, fifo);
}

void EventManager::scheduleTicks(Tick ticks, int priority, bool fifo, std::function<void()> f, EventHandle* handle) {
    checkHandle(name, handle);
    calcSchedTick(ticks);
    auto target = std::make_unique<LambdaTarget>(std::move(f));
    insert(std::make_unique<Event>(std::move(target), handle), ticks, priority, fifo);
}

void EventManager::scheduleSeconds(double secs, int priority, bool fifo, ProcessTarget* t, EventHandle* handle) {
    scheduleTicks(secondsToNearestTick(secs), priority, fifo, t, handle);
}

void EventManager::scheduleSeconds(double secs, int priority, bool fifo, std::function<void()> f, EventHandle* handle) {
    scheduleTicks(secondsToNearestTick(secs), priority, fifo, std::move(f), handle);
}

void EventManager::startProcess(ProcessTarget* t) {
    DPRINTF(EVENT, "[%s] t=%" PRId64 " start %s\n", name.c_str(), cur_tick, t->getDescription().c_str());
    t->process();
}

void EventManager::waitTicks(Tick ticks, int priority, bool fifo, EventHandle* handle, std::function<void()> cont) {
    scheduleTicks(ticks, priority, fifo, std::move(cont), handle);
}

void EventManager::waitSeconds(double secs, int priority, bool fifo, EventHandle* handle, std::function<void()> cont) {
    scheduleTicks(secondsToNearestTick(secs), priority, fifo, std::move(cont), handle);
}

void EventManager::waitUntil(Conditional* cond, EventHandle* handle, ProcessTarget* t) {
    if (cond->evaluate()) {
        startProcess(t);
        return;
    }
    checkHandle(name, handle);
    auto ev = std::make_unique<Event>(t, handle);
    ev->cond = cond;
    cond_events.push_back(std::move(ev));
}

void EventManager::waitUntil(std::function<bool()> cond, EventHandle* handle, std::function<void()> cont) {
    if (cond()) {
        cont();
        return;
    }
    checkHandle(name, handle);
    auto ev = std::make_unique<Event>(std::make_unique<LambdaTarget>(std::move(cont), "waitUntil"), handle);
    ev->owned_cond = std::make_unique<LambdaConditional>(std::move(cond));
    ev->cond = ev->owned_cond.get();
    cond_events.push_back(std::move(ev));
}

std::unique_ptr<Event> EventManager::detach(Event* ev) {
    if (ev->cond) {
        for (auto it = cond_events.begin(); it != cond_events.end(); ++it) {
            if (it->get() == ev) {
                std::unique_ptr<Event> ret = std::move(*it);
                cond_events.erase(it);
                return ret;
            }
        }
        return nullptr;
    }
    return event_queue.remove(ev);
}

void EventManager::killEvent(EventHandle* handle) {
    // 已执行或已取消：什么也不做
    if (!handle || !handle->isScheduled()) return;

    std::unique_ptr<Event> ev = detach(handle->event);
    if (ev) {
        DPRINTF(EVENT, "[%s] t=%" PRId64 " kill %s\n", name.c_str(), cur_tick,
                ev->target->getDescription().c_str());
        ev->unbind();
    }
}

void EventManager::interruptEvent(EventHandle* handle) {
    if (!handle || !handle->isScheduled()) return;

    std::unique_ptr<Event> ev = detach(handle->event);
    if (!ev) return;
    ev->unbind();
    DPRINTF(EVENT, "[%s] t=%" PRId64 " interrupt %s\n", name.c_str(), cur_tick,
            ev->target->getDescription().c_str());
    ev->target->process();
}

void EventManager::evaluateConditions() {
    for (size_t i = 0; i < cond_events.size();) {
        if (!cond_events[i]->cond->evaluate()) {
            i++;
            continue;
        }
        std::unique_ptr<Event> ev = std::move(cond_events[i]);
        cond_events.erase(cond_events.begin() + i);
        ev->cond = nullptr;
        ev->owned_cond.reset();
        insert(std::move(ev), 0, PRIORITY_CONDITION, true);
    }
}

void EventManager::run(Tick end_tick) {
    if (run_state == RunState::Terminated) return;

    run_state = RunState::Running;
    pause_requested = false;

    try {
        while (!pause_requested) {
            Event* next = event_queue.peek();
            if (!next || next->sched_tick >= end_tick) {
                if (end_tick != MAX_TICK && end_tick > cur_tick) cur_tick = end_tick;
                break;
            }

            std::unique_ptr<Event> ev = event_queue.pop();
            cur_tick = ev->sched_tick;
            ev->unbind();
            DPRINTF(EVENT, "[%s] t=%" PRId64 " dispatch %s (prio=%d seq=%" PRIu64 ")\n",
                    name.c_str(), cur_tick, ev->target->getDescription().c_str(),
                    ev->priority, ev->seq);
            ev->target->process();
            dispatch_count++;

            evaluateConditions();
            ev.reset();
            if (dispatch_hook) dispatch_hook();
        }
    } catch (const std::exception& e) {
        run_state = RunState::Terminated;
        DPRINTF(EVENT, "[%s] t=%" PRId64 " run terminated: %s\n", name.c_str(), cur_tick, e.what());
        throw;
    }

    if (run_state == RunState::Running) run_state = RunState::Paused;
}

void EventManager::pause() {
    if (run_state == RunState::Running) pause_requested = true;
}

void EventManager::resume(Tick end_tick) {
    if (run_state != RunState::Paused) return;
    run(end_tick);
}

void EventManager::terminate() {
    event_queue.clear();
    cond_events.clear();
    pause_requested = true;
    run_state = RunState::Terminated;
}

void EventManager::clear() {
    event_queue.clear();
    cond_events.clear();
    cur_tick = 0;
    dispatch_count = 0;
    pause_requested = false;
    run_state = RunState::Idle;
}

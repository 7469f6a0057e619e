// test/test_event_manager.cc
#include <gtest/gtest.h>
#include "../include/event_manager.hh"
#include "../include/error_exception.hh"

#include <string>
#include <vector>

using RunState = EventManager::RunState;

TEST(EventManagerTest, DispatchOrder) {
    EventManager em;
    std::vector<std::string> log;

    em.scheduleTicks(10, 5, true, [&]() { log.push_back("t10p5"); });
    em.scheduleTicks(10, 1, true, [&]() { log.push_back("t10p1"); });
    em.scheduleTicks(3, 9, true, [&]() { log.push_back("t3"); });
    em.scheduleTicks(10, 5, false, [&]() { log.push_back("t10p5lifo"); });

    em.run(MAX_TICK);
    EXPECT_EQ(log, (std::vector<std::string>{"t3", "t10p1", "t10p5lifo", "t10p5"}));
    EXPECT_EQ(em.simTicks(), 10);
    EXPECT_EQ(em.getDispatchCount(), 4u);
}

// 在当前时刻以 fifo 方式重新调度自己，不会饿死同一时刻的其他事件
TEST(EventManagerTest, FifoRescheduleDoesNotStarve) {
    EventManager em;
    std::vector<std::string> log;
    int count = 0;

    std::function<void()> self = [&]() {
        log.push_back("X");
        if (++count < 2) em.scheduleTicks(0, 5, true, self);
    };
    em.scheduleTicks(0, 5, true, self);
    em.scheduleTicks(0, 5, true, [&]() { log.push_back("Y"); });

    em.run(MAX_TICK);
    EXPECT_EQ(log, (std::vector<std::string>{"X", "Y", "X"}));
}

TEST(EventManagerTest, KillIsIdempotent) {
    EventManager em;
    EventHandle h;
    bool fired = false;

    em.scheduleTicks(100, 5, true, [&]() { fired = true; }, &h);
    EXPECT_TRUE(h.isScheduled());

    em.killEvent(&h);
    EXPECT_FALSE(h.isScheduled());
    EXPECT_NO_THROW(em.killEvent(&h));

    em.run(MAX_TICK);
    EXPECT_FALSE(fired);
    EXPECT_EQ(em.getEventCount(), 0u);
}

TEST(EventManagerTest, KillAfterFireIsNoop) {
    EventManager em;
    EventHandle h;
    int fired = 0;

    em.scheduleTicks(5, 5, true, [&]() { fired++; }, &h);
    em.run(MAX_TICK);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(h.isScheduled());
    EXPECT_NO_THROW(em.killEvent(&h));

    // 句柄可以复用
    em.scheduleTicks(5, 5, true, [&]() { fired++; }, &h);
    em.run(MAX_TICK);
    EXPECT_EQ(fired, 2);
}

TEST(EventManagerTest, HandleInUseRejected) {
    EventManager em;
    EventHandle h;
    em.scheduleTicks(5, 5, true, []() {}, &h);
    EXPECT_THROW(em.scheduleTicks(6, 5, true, []() {}, &h), ErrorException);
}

TEST(EventManagerTest, InterruptRunsTargetNow) {
    EventManager em;
    EventHandle h;
    std::vector<Tick> fired_at;

    em.scheduleTicks(100, 5, true, [&]() { fired_at.push_back(em.simTicks()); }, &h);
    em.scheduleTicks(10, 5, true, [&]() { em.interruptEvent(&h); });

    em.run(MAX_TICK);
    EXPECT_EQ(fired_at, (std::vector<Tick>{10}));
    EXPECT_FALSE(h.isScheduled());

    // 未调度的句柄：无操作
    EXPECT_NO_THROW(em.interruptEvent(&h));
}

TEST(EventManagerTest, WaitUntilResumesInRegistrationOrder) {
    EventManager em;
    EventHandle h1, h2;
    bool flag = false;
    std::vector<std::string> log;

    em.waitUntil([&]() { return flag; }, &h1, [&]() { log.push_back("W1@" + std::to_string(em.simTicks())); });
    em.waitUntil([&]() { return flag; }, &h2, [&]() { log.push_back("W2@" + std::to_string(em.simTicks())); });
    EXPECT_EQ(em.getConditionalCount(), 2u);

    em.scheduleTicks(5, 5, true, [&]() { flag = true; });
    em.scheduleTicks(5, 6, true, [&]() { log.push_back("after"); });

    em.run(MAX_TICK);
    // 条件事件优先级为 0，先于同一时刻的其他事件
    EXPECT_EQ(log, (std::vector<std::string>{"W1@5", "W2@5", "after"}));
    EXPECT_EQ(em.getConditionalCount(), 0u);
}

TEST(EventManagerTest, WaitUntilAlreadyTrueRunsImmediately) {
    EventManager em;
    EventHandle h;
    bool ran = false;
    em.waitUntil([]() { return true; }, &h, [&]() { ran = true; });
    EXPECT_TRUE(ran);
    EXPECT_FALSE(h.isScheduled());
}

TEST(EventManagerTest, KillConditionalWait) {
    EventManager em;
    EventHandle h;
    bool flag = false;
    bool ran = false;

    em.waitUntil([&]() { return flag; }, &h, [&]() { ran = true; });
    em.killEvent(&h);
    EXPECT_EQ(em.getConditionalCount(), 0u);

    em.scheduleTicks(1, 5, true, [&]() { flag = true; });
    em.run(MAX_TICK);
    EXPECT_FALSE(ran);
}

TEST(EventManagerTest, RunPauseResumeTerminate) {
    EventManager em;
    std::vector<Tick> fired_at;

    EXPECT_EQ(em.getRunState(), RunState::Idle);
    em.scheduleTicks(10, 5, true, [&]() { fired_at.push_back(em.simTicks()); em.pause(); });
    em.scheduleTicks(20, 5, true, [&]() { fired_at.push_back(em.simTicks()); });
    em.scheduleTicks(200, 5, true, [&]() { fired_at.push_back(em.simTicks()); });

    em.run(100);
    EXPECT_EQ(em.getRunState(), RunState::Paused);
    EXPECT_EQ(em.simTicks(), 10);
    EXPECT_EQ(fired_at, (std::vector<Tick>{10}));

    em.resume(100);
    EXPECT_EQ(em.getRunState(), RunState::Paused);
    EXPECT_EQ(em.simTicks(), 100);
    EXPECT_EQ(fired_at, (std::vector<Tick>{10, 20}));

    em.terminate();
    EXPECT_EQ(em.getRunState(), RunState::Terminated);
    EXPECT_EQ(em.getEventCount(), 0u);

    // 终止后不再运行
    em.run(MAX_TICK);
    EXPECT_EQ(fired_at.size(), 2u);
}

TEST(EventManagerTest, ErrorTerminatesRun) {
    EventManager em;
    bool later = false;

    em.scheduleTicks(5, 5, true, []() { throw ErrorException("Widget", "broken"); });
    em.scheduleTicks(6, 5, true, [&]() { later = true; });

    try {
        em.run(MAX_TICK);
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.getEntityName(), "Widget");
        EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
    }
    EXPECT_EQ(em.getRunState(), RunState::Terminated);
    EXPECT_FALSE(later);
}

TEST(EventManagerTest, NegativeDelayRejected) {
    EventManager em;
    EXPECT_THROW(em.scheduleTicks(-1, 5, true, []() {}), ErrorException);
}

TEST(EventManagerTest, SecondsConversion) {
    EventManager em("em", 1.0e6);
    EXPECT_EQ(em.secondsToNearestTick(1.5), 1500000);
    EXPECT_EQ(em.secondsToNearestTick(1.0e-7), 0);
    EXPECT_DOUBLE_EQ(em.ticksToSeconds(2500000), 2.5);

    em.scheduleSeconds(2.0, 5, true, []() {});
    em.run(MAX_TICK);
    EXPECT_DOUBLE_EQ(em.simSeconds(), 2.0);

    // 开始运行后不能修改时间精度
    EXPECT_THROW(em.setTicksPerSecond(1000.0), ErrorException);
}

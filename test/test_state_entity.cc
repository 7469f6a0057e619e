// test/test_state_entity.cc
#include <gtest/gtest.h>
#include "mock_entities.hh"

// A: 0-10, B: 10-30, C: 30-60, B: 60-100
static void scheduleStates(SimContext& ctx, MockStateEntity* s) {
    at(ctx, 10, [s]() { s->setPresentState("B"); });
    at(ctx, 30, [s]() { s->setPresentState("C"); });
    at(ctx, 60, [s]() { s->setPresentState("B"); });
}

static double sumOfStateTimes(const MockStateEntity* s, double simTime) {
    double total = 0.0;
    for (const auto& state : s->getStateNames()) {
        total += s->getTimeInState(simTime, state);
    }
    return total;
}

TEST(StateEntityTest, InitialState) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    ctx.startRun();
    EXPECT_EQ(s->getPresentState(), "A");
    EXPECT_FALSE(s->isWorking());
}

TEST(StateEntityTest, TimesSumToElapsedTime) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    ctx.startRun();
    scheduleStates(ctx, s);
    ctx.run(100);

    EXPECT_DOUBLE_EQ(s->getTimeInState(100, "A"), 10.0);
    EXPECT_DOUBLE_EQ(s->getTimeInState(100, "B"), 60.0);
    EXPECT_DOUBLE_EQ(s->getTimeInState(100, "C"), 30.0);
    EXPECT_DOUBLE_EQ(sumOfStateTimes(s, 100), 100.0);
    EXPECT_DOUBLE_EQ(s->getWorkingTime(), 60.0);
    EXPECT_EQ(s->getOutput("State", 100).get<std::string>(), "B");
}

// 初始化阶段结束后统计清零，但累计工作时间保留
TEST(StateEntityTest, ClearStatisticsAfterInitialization) {
    SimContext ctx;
    ctx.setInitializationTime(20);
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    ctx.startRun();
    scheduleStates(ctx, s);
    ctx.run(100);

    EXPECT_DOUBLE_EQ(s->getTimeInState(100, "A"), 0.0);
    EXPECT_DOUBLE_EQ(s->getTimeInState(100, "B"), 50.0);
    EXPECT_DOUBLE_EQ(s->getTimeInState(100, "C"), 30.0);
    EXPECT_DOUBLE_EQ(sumOfStateTimes(s, 100), 80.0);
    EXPECT_DOUBLE_EQ(s->getWorkingTime(), 60.0);
}

TEST(StateEntityTest, CycleStats) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    ctx.startRun();
    scheduleStates(ctx, s);
    at(ctx, 40, [s]() { s->collectCycleStats(); });
    ctx.run(100);

    Tick tps = static_cast<Tick>(ctx.getEventManager().getTicksPerSecond());
    EXPECT_EQ(s->getCompletedCycleTicks("B"), 20 * tps);
    EXPECT_EQ(s->getCompletedCycleTicks("C"), 10 * tps);
    EXPECT_EQ(s->getCurrentCycleTicks(ctx.getEventManager().simTicks(), "B"), 40 * tps);
    EXPECT_EQ(s->getCurrentCycleTicks(ctx.getEventManager().simTicks(), "C"), 20 * tps);
    EXPECT_EQ(s->getTotalTicks(ctx.getEventManager().simTicks()), 100 * tps);
}

TEST(StateEntityTest, ListenerNotifiedOnChangeOnly) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    auto* l = ctx.createEntity<RecordingListener>("L1");
    l->watched = s;
    ctx.startRun();

    at(ctx, 10, [s]() { s->setPresentState("B"); });
    at(ctx, 11, [s]() { s->setPresentState("B"); });
    at(ctx, 12, [s]() { s->setPresentState("C"); });
    ctx.run(20);

    ASSERT_EQ(l->changes.size(), 2u);
    EXPECT_EQ(l->changes[0], std::make_pair(std::string("A"), std::string("B")));
    EXPECT_EQ(l->changes[1], std::make_pair(std::string("B"), std::string("C")));
}

// 初始化前用 addListener 注册的监听者在初始化后仍然有效
TEST(StateEntityTest, AddedListenerSurvivesInitialization) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    auto* added = ctx.createEntity<RecordingListener>("L1");
    auto* found = ctx.createEntity<RecordingListener>("L2");
    found->watched = s;
    s->addListener(added);
    ctx.startRun();
    EXPECT_EQ(s->getListeners().size(), 2u);

    at(ctx, 10, [s]() { s->setPresentState("B"); });
    ctx.run(20);

    ASSERT_EQ(added->changes.size(), 1u);
    ASSERT_EQ(found->changes.size(), 1u);
    EXPECT_EQ(added->changes[0], std::make_pair(std::string("A"), std::string("B")));

    s->removeListener(added);
    EXPECT_EQ(s->getListeners().size(), 1u);
}

TEST(StateEntityTest, InvalidStateIsError) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    ctx.startRun();
    EXPECT_THROW(s->setPresentState("Q"), ErrorException);
    EXPECT_EQ(s->getPresentState(), "A");
}

TEST(StateEntityTest, InvalidInitialStateRejectedAtValidate) {
    SimContext ctx;
    ctx.createEntity<BadInitialStateEntity>("Bad");
    try {
        ctx.startRun();
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.getEntityName(), "Bad");
    }
}

TEST(StateEntityTest, ConfiguredWorkingStateList) {
    SimContext ctx;
    auto* s = ctx.createEntity<MockStateEntity>("S1");
    s->configure(R"({"working_state_list": ["C"]})"_json);
    ctx.startRun();
    scheduleStates(ctx, s);
    ctx.run(100);

    EXPECT_DOUBLE_EQ(s->getWorkingTime(), 30.0);
}

// test/test_pack_gate.cc
#include <gtest/gtest.h>
#include "mock_entities.hh"
#include "../include/modules/entity_gate.hh"
#include "../include/modules/pack.hh"
#include "../include/modules/entity_generator.hh"
#include "../include/modules/entity_sink.hh"

// 门关闭时排队，打开后按 release_delay 依次放行；空闲时直接通过
TEST(EntityGateTest, HoldsWhileClosedThenReleases) {
    SimContext ctx;
    buildModel(ctx, R"({
        "entities": [
            { "name": "GateQ", "type": "Queue" },
            { "name": "Sig", "type": "SignalThreshold", "initial_open": false },
            { "name": "Gate", "type": "EntityGate", "wait_queue": "GateQ", "operating_thresholds": "Sig",
              "release_delay": 2, "next_component": "Sink" },
            { "name": "Sink", "type": "CollectingSink" }
        ]
    })"_json);
    auto* gate = ctx.getEntity<EntityGate>("Gate");
    auto* sig = ctx.getEntity<SignalThreshold>("Sig");
    auto* sink = ctx.getEntity<CollectingSink>("Sink");
    ctx.startRun();

    at(ctx, 0, [&ctx, gate]() {
        gate->addEntity(makeEntity(ctx, "e1"));
        gate->addEntity(makeEntity(ctx, "e2"));
    });
    at(ctx, 5, [gate]() {
        EXPECT_EQ(gate->getWaitQueue()->getCount(), 2u);
        EXPECT_EQ(gate->getPresentState(), "Stopped");
    }, 10);
    at(ctx, 10, [sig]() { sig->setOpen(true); });
    at(ctx, 20, [&ctx, gate]() { gate->addEntity(makeEntity(ctx, "e3")); });
    ctx.run(30);

    ASSERT_EQ(sink->received.size(), 3u);
    EXPECT_EQ(sink->received[0]->getName(), "e1");
    EXPECT_EQ(sink->received[1]->getName(), "e2");
    EXPECT_EQ(sink->received[2]->getName(), "e3");
    EXPECT_DOUBLE_EQ(sink->arrival_times[0], 12.0);
    EXPECT_DOUBLE_EQ(sink->arrival_times[1], 14.0);
    EXPECT_DOUBLE_EQ(sink->arrival_times[2], 20.0);
    EXPECT_TRUE(gate->isIdle());
}

TEST(PackTest, PackAndUnpack) {
    SimContext ctx;
    buildModel(ctx, R"({
        "entities": [
            { "name": "PackQ", "type": "Queue" },
            { "name": "Packer", "type": "Pack", "wait_queue": "PackQ", "number_of_entities": 2,
              "service_time": 1, "next_component": "Unpacker" },
            { "name": "UnpackQ", "type": "Queue" },
            { "name": "Unpacker", "type": "Unpack", "wait_queue": "UnpackQ", "next_component": "Sink" },
            { "name": "Sink", "type": "CollectingSink" }
        ]
    })"_json);
    auto* packer = ctx.getEntity<Pack>("Packer");
    auto* sink = ctx.getEntity<CollectingSink>("Sink");
    ctx.startRun();

    at(ctx, 0, [&ctx, packer]() {
        for (int i = 1; i <= 3; ++i) packer->addEntity(makeEntity(ctx, "e" + std::to_string(i)));
    });
    at(ctx, 3, [&ctx, packer]() {
        // 第一个容器已拆开并销毁
        EXPECT_EQ(ctx.getEntity("Packer_Container1"), nullptr);
        EXPECT_EQ(packer->getWaitQueue()->getCount(), 1u);
    }, 10);
    at(ctx, 5, [&ctx, packer]() { packer->addEntity(makeEntity(ctx, "e4")); });
    ctx.run(20);

    ASSERT_EQ(sink->received.size(), 4u);
    EXPECT_EQ(sink->received[0]->getName(), "e1");
    EXPECT_EQ(sink->received[1]->getName(), "e2");
    EXPECT_EQ(sink->received[3]->getName(), "e4");
    EXPECT_DOUBLE_EQ(sink->arrival_times[0], 1.0);
    EXPECT_DOUBLE_EQ(sink->arrival_times[1], 1.0);
    EXPECT_DOUBLE_EQ(sink->arrival_times[2], 6.0);
    EXPECT_DOUBLE_EQ(sink->arrival_times[3], 6.0);
}

TEST(PackTest, UnpackRejectsPlainEntity) {
    SimContext ctx;
    buildModel(ctx, R"({
        "entities": [
            { "name": "UnpackQ", "type": "Queue" },
            { "name": "Unpacker", "type": "Unpack", "wait_queue": "UnpackQ", "next_component": "Sink" },
            { "name": "Sink", "type": "CollectingSink" }
        ]
    })"_json);
    auto* unpacker = ctx.getEntity<Unpack>("Unpacker");
    ctx.startRun();

    at(ctx, 1, [&ctx, unpacker]() { unpacker->addEntity(makeEntity(ctx, "plain")); });
    EXPECT_THROW(ctx.run(10), ErrorException);
}

TEST(EntityGeneratorTest, GeneratesUpToMaxNumber) {
    SimContext ctx;
    buildModel(ctx, R"({
        "entities": [
            { "name": "Gen", "type": "EntityGenerator", "inter_arrival_time": 2, "max_number": 5,
              "attributes": { "type": [1, 2] }, "next_component": "Sink" },
            { "name": "Sink", "type": "CollectingSink" }
        ]
    })"_json);
    auto* gen = ctx.getEntity<EntityGenerator>("Gen");
    auto* sink = ctx.getEntity<CollectingSink>("Sink");
    ctx.run(100);

    EXPECT_EQ(gen->getNumberGenerated(), 5u);
    ASSERT_EQ(sink->received.size(), 5u);
    EXPECT_EQ(sink->received[0]->getName(), "Gen_1");
    EXPECT_EQ(sink->received[4]->getName(), "Gen_5");
    EXPECT_DOUBLE_EQ(sink->arrival_times[0], 2.0);
    EXPECT_DOUBLE_EQ(sink->arrival_times[4], 10.0);
    EXPECT_DOUBLE_EQ(sink->received[0]->getAttribute("type"), 1.0);
    EXPECT_DOUBLE_EQ(sink->received[1]->getAttribute("type"), 2.0);
    EXPECT_TRUE(sink->received[0]->isGenerated());
}

TEST(EntityGeneratorTest, SinkDisposesEntities) {
    SimContext ctx;
    buildModel(ctx, R"({
        "entities": [
            { "name": "Gen", "type": "EntityGenerator", "first_arrival_time": 0, "inter_arrival_time": 1,
              "entities_per_arrival": 2, "max_number": 6, "next_component": "Sink" },
            { "name": "Sink", "type": "EntitySink" }
        ]
    })"_json);
    auto* sink = ctx.getEntity<EntitySink>("Sink");
    ctx.run(10);

    EXPECT_EQ(sink->getNumberProcessed(), 6u);
    EXPECT_EQ(ctx.getEntity("Gen_1"), nullptr);
    EXPECT_EQ(ctx.getEntitiesOfType<SimEntity>().size(), 0u);
    // 销毁的工件已释放
    EXPECT_EQ(ctx.getDeadEntityCount(), 0u);
    EXPECT_EQ(ctx.getEntityCount(), 2u);
}

// test/test_entity_registration.cc
#include <gtest/gtest.h>
#include "mock_entities.hh"
#include "../include/modules/server.hh"

// 测试专用实体
class TestEntityA : public Entity {
public:
    TestEntityA(const std::string& n, SimContext* ctx) : Entity(n, ctx) {}
};

class TestEntityB : public Entity {
public:
    int value = 0;
    TestEntityB(const std::string& n, SimContext* ctx) : Entity(n, ctx) {}

    void configure(const json& cfg) override {
        if (!cfg.contains("value")) throw InputErrorException("Missing required input: value");
        value = cfg["value"].get<int>();
    }
};

TEST(EntityRegistrationTest, RegisterAndUnregisterSingleType) {
    EntityFactory::clearAllTypes();

    // 注册
    EntityFactory::registerType<TestEntityA>("TestEntityA");
    EXPECT_EQ(EntityFactory::getRegisteredTypes().size(), 1);
    EXPECT_TRUE(EntityFactory::isRegistered("TestEntityA"));

    // 注销
    bool success = EntityFactory::unregisterType("TestEntityA");
    EXPECT_TRUE(success);
    EXPECT_EQ(EntityFactory::getRegisteredTypes().size(), 0);

    // 再次注销应返回 false
    success = EntityFactory::unregisterType("TestEntityA");
    EXPECT_FALSE(success);
}

TEST(EntityRegistrationTest, ClearAllTypes) {
    EntityFactory::registerType<TestEntityA>("TestEntityA");
    EntityFactory::registerType<TestEntityB>("TestEntityB");
    EXPECT_GE(EntityFactory::getRegisteredTypes().size(), 2);

    EntityFactory::clearAllTypes();
    EXPECT_EQ(EntityFactory::getRegisteredTypes().size(), 0);
}

TEST(EntityRegistrationTest, BuiltinTypes) {
    EntityFactory::clearAllTypes();
    EntityFactory::registerBuiltinTypes();

    for (const char* type : {"EntityGenerator", "EntitySink", "Queue", "Server", "EntityGate", "Resource",
                             "Seize", "Release", "Pack", "Unpack", "SignalThreshold", "TimeSeries",
                             "TimeSeriesThreshold", "DowntimeEntity"}) {
        EXPECT_TRUE(EntityFactory::isRegistered(type)) << type;
    }
    EXPECT_EQ(EntityFactory::getRegisteredTypes().size(), 14);
}

TEST(EntityRegistrationTest, InstantiateAfterRegistration) {
    SimContext ctx;
    EntityFactory::registerType<TestEntityB>("TestEntityB");

    json config = R"({
        "entities": [
            { "name": "inst0", "type": "TestEntityB", "value": 7 }
        ]
    })"_json;

    EntityFactory factory(&ctx);
    factory.instantiateAll(config);

    Entity* obj = factory.getInstance("inst0");
    ASSERT_NE(obj, nullptr);
    EXPECT_EQ(obj->getName(), "inst0");
    EXPECT_EQ(dynamic_cast<TestEntityB*>(obj)->value, 7);
    EXPECT_EQ(factory.getAllInstances().size(), 1u);

    // 清理
    EntityFactory::unregisterType("TestEntityB");
}

TEST(EntityRegistrationTest, UnknownTypeNamesEntity) {
    SimContext ctx;
    EntityFactory factory(&ctx);
    try {
        factory.instantiateAll(R"({ "entities": [ { "name": "widget", "type": "NoSuchType" } ] })"_json);
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.getEntityName(), "widget");
        EXPECT_NE(std::string(e.what()).find("NoSuchType"), std::string::npos);
    }
}

TEST(EntityRegistrationTest, ConfigureErrorNamesEntity) {
    SimContext ctx;
    EntityFactory::registerType<TestEntityB>("TestEntityB");
    EntityFactory factory(&ctx);
    try {
        factory.instantiateAll(R"({ "entities": [ { "name": "b1", "type": "TestEntityB" } ] })"_json);
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.getEntityName(), "b1");
        EXPECT_NE(std::string(e.what()).find("value"), std::string::npos);
    }
    EntityFactory::unregisterType("TestEntityB");
}

TEST(EntityRegistrationTest, DuplicateNameRejected) {
    SimContext ctx;
    EntityFactory::registerType<TestEntityA>("TestEntityA");
    EntityFactory factory(&ctx);
    EXPECT_THROW(factory.instantiateAll(R"({
        "entities": [
            { "name": "same", "type": "TestEntityA" },
            { "name": "same", "type": "TestEntityA" }
        ]
    })"_json), ErrorException);
    EntityFactory::unregisterType("TestEntityA");
}

// 引用可以指向配置中后定义的实体
TEST(EntityRegistrationTest, ForwardReferencesResolved) {
    SimContext ctx;
    buildModel(ctx, R"({
        "entities": [
            { "name": "Srv", "type": "Server", "wait_queue": "Q", "service_time": 1, "next_component": "Sink" },
            { "name": "Sink", "type": "CollectingSink" },
            { "name": "Q", "type": "Queue" }
        ]
    })"_json);

    auto* srv = ctx.getEntity<Server>("Srv");
    ASSERT_NE(srv, nullptr);
    EXPECT_EQ(srv->getWaitQueue(), ctx.getEntity("Q"));
    EXPECT_EQ(srv->getNextComponent(), ctx.getEntity("Sink"));
}

TEST(EntityRegistrationTest, WrongReferenceTypeRejected) {
    SimContext ctx;
    try {
        buildModel(ctx, R"({
            "entities": [
                { "name": "Q", "type": "Queue" },
                { "name": "Srv", "type": "Server", "wait_queue": "Sink", "service_time": 1, "next_component": "Sink" },
                { "name": "Sink", "type": "CollectingSink" }
            ]
        })"_json);
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.getEntityName(), "Srv");
    }
}

TEST(EntityRegistrationTest, SimulationSection) {
    SimContext ctx;
    buildModel(ctx, R"({
        "simulation": { "ticks_per_second": 1000, "initialization_duration": 5, "random_seed": 42 },
        "entities": []
    })"_json);

    EXPECT_DOUBLE_EQ(ctx.getEventManager().getTicksPerSecond(), 1000.0);
    EXPECT_DOUBLE_EQ(ctx.getInitializationTime(), 5.0);
    EXPECT_EQ(ctx.getRandomSeed(), 42u);

    SimContext ctx2;
    EXPECT_THROW(buildModel(ctx2, R"({ "simulation": { "ticks_per_second": -1 } })"_json), ErrorException);

    SimContext ctx3;
    try {
        buildModel(ctx3, R"({ "simulation": { "initialization_duration": -2 } })"_json);
        FAIL() << "expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.getEntityName(), "simulation");
    }
}

// test/test_json_includer.cc
#include <gtest/gtest.h>
#include "../include/utils/json_includer.hh"
#include <fstream>

class JsonIncluderTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 创建临时目录和文件
        system("mkdir -p tmp_includer/configs/parts");
        std::ofstream base("tmp_includer/configs/base.json");
        base << R"({
            "include": ["common.json", "parts/servers.json"],
            "simulation": { "run_duration": 50 },
            "entities": [
                { "name": "Sink", "type": "EntitySink" }
            ],
            "extra": "value"
        })";
        base.close();

        std::ofstream common("tmp_includer/configs/common.json");
        common << R"({
            "simulation": { "run_duration": 999 },
            "entities": [
                { "name": "Q1", "type": "Queue" }
            ]
        })";
        common.close();

        std::ofstream servers("tmp_includer/configs/parts/servers.json");
        servers << R"({
            "entities": [
                { "name": "Srv1", "type": "Server", "wait_queue": "Q1", "service_time": 1, "next_component": "Sink" }
            ]
        })";
        servers.close();

        std::ofstream loop_a("tmp_includer/configs/loop_a.json");
        loop_a << R"({ "include": "loop_b.json" })";
        loop_a.close();

        std::ofstream loop_b("tmp_includer/configs/loop_b.json");
        loop_b << R"({ "include": "parts/../loop_a.json" })";
        loop_b.close();

        // 菱形包含：left 和 right 都包含 shared
        std::ofstream diamond("tmp_includer/configs/diamond.json");
        diamond << R"({ "include": ["parts/left.json", "parts/right.json"] })";
        diamond.close();

        std::ofstream left("tmp_includer/configs/parts/left.json");
        left << R"({ "include": "shared.json", "entities": [ { "name": "L", "type": "Queue" } ] })";
        left.close();

        std::ofstream right("tmp_includer/configs/parts/right.json");
        right << R"({ "include": "shared.json", "entities": [ { "name": "R", "type": "Queue" } ] })";
        right.close();

        std::ofstream shared("tmp_includer/configs/parts/shared.json");
        shared << R"({ "simulation": { "random_seed": 3 } })";
        shared.close();
    }

    void TearDown() override {
        system("rm -rf tmp_includer");
    }
};

TEST_F(JsonIncluderTest, IncludeMergesContent) {
    json config = JsonIncluder::loadAndInclude("tmp_includer/configs/base.json");

    EXPECT_FALSE(config.contains("include"));
    EXPECT_TRUE(config.contains("entities"));
    EXPECT_TRUE(config.contains("extra"));
    EXPECT_EQ(config["extra"], "value");

    // 当前文件的键优先
    EXPECT_EQ(config["simulation"]["run_duration"], 50);
}

// 数组拼接：被包含的条目在前，按 include 顺序
TEST_F(JsonIncluderTest, EntityListsConcatenated) {
    json config = JsonIncluder::loadAndInclude("tmp_includer/configs/base.json");

    ASSERT_EQ(config["entities"].size(), 3);
    EXPECT_EQ(config["entities"][0]["name"], "Q1");
    EXPECT_EQ(config["entities"][1]["name"], "Srv1");
    EXPECT_EQ(config["entities"][2]["name"], "Sink");
}

TEST_F(JsonIncluderTest, RelativePathResolution) {
    json config = JsonIncluder::loadAndInclude("tmp_includer/configs/base.json");
    bool found = false;
    for (const auto& ent : config["entities"]) {
        if (ent["name"] == "Srv1") found = true;
    }
    EXPECT_TRUE(found);
}

// 报告完整的包含环
TEST_F(JsonIncluderTest, CyclicIncludeRejected) {
    try {
        JsonIncluder::loadAndInclude("tmp_includer/configs/loop_a.json");
        FAIL() << "expected InputErrorException";
    } catch (const InputErrorException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Include cycle"), std::string::npos);
        size_t a = msg.find("loop_a.json -> ");
        size_t b = msg.find("loop_b.json -> ");
        ASSERT_NE(a, std::string::npos);
        ASSERT_NE(b, std::string::npos);
        EXPECT_LT(a, b);
        EXPECT_EQ(msg.compare(msg.size() - 11, 11, "loop_a.json"), 0);
    }
}

// 同一文件被两个分支包含不是环
TEST_F(JsonIncluderTest, SharedIncludeIsNotCycle) {
    json config;
    ASSERT_NO_THROW(config = JsonIncluder::loadAndInclude("tmp_includer/configs/diamond.json"));
    ASSERT_EQ(config["entities"].size(), 2);
    EXPECT_EQ(config["entities"][0]["name"], "L");
    EXPECT_EQ(config["entities"][1]["name"], "R");
    EXPECT_EQ(config["simulation"]["random_seed"], 3);
}

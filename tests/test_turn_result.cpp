#include <gtest/gtest.h>
#include "gameplay/TurnResult.hpp"
#include "ecs/EntityRegistry.hpp"

using namespace delve;

class TurnEventJsonTest : public ::testing::Test {
protected:
    EntityRegistry registry;
    Entity a = registry.create();
    Entity b = registry.create();

    static nlohmann::json toJson(const TurnEvent& event) {
        nlohmann::json j;
        to_json(j, event);
        return j;
    }
};

TEST_F(TurnEventJsonTest, Moved) {
    auto j = toJson(MovedEvent{a, {1, 2}, {2, 2}});
    EXPECT_EQ(j["type"], "moved");
    EXPECT_EQ(j["entity"], entityId(a));
    EXPECT_EQ(j["from"], nlohmann::json::array({1, 2}));
    EXPECT_EQ(j["to"], nlohmann::json::array({2, 2}));
}

TEST_F(TurnEventJsonTest, Damaged) {
    auto j = toJson(DamagedEvent{b, 5, a});
    EXPECT_EQ(j["type"], "damaged");
    EXPECT_EQ(j["entity"], entityId(b));
    EXPECT_EQ(j["amount"], 5);
    EXPECT_EQ(j["source"], entityId(a));
}

TEST_F(TurnEventJsonTest, Died) {
    auto j = toJson(DiedEvent{b});
    EXPECT_EQ(j["type"], "died");
    EXPECT_EQ(j["entity"], entityId(b));
    EXPECT_EQ(j.size(), 2u);
}

TEST_F(TurnEventJsonTest, Blocked) {
    auto j = toJson(BlockedEvent{a, {0, -1}});
    EXPECT_EQ(j["type"], "blocked");
    EXPECT_EQ(j["target"], nlohmann::json::array({0, -1}));
}

TEST_F(TurnEventJsonTest, Missed) {
    auto j = toJson(MissedEvent{a, b});
    EXPECT_EQ(j["type"], "missed");
    EXPECT_EQ(j["attacker"], entityId(a));
    EXPECT_EQ(j["target"], entityId(b));
}

TEST_F(TurnEventJsonTest, Healed) {
    auto j = toJson(HealedEvent{a, 7});
    EXPECT_EQ(j["type"], "healed");
    EXPECT_EQ(j["amount"], 7);
}

TEST_F(TurnEventJsonTest, GenerationIsPartOfTheId) {
    ASSERT_EQ(registry.destroy(a), CoreResult::Success);
    Entity reused = registry.create();
    ASSERT_EQ(entityIndex(reused), entityIndex(a));

    EXPECT_NE(toJson(DiedEvent{a})["entity"], toJson(DiedEvent{reused})["entity"]);
}

TEST(TurnResultTest, EmptyResult) {
    TurnResult result(4);
    EXPECT_EQ(result.turn(), 4u);
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(result.size(), 0u);
    EXPECT_EQ(result.count<MovedEvent>(), 0u);

    auto j = result.toJson();
    EXPECT_EQ(j["turn"], 4);
    EXPECT_TRUE(j["events"].is_array());
    EXPECT_TRUE(j["events"].empty());
}

TEST(TurnResultTest, SerializeIsCompactJson) {
    TurnResult result(2);
    EXPECT_EQ(result.serialize(), R"({"events":[],"turn":2})");

    nlohmann::json j = result;
    EXPECT_EQ(j, result.toJson());
}

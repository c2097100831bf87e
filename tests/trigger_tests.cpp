#include <gtest/gtest.h>
#include "domain/FrostDomain.h"
#include "kernel/Mutation.h"
#include "modules/ThresholdTrigger.h"
#include <random>
#include <stdexcept>

namespace {
void addFaction(WorldGraph& graph, const std::string& id) {
    EntitySpec spec;
    spec.id = id;
    spec.kind = "faction";
    spec.subtype = "political";
    spec.status = "active";
    graph.createEntity(spec);
}
}

// Three factions, each at war with the other two, form one cluster
TEST(ThresholdTriggerTest, WarringFactionsShareClusterTag) {
    WorldGraph graph;
    addFaction(graph, "fa");
    addFaction(graph, "fb");
    addFaction(graph, "fc");
    graph.addRelationship("at_war_with", "fa", "fb");
    graph.addRelationship("at_war_with", "fb", "fc");
    graph.addRelationship("at_war_with", "fa", "fc");

    ThresholdTrigger trigger(warBrewingTrigger());
    std::mt19937_64 rng(1);
    const SystemResult result = trigger.apply(graph, 1.0, rng);
    commitMutation(graph, result);

    const std::string tag = graph.getEntity("fa")->tags.getString("war_brewing");
    EXPECT_EQ(tag.rfind("cluster_", 0), 0u) << tag;
    EXPECT_EQ(graph.getEntity("fb")->tags.getString("war_brewing"), tag);
    EXPECT_EQ(graph.getEntity("fc")->tags.getString("war_brewing"), tag);
    // One pressure bump per cluster
    EXPECT_DOUBLE_EQ(graph.pressures().pendingDelta("conflict"), 3.0);

    // Tagged factions are on cooldown
    EXPECT_TRUE(trigger.findMatches(graph).empty());
}

TEST(ThresholdTriggerTest, SeparateWarsGetSeparateClusters) {
    WorldGraph graph;
    for (const char* id : {"fa", "fb", "fc", "fd", "fe"}) addFaction(graph, id);
    graph.addRelationship("at_war_with", "fa", "fb");
    graph.addRelationship("at_war_with", "fc", "fd");

    ThresholdTrigger trigger(warBrewingTrigger());
    const auto matches = trigger.findMatches(graph);
    ASSERT_EQ(matches.size(), 4u);
    const auto clusters = trigger.buildClusters(graph, matches);
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].size(), 2u);
    EXPECT_EQ(clusters[1].size(), 2u);

    std::mt19937_64 rng(1);
    commitMutation(graph, trigger.apply(graph, 1.0, rng));
    EXPECT_EQ(graph.getEntity("fa")->tags.getString("war_brewing"), graph.getEntity("fb")->tags.getString("war_brewing"));
    EXPECT_NE(graph.getEntity("fa")->tags.getString("war_brewing"), graph.getEntity("fc")->tags.getString("war_brewing"));
    EXPECT_FALSE(graph.getEntity("fe")->tags.has("war_brewing"));
    EXPECT_DOUBLE_EQ(graph.pressures().pendingDelta("conflict"), 6.0);
}

// Entities sharing a non-matching neighbour join the same cluster
TEST(ThresholdTriggerTest, SharedEndpointJoinsCluster) {
    WorldGraph graph;
    addFaction(graph, "fa");
    addFaction(graph, "fb");
    EntitySpec loc;
    loc.id = "loc";
    loc.kind = "location";
    graph.createEntity(loc);
    graph.addRelationship("controls", "fa", "loc");
    graph.addRelationship("controls", "fb", "loc");

    ThresholdTrigger::Config cfg;
    cfg.id = "rivals_for_ground";
    cfg.name = "Rivals for Ground";
    cfg.filter.kind = "faction";
    cfg.clusterMode = ClusterMode::ByRelationship;
    cfg.clusterRelationshipKind = "controls";
    cfg.minClusterSize = 2;
    TriggerAction act;
    act.type = ActionType::CreateRelationship;
    act.relationshipKind = "enemy_of";
    cfg.actions.push_back(act);

    ThresholdTrigger trigger(cfg);
    std::mt19937_64 rng(1);
    const SystemResult result = trigger.apply(graph, 1.0, rng);
    ASSERT_EQ(result.relationships.size(), 1u);
    EXPECT_EQ(result.relationships[0].kind, "enemy_of");
}

TEST(ThresholdTriggerTest, ConditionsFilterMatches) {
    WorldGraph graph;
    addFaction(graph, "fa");
    addFaction(graph, "fb");
    graph.updateEntity("fb", EntityChanges{}.withFlag("besieged"));
    graph.pressures().set("conflict", 60.0);

    ThresholdTrigger::Config cfg;
    cfg.id = "siege";
    cfg.filter.kind = "faction";
    TriggerCondition tagged;
    tagged.type = ConditionType::TagExists;
    tagged.value = "besieged";
    cfg.conditions.push_back(tagged);
    TriggerCondition pressure;
    pressure.type = ConditionType::PressureAbove;
    pressure.pressure = "conflict";
    pressure.threshold = 50.0;
    cfg.conditions.push_back(pressure);

    ThresholdTrigger trigger(cfg);
    auto matches = trigger.findMatches(graph);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0]->id, "fb");

    graph.pressures().set("conflict", 40.0);
    EXPECT_TRUE(trigger.findMatches(graph).empty());
}

TEST(ThresholdTriggerTest, RejectsBadConfig) {
    ThresholdTrigger::Config cfg;
    EXPECT_THROW(ThresholdTrigger{cfg}, std::invalid_argument);
    cfg.id = "x";
    cfg.minClusterSize = 0;
    EXPECT_THROW(ThresholdTrigger{cfg}, std::invalid_argument);
}

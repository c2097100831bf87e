#include <gtest/gtest.h>
#include "kernel/Era.h"
#include "kernel/Mutation.h"
#include "kernel/Queries.h"
#include "kernel/Random.h"
#include "kernel/WorldGraph.h"
#include "utils/EventLog.h"
#include <cmath>
#include <stdexcept>

namespace {
std::string addNpc(WorldGraph& graph, const std::string& id, const std::string& subtype = "merchant") {
    EntitySpec spec;
    spec.id = id;
    spec.kind = "npc";
    spec.subtype = subtype;
    spec.status = "alive";
    return graph.createEntity(spec);
}

std::string addLocation(WorldGraph& graph, const std::string& id) {
    EntitySpec spec;
    spec.id = id;
    spec.kind = "location";
    spec.subtype = "colony";
    spec.status = "thriving";
    return graph.createEntity(spec);
}
}

// Every relationship must be mirrored in the source entity's links
TEST(WorldGraphTest, LinksTrackRelationships) {
    WorldGraph graph;
    addNpc(graph, "a");
    addNpc(graph, "b");

    ASSERT_TRUE(graph.addRelationship("follower_of", "a", "b"));
    ASSERT_EQ(graph.getEntity("a")->links.size(), 1u);
    EXPECT_TRUE(graph.getEntity("b")->links.empty());

    graph.setRelationshipStrength("a", "b", "follower_of", 0.9);
    EXPECT_DOUBLE_EQ(graph.getEntity("a")->links[0].strength, 0.9);

    graph.archiveRelationship("a", "b", "follower_of");
    EXPECT_EQ(graph.getEntity("a")->links[0].status, RelationshipStatus::Historical);

    graph.removeRelationship("a", "b", "follower_of");
    EXPECT_TRUE(graph.getEntity("a")->links.empty());
    EXPECT_EQ(graph.relationshipCount(), 0u);
}

TEST(WorldGraphTest, DuplicateTripleRejected) {
    WorldGraph graph;
    addNpc(graph, "a");
    addNpc(graph, "b");

    EXPECT_TRUE(graph.addRelationship("enemy_of", "a", "b"));
    EXPECT_FALSE(graph.addRelationship("enemy_of", "a", "b", 0.9));
    // Reverse direction is a different triple
    EXPECT_TRUE(graph.addRelationship("enemy_of", "b", "a"));
    EXPECT_EQ(graph.relationshipCount(), 2u);
}

TEST(WorldGraphTest, StrengthClampedAndLineageDistanceDefaulted) {
    WorldGraph graph;
    EntitySpec parent;
    parent.id = "f1";
    parent.kind = "faction";
    graph.createEntity(parent);
    parent.id = "f2";
    graph.createEntity(parent);

    graph.addRelationship("split_from", "f2", "f1", 4.0);
    const Relationship* rel = graph.findRelationship("f2", "f1", "split_from");
    ASSERT_NE(rel, nullptr);
    EXPECT_DOUBLE_EQ(rel->strength, 1.0);
    ASSERT_TRUE(rel->distance.has_value());
    EXPECT_GE(*rel->distance, 0.0);
    EXPECT_LE(*rel->distance, 1.0);
}

TEST(WorldGraphTest, DeleteEntityRemovesItsRelationships) {
    WorldGraph graph;
    addNpc(graph, "a");
    addNpc(graph, "b");
    addLocation(graph, "loc");
    graph.addRelationship("resident_of", "a", "loc");
    graph.addRelationship("resident_of", "b", "loc");
    graph.addRelationship("follower_of", "b", "a");

    ASSERT_TRUE(graph.deleteEntity("a"));
    EXPECT_EQ(graph.relationshipCount(), 1u);
    EXPECT_EQ(graph.getEntity("b")->links.size(), 1u);
}

TEST(WorldGraphTest, GeneratedIdsAreUnique) {
    WorldGraph graph;
    EntitySpec spec;
    spec.kind = "npc";
    spec.id = "npc_0";
    graph.createEntity(spec);
    spec.id.clear();
    const std::string id = graph.createEntity(spec);
    EXPECT_NE(id, "npc_0");
    EXPECT_THROW(graph.createEntity(EntitySpec{}), std::invalid_argument);
}

// Cooldown: blocked until `cooldown` ticks have passed since the last formation
TEST(WorldGraphTest, CooldownIsMonotonic) {
    WorldGraph graph;
    addNpc(graph, "a");
    EXPECT_TRUE(graph.canFormRelationship("a", "lover_of", 15));

    graph.recordRelationshipFormation("a", "lover_of");
    bool reopened = false;
    for (int t = 0; t < 20; ++t) {
        const bool allowed = graph.canFormRelationship("a", "lover_of", 15);
        if (reopened) {
            EXPECT_TRUE(allowed) << "cooldown closed again at tick " << graph.tick();
        }
        reopened = reopened || allowed;
        EXPECT_EQ(allowed, graph.tick() >= 15);
        graph.advanceTick();
    }
    EXPECT_TRUE(graph.canFormRelationship("a", "rival_of", 5));
}

TEST(PressureTest, ValuesStayClamped) {
    PressureController pressures;
    pressures.set("conflict", 150.0);
    EXPECT_DOUBLE_EQ(pressures.get("conflict"), 100.0);
    pressures.applyDelta("conflict", -250.0);
    EXPECT_DOUBLE_EQ(pressures.get("conflict"), 0.0);
    pressures.set("stability", std::nan(""));
    EXPECT_DOUBLE_EQ(pressures.get("stability"), 0.0);
}

TEST(PressureTest, QueuedDeltasAreSummed) {
    PressureController pressures;
    pressures.set("conflict", 50.0);
    pressures.queueDelta("conflict", 30.0);
    pressures.queueDelta("conflict", -10.0);
    EXPECT_DOUBLE_EQ(pressures.get("conflict"), 50.0);
    EXPECT_DOUBLE_EQ(pressures.pendingDelta("conflict"), 20.0);

    pressures.applyPending();
    EXPECT_DOUBLE_EQ(pressures.get("conflict"), 70.0);
    EXPECT_FALSE(pressures.hasPending());
}

TEST(MutationTest, PendingRefsResolveToNewIds) {
    WorldGraph graph;
    addLocation(graph, "loc");

    MutationBatch batch;
    EntitySpec hero;
    hero.kind = "npc";
    hero.subtype = "hero";
    hero.status = "alive";
    EntityRef ref = batch.addEntity(hero);
    batch.relate("resident_of", ref, "loc");
    batch.adjustPressure("conflict", 2.0);
    batch.adjustPressure("conflict", 1.0);

    const CommitOutcome outcome = commitMutation(graph, batch);
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    ASSERT_EQ(outcome.relationshipsCreated.size(), 1u);
    EXPECT_EQ(outcome.relationshipsCreated[0].src, outcome.createdIds[0]);
    EXPECT_DOUBLE_EQ(graph.pressures().pendingDelta("conflict"), 3.0);
    EXPECT_EQ(getLocation(graph, outcome.createdIds[0])->id, "loc");
}

TEST(MutationTest, BadPendingIndexLeavesGraphUntouched) {
    WorldGraph graph;
    addLocation(graph, "loc");

    MutationBatch batch;
    EntitySpec spec;
    spec.kind = "npc";
    batch.addEntity(spec);
    batch.relate("resident_of", EntityRef::pending(3), "loc");

    EXPECT_THROW(commitMutation(graph, batch), std::out_of_range);
    EXPECT_EQ(graph.entityCount(), 1u);
}

TEST(MutationTest, KindlessEntityRejectsWholeBatch) {
    WorldGraph graph;
    addLocation(graph, "loc");

    MutationBatch batch;
    EntitySpec orphan;
    orphan.id = "orphan";
    orphan.kind = "npc";
    orphan.status = "alive";
    const EntityRef ref = batch.addEntity(orphan);
    batch.addEntity(EntitySpec{});
    batch.relate("resident_of", ref, "loc");

    EXPECT_THROW(commitMutation(graph, batch), std::invalid_argument);
    EXPECT_FALSE(graph.hasEntity("orphan"));
    EXPECT_EQ(graph.entityCount(), 1u);
    EXPECT_EQ(graph.relationshipCount(), 0u);
}

TEST(MutationTest, ReusedIdRejectsWholeBatch) {
    WorldGraph graph;
    addLocation(graph, "loc");

    MutationBatch batch;
    EntitySpec fresh;
    fresh.id = "fresh";
    fresh.kind = "npc";
    batch.addEntity(fresh);
    EntitySpec clash;
    clash.id = "loc";
    clash.kind = "location";
    batch.addEntity(clash);

    EXPECT_THROW(commitMutation(graph, batch), std::invalid_argument);
    EXPECT_FALSE(graph.hasEntity("fresh"));
    EXPECT_EQ(graph.entityCount(), 1u);
}

TEST(MutationTest, BudgetStopsRelationships) {
    WorldGraph graph;
    addNpc(graph, "a");
    addNpc(graph, "b");
    addNpc(graph, "c");

    MutationBatch batch;
    batch.relate("follower_of", "a", "b");
    batch.relate("follower_of", "a", "c");
    batch.relate("follower_of", "b", "c");

    const CommitOutcome outcome = commitMutation(graph, batch, 2);
    EXPECT_EQ(outcome.relationshipsCreated.size(), 2u);
    EXPECT_TRUE(outcome.budgetExhausted);
    EXPECT_EQ(graph.relationshipCount(), 2u);
}

TEST(MutationTest, ArchiveTurnsRelationshipHistorical) {
    WorldGraph graph;
    addNpc(graph, "a");
    addLocation(graph, "old");
    addLocation(graph, "new");
    graph.addRelationship("resident_of", "a", "old");

    MutationBatch batch;
    batch.archive("a", "old", "resident_of");
    batch.relate("resident_of", "a", "new");
    const CommitOutcome outcome = commitMutation(graph, batch);

    EXPECT_EQ(outcome.archived, 1u);
    EXPECT_EQ(getLocation(graph, "a")->id, "new");
    EXPECT_EQ(graph.findRelationship("a", "old", "resident_of")->status, RelationshipStatus::Historical);
}

TEST(QueriesTest, FactionMembershipAndLeader) {
    WorldGraph graph;
    addNpc(graph, "boss", "mayor");
    addNpc(graph, "grunt");
    EntitySpec faction;
    faction.id = "fac";
    faction.kind = "faction";
    faction.subtype = "political";
    faction.status = "active";
    graph.createEntity(faction);

    graph.addRelationship("leader_of", "boss", "fac");
    graph.addRelationship("member_of", "boss", "fac");
    graph.addRelationship("member_of", "grunt", "fac");

    EXPECT_EQ(getFactionMembers(graph, "fac").size(), 2u);
    ASSERT_NE(getFactionLeader(graph, "fac"), nullptr);
    EXPECT_EQ(getFactionLeader(graph, "fac")->id, "boss");
    EXPECT_EQ(getFactions(graph, "grunt").size(), 1u);

    graph.archiveRelationship("grunt", "fac", "member_of");
    EXPECT_TRUE(getFactions(graph, "grunt").empty());
}

TEST(QueriesTest, ContradictionsAreSymmetric) {
    EXPECT_TRUE(kindsContradict("enemy_of", "lover_of"));
    EXPECT_TRUE(kindsContradict("lover_of", "enemy_of"));
    EXPECT_TRUE(kindsContradict("follower_of", "rival_of"));
    EXPECT_FALSE(kindsContradict("follower_of", "lover_of"));

    WorldGraph graph;
    addNpc(graph, "a");
    addNpc(graph, "b");
    graph.addRelationship("enemy_of", "b", "a");
    EXPECT_FALSE(areRelationshipsCompatible(graph, "a", "b", "lover_of"));
    EXPECT_TRUE(areRelationshipsCompatible(graph, "a", "b", "rival_of"));
}

TEST(QueriesTest, DistanceAndCentroid) {
    WorldGraph graph;
    EntitySpec loc;
    loc.kind = "location";
    loc.id = "l1";
    loc.coordinates = Point3{0.0, 0.0, 0.0};
    graph.createEntity(loc);
    loc.id = "l2";
    loc.coordinates = Point3{10.0, 20.0, 0.0};
    graph.createEntity(loc);
    loc.id = "l3";
    loc.coordinates.reset();
    graph.createEntity(loc);
    graph.addRelationship("adjacent_to", "l1", "l2");

    auto centre = deriveCoordinates(graph, {"l1", "l2", "l3"});
    ASSERT_TRUE(centre.has_value());
    EXPECT_DOUBLE_EQ(centre->x, 5.0);
    EXPECT_DOUBLE_EQ(centre->y, 10.0);

    EXPECT_EQ(bfsDistance(graph, "l2", "l1"), std::optional<std::size_t>(1));
    EXPECT_FALSE(bfsDistance(graph, "l1", "l3").has_value());
}

TEST(EraTest, SelectionAndModifiers) {
    Era expansion;
    expansion.id = "expansion";
    expansion.templateWeights["colony_founding"] = 2.0;
    expansion.systemModifiers["succession_vacuum"] = 0.0;
    Era conflict;
    conflict.id = "conflict";
    const std::vector<Era> eras = {expansion, conflict};

    EXPECT_EQ(selectEra(0, eras, 2).id, "expansion");
    EXPECT_EQ(selectEra(2, eras, 2).id, "conflict");
    EXPECT_EQ(selectEra(99, eras, 2).id, "conflict");
    EXPECT_DOUBLE_EQ(getTemplateWeight(expansion, "colony_founding"), 2.0);
    EXPECT_DOUBLE_EQ(getTemplateWeight(expansion, "hero_emergence"), 1.0);
    EXPECT_DOUBLE_EQ(getSystemModifier(expansion, "succession_vacuum"), 0.0);
    EXPECT_DOUBLE_EQ(getPressureModifier(conflict, "conflict"), 1.0);
    EXPECT_THROW(selectEra(0, {}, 2), std::invalid_argument);
}

TEST(RandomTest, ModifierScalesAwayFromOrTowardHalf) {
    EXPECT_DOUBLE_EQ(scaledProbability(0.8, 1.0), 0.8);
    // odds 4 squared is 16
    EXPECT_NEAR(scaledProbability(0.8, 2.0), 16.0 / 17.0, 1e-9);
    EXPECT_LT(scaledProbability(0.2, 2.0), 0.2);
    EXPECT_NEAR(scaledProbability(0.8, 0.5), 2.0 / 3.0, 1e-9);
    EXPECT_GT(scaledProbability(0.2, 0.5), 0.2);
    EXPECT_NEAR(scaledProbability(0.5, 3.0), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(scaledProbability(1.0, 0.5), 1.0);
    EXPECT_DOUBLE_EQ(scaledProbability(0.0, 2.0), 0.0);
}

TEST(EventLogTest, CapacityDropsOldest) {
    EventLog log(3);
    for (std::uint64_t t = 0; t < 5; ++t) {
        log.logSpecial(t, "expansion", "event " + std::to_string(t));
    }
    EXPECT_EQ(log.size(), 3u);
    EXPECT_EQ(log.dropped(), 2u);
    EXPECT_EQ(log.events().front().tick, 2u);
    EXPECT_EQ(log.recent(2).size(), 2u);
    EXPECT_EQ(log.recent(2).back()->description, "event 4");
    EXPECT_EQ(log.eventsBetween(3, 4).size(), 2u);
}

#include <gtest/gtest.h>
#include "domain/FrostDomain.h"
#include "io/Snapshot.h"
#include "kernel/Engine.h"
#include "utils/Validation.h"
#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace {
EngineConfig smallConfig(std::uint64_t seed) {
    EngineConfig cfg;
    cfg.seed = seed;
    cfg.maxTicks = 60;
    cfg.targetEntitiesPerKind = 20.0;
    return cfg;
}

std::unique_ptr<WorldEngine> makeEngine(const EngineConfig& cfg) {
    auto engine = std::make_unique<WorldEngine>(cfg, makeFrostWorld());
    registerFrostSystems(*engine);
    registerFrostTemplates(*engine);
    return engine;
}
}

TEST(WorldEngineTest, SeedWorldLoads) {
    auto engine = makeEngine(smallConfig(42));
    const WorldGraph& graph = engine->graph();

    EXPECT_EQ(graph.tick(), 0u);
    EXPECT_EQ(graph.getEntityCount("location"), 5u);
    EXPECT_EQ(graph.getEntityCount("faction"), 3u);
    EXPECT_EQ(graph.getEntityCount("npc"), 8u);
    EXPECT_EQ(graph.currentEra().id, "expansion");
    EXPECT_EQ(engine->systemCount(), 14u);
    EXPECT_EQ(engine->templateCount(), 12u);
    ASSERT_EQ(engine->eventLog().size(), 1u);
    EXPECT_NE(engine->eventLog().events().front().description.find("World initialized"), std::string::npos);
    EXPECT_TRUE(engine->validate().allPassed());
}

// Same seed, same world
TEST(WorldEngineTest, DeterministicRuns) {
    auto a = makeEngine(smallConfig(12345));
    auto b = makeEngine(smallConfig(12345));
    a->stepN(30);
    b->stepN(30);

    ASSERT_EQ(a->graph().entityCount(), b->graph().entityCount());
    ASSERT_EQ(a->graph().relationshipCount(), b->graph().relationshipCount());
    auto ia = a->graph().entities().begin();
    auto ib = b->graph().entities().begin();
    for (; ia != a->graph().entities().end(); ++ia, ++ib) {
        EXPECT_EQ(ia->first, ib->first);
        EXPECT_EQ(ia->second.name, ib->second.name);
        EXPECT_EQ(ia->second.status, ib->second.status);
        EXPECT_EQ(ia->second.tags, ib->second.tags);
    }
    for (std::size_t i = 0; i < a->graph().relationships().size(); ++i) {
        EXPECT_EQ(a->graph().relationships()[i], b->graph().relationships()[i]);
    }
    EXPECT_EQ(a->graph().pressures().values(), b->graph().pressures().values());
}

TEST(WorldEngineTest, ResetRestoresSeedWorld) {
    auto engine = makeEngine(smallConfig(7));
    const std::size_t seedEntities = engine->graph().entityCount();
    const std::size_t seedRelationships = engine->graph().relationshipCount();

    engine->stepN(15);
    EXPECT_EQ(engine->graph().tick(), 15u);
    engine->reset();
    EXPECT_EQ(engine->graph().tick(), 0u);
    EXPECT_EQ(engine->graph().entityCount(), seedEntities);
    EXPECT_EQ(engine->graph().relationshipCount(), seedRelationships);
    EXPECT_EQ(engine->epoch(), 0u);
}

TEST(WorldEngineTest, RunStopsAtLimits) {
    EngineConfig cfg = smallConfig(3);
    cfg.maxTicks = 25;
    auto engine = makeEngine(cfg);
    engine->run();

    EXPECT_LE(engine->graph().tick(), 25u);
    EXPECT_FALSE(engine->shouldContinue());
    EXPECT_GT(engine->graph().entityCount(), 0u);

    const ValidationReport report = engine->validate();
    const ValidationResult* links = report.find("Link Synchronization");
    ASSERT_NE(links, nullptr);
    EXPECT_TRUE(links->passed) << links->details;
}

TEST(WorldEngineTest, AbortStopsBetweenTicks) {
    auto engine = makeEngine(smallConfig(5));
    engine->step();
    engine->abort();
    EXPECT_FALSE(engine->shouldContinue());
    engine->stepN(10);
    EXPECT_EQ(engine->graph().tick(), 1u);
}

TEST(WorldEngineTest, EraAdvancesWithEpochs) {
    EngineConfig cfg = smallConfig(9);
    cfg.maxTicks = 200;
    cfg.targetEntitiesPerKind = 1000.0;
    auto engine = makeEngine(cfg);

    engine->stepN(static_cast<int>(cfg.ticksPerEpoch * cfg.epochsPerEra));
    engine->step();
    EXPECT_EQ(engine->graph().currentEra().id, "conflict");
    bool transitioned = false;
    for (const HistoryEvent* e : engine->eventLog().eventsOfType(HistoryEventType::Special)) {
        transitioned = transitioned || e->description.find("Era transition") != std::string::npos;
    }
    EXPECT_TRUE(transitioned);
}

TEST(WorldEngineTest, RelationshipBudgetPerTick) {
    EngineConfig cfg = smallConfig(21);
    cfg.maxRelationshipsPerTick = 2;
    auto engine = makeEngine(cfg);

    for (int i = 0; i < 20; ++i) {
        engine->step();
        EXPECT_LE(engine->graph().growthMetrics().relationshipsPerTick.back(), 2);
    }
}

TEST(WorldEngineTest, InvalidConfigRejected) {
    EngineConfig cfg;
    cfg.maxTicks = 0;
    EXPECT_THROW((WorldEngine{cfg, makeFrostWorld()}), std::invalid_argument);

    cfg = EngineConfig{};
    cfg.ticksPerEpoch = 0;
    EXPECT_THROW((WorldEngine{cfg, makeFrostWorld()}), std::invalid_argument);

    cfg = EngineConfig{};
    cfg.targetEntitiesPerKind = -1.0;
    EXPECT_THROW((WorldEngine{cfg, makeFrostWorld()}), std::invalid_argument);

    WorldSetup noEras = makeFrostWorld();
    noEras.eras.clear();
    EXPECT_THROW((WorldEngine{EngineConfig{}, std::move(noEras)}), std::invalid_argument);
}

TEST(ValidationTest, MissingEndpointReported) {
    WorldGraph graph;
    EntitySpec npc;
    npc.id = "a";
    npc.kind = "npc";
    graph.createEntity(npc);
    graph.addRelationship("follower_of", "a", "ghost");

    const ValidationResult result = validateRelationshipIntegrity(graph);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.failureCount, 1u);
    EXPECT_NE(result.details.find("dst missing"), std::string::npos);
}

TEST(ValidationTest, UnconnectedEntitiesAndSkippedStructure) {
    WorldGraph graph;
    EntitySpec npc;
    npc.kind = "npc";
    npc.id = "lonely";
    graph.createEntity(npc);

    const ValidationReport report = validateWorld(graph);
    EXPECT_EQ(report.totalChecks, 4u);
    const ValidationResult* connected = report.find("Connected Entities");
    ASSERT_NE(connected, nullptr);
    EXPECT_FALSE(connected->passed);
    ASSERT_EQ(connected->failedEntities.size(), 1u);
    EXPECT_EQ(connected->failedEntities[0], "lonely");
    EXPECT_TRUE(report.find("Entity Structure")->skipped);
}

TEST(ValidationTest, FrostStructureRequiresResidence) {
    auto engine = makeEngine(smallConfig(1));
    WorldGraph& graph = engine->graphMut();
    graph.archiveRelationship("npc_clerk", "loc_glacier", "resident_of");

    const ValidationReport report = engine->validate();
    const ValidationResult* structure = report.find("Entity Structure");
    ASSERT_NE(structure, nullptr);
    EXPECT_FALSE(structure->passed);
    ASSERT_EQ(structure->failedEntities.size(), 1u);
    EXPECT_EQ(structure->failedEntities[0], "npc_clerk");
}

TEST(SnapshotTest, JsonAndCsvOutput) {
    auto engine = makeEngine(smallConfig(8));
    engine->stepN(3);

    const std::string json = worldToJson(*engine);
    EXPECT_NE(json.find("\"tick\":3"), std::string::npos);
    EXPECT_NE(json.find("\"pressures\":{"), std::string::npos);
    EXPECT_NE(json.find("\"history\":["), std::string::npos);

    std::ostringstream csv;
    logMetricsHeader(*engine, csv);
    logMetrics(*engine, csv);
    const std::string text = csv.str();
    EXPECT_EQ(text.rfind("tick,", 0), 0u);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);

    const std::string report = formatReport(engine->validate());
    EXPECT_NE(report.find("Link Synchronization"), std::string::npos);
}

#include <gtest/gtest.h>
#include "domain/FrostDomain.h"
#include "kernel/Queries.h"
#include "templates/AbilityTemplates.h"
#include "templates/EmergentDiscovery.h"
#include "templates/FactionTemplates.h"
#include "templates/LocationTemplates.h"
#include "templates/NpcTemplates.h"
#include "templates/RulesTemplates.h"
#include <algorithm>
#include <random>

namespace {
// Seed world only: no systems or templates registered
EngineConfig quietConfig() {
    EngineConfig cfg;
    cfg.seed = 99;
    return cfg;
}

class NoPlacementDomain : public DomainSchema {
public:
    std::vector<std::string> entityKinds() const override { return {"npc", "location"}; }
    bool allowsRelationship(const std::string&, const std::string&, const std::string&) const override {
        return true;
    }
    std::string generateName(const std::string& kind, const std::string&, std::mt19937_64&) const override {
        return kind;
    }
    const std::vector<std::string>& themeWords(const std::string&) const override { return empty_; }

private:
    std::vector<std::string> empty_;
};

void crowdedColony(WorldGraph& graph) {
    EntitySpec colony;
    colony.id = "c";
    colony.kind = "location";
    colony.subtype = "colony";
    colony.status = "thriving";
    graph.createEntity(colony);
    for (const char* id : {"n1", "n2", "n3"}) {
        EntitySpec npc;
        npc.id = id;
        npc.kind = "npc";
        npc.subtype = "merchant";
        npc.status = "alive";
        graph.createEntity(npc);
        graph.addRelationship("resident_of", id, "c");
    }
}

void addPlain(WorldGraph& graph, const std::string& id, const std::string& kind, const std::string& subtype,
              const std::string& status) {
    EntitySpec spec;
    spec.id = id;
    spec.kind = kind;
    spec.subtype = subtype;
    spec.status = status;
    graph.createEntity(spec);
}

bool taggedFrom(const Entity& e, const std::vector<std::string>& words) {
    return std::any_of(words.begin(), words.end(), [&](const std::string& w) { return e.tags.has(w); });
}
}

TEST(ColonyFoundingTest, MissingPlacementIsConfigurationError) {
    ColonyFounding founding;
    std::mt19937_64 rng(1);

    WorldGraph bare;
    crowdedColony(bare);
    ASSERT_EQ(founding.findTargets(bare).size(), 1u);
    EXPECT_THROW(founding.expand(bare, bare.getEntity("c"), rng), ConfigurationError);

    NoPlacementDomain domain;
    WorldGraph graph;
    graph.setSchema(&domain);
    crowdedColony(graph);
    EXPECT_THROW(founding.expand(graph, graph.getEntity("c"), rng), ConfigurationError);
    EXPECT_EQ(graph.getEntityCount("location"), 1u);
}

TEST(ColonyFoundingTest, SettlersMoveToAdjacentColony) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    ColonyFounding founding;

    const auto targets = founding.findTargets(graph);
    ASSERT_EQ(targets.size(), 1u);
    EXPECT_EQ(targets[0]->id, "loc_aurora");

    TemplateResult result = founding.expand(graph, targets[0], engine.rng());
    ASSERT_EQ(result.precreated.size(), 1u);
    const std::string colonyId = result.precreated[0];
    const CommitOutcome outcome = commitMutation(graph, result);

    EXPECT_EQ(outcome.rejected, 0u);
    ASSERT_NE(graph.getEntity(colonyId), nullptr);
    EXPECT_TRUE(graph.getEntity(colonyId)->coordinates.has_value());
    EXPECT_TRUE(hasRelationship(graph, colonyId, "loc_aurora", "adjacent_to"));
    EXPECT_TRUE(hasRelationship(graph, "loc_aurora", colonyId, "adjacent_to"));
    EXPECT_EQ(getResidents(graph, colonyId).size(), 3u);
    EXPECT_TRUE(getResidents(graph, "loc_aurora").empty());
    EXPECT_DOUBLE_EQ(graph.pressures().pendingDelta("resource_scarcity"), -2.0);
}

TEST(FactionSplinterTest, DefectorLeadsWarringSplinter) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    FactionSplinter splinter;

    const Entity* council = graph.getEntity("fac_council");
    const CommitOutcome outcome = commitMutation(graph, splinter.expand(graph, council, engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    EXPECT_EQ(outcome.rejected, 0u);
    const std::string newFaction = outcome.createdIds[0];

    const Relationship* split = graph.findRelationship(newFaction, "fac_council", "split_from");
    ASSERT_NE(split, nullptr);
    ASSERT_TRUE(split->distance.has_value());
    EXPECT_GE(*split->distance, 0.15);
    EXPECT_LE(*split->distance, 0.8);
    EXPECT_TRUE(hasRelationship(graph, newFaction, "fac_council", "at_war_with"));
    EXPECT_TRUE(hasRelationship(graph, newFaction, "loc_aurora", "occupies"));

    const Entity* leader = getFactionLeader(graph, newFaction);
    ASSERT_NE(leader, nullptr);
    EXPECT_TRUE(leader->id == "npc_hero" || leader->id == "npc_guard") << leader->id;
    for (const Entity* f : getFactions(graph, leader->id)) {
        EXPECT_NE(f->id, "fac_council");
    }
}

TEST(KinshipConstellationTest, FamilyJoinsFactionAtItsSeat) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    KinshipConstellation kinship;
    std::mt19937_64& rng = engine.rng();
    ASSERT_TRUE(kinship.canApply(graph, rng));

    const CommitOutcome outcome = commitMutation(graph, kinship.expand(graph, graph.getEntity("fac_traders"), rng));
    ASSERT_GE(outcome.createdIds.size(), 5u);
    ASSERT_LE(outcome.createdIds.size(), 8u);

    std::string family;
    for (const auto& id : outcome.createdIds) {
        const Entity* npc = graph.getEntity(id);
        ASSERT_NE(npc, nullptr);
        EXPECT_TRUE(npc->tags.has("traditional") || npc->tags.has("radical"));
        if (family.empty()) family = npc->tags.getString("family");
        EXPECT_EQ(npc->tags.getString("family"), family);
        ASSERT_NE(getLocation(graph, id), nullptr);
        EXPECT_EQ(getLocation(graph, id)->id, "loc_glacier");
        EXPECT_TRUE(hasRelationship(graph, id, "fac_traders", "member_of"));
    }
    EXPECT_TRUE(hasRelationship(graph, outcome.createdIds[0], outcome.createdIds[2], "mentor_of"));
}

TEST(MagicDiscoveryTest, HeroDiscoversMagicAtAnomaly) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    MagicDiscovery discovery;

    const auto heroes = discovery.findTargets(graph);
    ASSERT_FALSE(heroes.empty());
    const CommitOutcome outcome = commitMutation(graph, discovery.expand(graph, graph.getEntity("npc_hero"), engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);

    const Entity* magic = graph.getEntity(outcome.createdIds[0]);
    EXPECT_EQ(magic->kind, "abilities");
    EXPECT_EQ(magic->subtype, "magic");
    EXPECT_TRUE(hasRelationship(graph, "npc_hero", magic->id, "discoverer_of"));
    EXPECT_TRUE(hasRelationship(graph, magic->id, "loc_fissure", "manifests_at"));
    // Ice Sight already manifests at the only anomaly, so it is the parent
    EXPECT_TRUE(hasRelationship(graph, magic->id, "abl_icesight", "related_to"));
}

TEST(MagicDiscoveryTest, GatedByInstability) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    MagicDiscovery discovery;

    graph.pressures().set("magical_instability", 5.0);
    EXPECT_FALSE(discovery.canApply(graph, engine.rng()));
    graph.pressures().set("magical_instability", 40.0);
    EXPECT_TRUE(discovery.canApply(graph, engine.rng()));
}

TEST(IdeologyEmergenceTest, ChampionProposesIdeology) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    IdeologyEmergence ideology;

    const auto champions = ideology.findTargets(graph);
    ASSERT_FALSE(champions.empty());
    const Entity* champion = champions.front();
    const std::string championId = champion->id;
    const CommitOutcome outcome = commitMutation(graph, ideology.expand(graph, champion, engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);

    const Entity* rule = graph.getEntity(outcome.createdIds[0]);
    EXPECT_EQ(rule->kind, "rules");
    EXPECT_EQ(rule->status, "proposed");
    EXPECT_TRUE(rule->tags.has("ideology"));
    EXPECT_TRUE(hasRelationship(graph, championId, rule->id, "champion_of"));
}

TEST(DiscoveryGatingTest, AtMostTwoPerEpoch) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    DiscoveryConfig cfg = frostDiscoveryConfig();
    cfg.eraDiscoveryChance[graph.currentEra().id] = 1.0;
    std::mt19937_64 rng(4);

    auto advance = [&](int ticks) {
        for (int i = 0; i < ticks; ++i) graph.advanceTick();
    };

    advance(5);
    ASSERT_TRUE(shouldDiscoverLocation(graph, cfg, rng));
    graph.recordDiscovery();
    // Too soon after the last discovery
    EXPECT_FALSE(shouldDiscoverLocation(graph, cfg, rng));

    advance(3);
    ASSERT_TRUE(shouldDiscoverLocation(graph, cfg, rng));
    graph.recordDiscovery();

    advance(3);
    EXPECT_FALSE(shouldDiscoverLocation(graph, cfg, rng));

    graph.discoveryState().discoveriesThisEpoch = 0;
    EXPECT_TRUE(shouldDiscoverLocation(graph, cfg, rng));
}

TEST(DiscoveryGatingTest, NeedsAnActiveExplorer) {
    WorldGraph graph;
    EntitySpec npc;
    npc.id = "m";
    npc.kind = "npc";
    npc.subtype = "merchant";
    npc.status = "alive";
    graph.createEntity(npc);

    DiscoveryConfig cfg;
    cfg.eraDiscoveryChance[graph.currentEra().id] = 1.0;
    std::mt19937_64 rng(4);
    EXPECT_FALSE(shouldDiscoverLocation(graph, cfg, rng));

    EntityChanges promote;
    promote.subtype = "hero";
    graph.updateEntity("m", promote);
    EXPECT_TRUE(shouldDiscoverLocation(graph, cfg, rng));
}

TEST(DiscoveryThemeTest, DisplayNameCapitalizesWords) {
    EXPECT_EQ(themeDisplayName("deep_krill_channel"), "Deep Krill Channel");
    EXPECT_EQ(themeDisplayName("vent"), "Vent");
}

TEST(HeroEmergenceTest, HighConflictSuppressesHeroes) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    HeroEmergence::Config cfg;
    cfg.suppressedChance = 0.0;
    HeroEmergence heroes(cfg);

    graph.pressures().set("conflict", 90.0);
    EXPECT_FALSE(heroes.canApply(graph, engine.rng()));
    graph.pressures().set("conflict", 50.0);
    EXPECT_TRUE(heroes.canApply(graph, engine.rng()));
}

TEST(HeroEmergenceTest, HeroJoinsPatronAndGainsFollowers) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    HeroEmergence heroes;

    const CommitOutcome outcome = commitMutation(graph, heroes.expand(graph, graph.getEntity("loc_aurora"), engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    const std::string hero = outcome.createdIds[0];
    EXPECT_EQ(graph.getEntity(hero)->subtype, "hero");
    EXPECT_EQ(getLocation(graph, hero)->id, "loc_aurora");
    EXPECT_TRUE(hasRelationship(graph, hero, "fac_council", "member_of"));
    EXPECT_EQ(getRelated(graph, hero, "follower_of", Direction::Incoming).size(), 2u);
}

TEST(MysteriousVanishingTest, NotableNearAnomalyGoesMissing) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    graph.addRelationship("follower_of", "npc_smuggler", "npc_outlaw");
    MysteriousVanishing vanishing;

    // Frostmaw borders the fissure; no other notable lives next to an anomaly
    const CommitOutcome outcome = commitMutation(graph, vanishing.expand(graph, nullptr, engine.rng()));
    EXPECT_EQ(graph.getEntity("npc_outlaw")->status, "missing");
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    const Entity* site = graph.getEntity(outcome.createdIds[0]);
    EXPECT_EQ(site->subtype, "anomaly");
    EXPECT_TRUE(hasRelationship(graph, site->id, "loc_frostmaw", "adjacent_to"));
    EXPECT_TRUE(hasRelationship(graph, "npc_outlaw", site->id, "last_seen_at"));
    EXPECT_TRUE(hasRelationship(graph, "npc_smuggler", "npc_outlaw", "searching_for"));
}

TEST(CultFormationTest, ProphetGathersCultistsAtAnomaly) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    CultFormation cults;
    ASSERT_TRUE(cults.canApply(graph, engine.rng()));
    const auto targets = cults.findTargets(graph);
    ASSERT_FALSE(targets.empty());
    EXPECT_EQ(targets.front()->id, "loc_fissure");

    const CommitOutcome outcome = commitMutation(graph, cults.expand(graph, graph.getEntity("loc_fissure"), engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 2u);
    const std::string cult = outcome.createdIds[0];
    const std::string prophet = outcome.createdIds[1];
    EXPECT_EQ(graph.getEntity(cult)->subtype, "cult");
    ASSERT_NE(getFactionLeader(graph, cult), nullptr);
    EXPECT_EQ(getFactionLeader(graph, cult)->id, prophet);
    EXPECT_TRUE(hasRelationship(graph, cult, "loc_fissure", "occupies"));
    EXPECT_TRUE(hasRelationship(graph, cult, "abl_icesight", "seeks"));
    EXPECT_TRUE(hasRelationship(graph, prophet, "abl_icesight", "practitioner_of"));

    const auto members = getFactionMembers(graph, cult);
    EXPECT_EQ(members.size(), 4u);
    for (const Entity* member : members) {
        ASSERT_NE(getLocation(graph, member->id), nullptr);
        EXPECT_EQ(getLocation(graph, member->id)->id, "loc_fissure") << member->id;
    }
}

TEST(TechInnovationTest, FactionBuildsOnKnownTechnology) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    TechInnovation innovation;
    ASSERT_TRUE(innovation.canApply(graph, engine.rng()));

    const CommitOutcome outcome = commitMutation(graph, innovation.expand(graph, graph.getEntity("fac_council"), engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    const Entity* tech = graph.getEntity(outcome.createdIds[0]);
    EXPECT_EQ(tech->subtype, "technology");
    EXPECT_TRUE(hasRelationship(graph, "fac_council", tech->id, "practitioner_of"));
    EXPECT_TRUE(hasRelationship(graph, tech->id, "loc_aurora", "originated_in"));
    EXPECT_TRUE(hasRelationship(graph, "npc_mayor", tech->id, "discoverer_of"));
    // The council practises nothing yet, so any active technology is the parent
    EXPECT_TRUE(hasRelationship(graph, tech->id, "abl_drilling", "derived_from"));
}

TEST(LocationDiscoveryTest, ResourceSiteEasesScarcity) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    graph.pressures().set("resource_scarcity", 60.0);
    ResourceLocationDiscovery discovery(frostDiscoveryConfig());
    const std::uint32_t before = graph.discoveryState().discoveriesThisEpoch;

    TemplateResult result = discovery.expand(graph, graph.getEntity("npc_hero"), engine.rng());
    EXPECT_DOUBLE_EQ(result.pressureChanges["resource_scarcity"], -5.0);
    // The gate only counts what lands
    EXPECT_EQ(graph.discoveryState().discoveriesThisEpoch, before);

    const CommitOutcome outcome = commitMutation(graph, result);
    EXPECT_EQ(graph.discoveryState().discoveriesThisEpoch, before + 1);
    EXPECT_EQ(graph.discoveryState().lastDiscoveryTick, static_cast<std::int64_t>(graph.tick()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    const Entity* site = graph.getEntity(outcome.createdIds[0]);
    EXPECT_EQ(site->subtype, "geographic_feature");
    EXPECT_TRUE(site->tags.has("resource"));
    EXPECT_TRUE(site->tags.has("food"));
    EXPECT_TRUE(taggedFrom(*site, themeWords(graph, "depth:" + graph.currentEra().id)));
    EXPECT_TRUE(hasRelationship(graph, "npc_hero", site->id, "explorer_of"));
}

TEST(LocationDiscoveryTest, StrategicSiteClaimedByScoutsFaction) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    graph.pressures().set("conflict", 50.0);
    StrategicLocationDiscovery discovery(frostDiscoveryConfig());

    const CommitOutcome outcome = commitMutation(graph, discovery.expand(graph, graph.getEntity("npc_hero"), engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    const Entity* site = graph.getEntity(outcome.createdIds[0]);
    EXPECT_TRUE(site->tags.has("strategic"));
    EXPECT_TRUE(site->tags.has("territorial"));
    EXPECT_TRUE(taggedFrom(*site, themeWords(graph, "concealment")));
    EXPECT_TRUE(hasRelationship(graph, "fac_council", site->id, "controls"));
}

TEST(LocationDiscoveryTest, MysticalSiteDrawsExistingMagic) {
    WorldEngine engine(quietConfig(), makeFrostWorld());
    WorldGraph& graph = engine.graphMut();
    graph.pressures().set("magical_instability", 70.0);
    MysticalLocationDiscovery discovery(frostDiscoveryConfig());

    const CommitOutcome outcome = commitMutation(graph, discovery.expand(graph, graph.getEntity("npc_hero"), engine.rng()));
    ASSERT_EQ(outcome.createdIds.size(), 1u);
    const Entity* site = graph.getEntity(outcome.createdIds[0]);
    EXPECT_EQ(site->subtype, "anomaly");
    EXPECT_EQ(site->status, "active");
    EXPECT_EQ(site->prominence, Prominence::Renowned);
    EXPECT_TRUE(taggedFrom(*site, themeWords(graph, "intensity:wild")));
    EXPECT_TRUE(hasRelationship(graph, "abl_icesight", site->id, "manifests_at"));
}

TEST(LocationDiscoveryTest, DomainWithoutThemeWordsDiscoversNothing) {
    WorldGraph graph;
    NoPlacementDomain domain;
    graph.setSchema(&domain);
    addPlain(graph, "scout", "npc", "hero", "alive");
    addPlain(graph, "f1", "faction", "political", "active");
    addPlain(graph, "f2", "faction", "political", "active");
    graph.addRelationship("at_war_with", "f1", "f2");
    graph.pressures().set("conflict", 50.0);
    graph.pressures().set("magical_instability", 70.0);
    std::mt19937_64 rng(6);

    StrategicLocationDiscovery strategic;
    MysticalLocationDiscovery mystical;
    EXPECT_TRUE(strategic.expand(graph, graph.getEntity("scout"), rng).entities.empty());
    EXPECT_TRUE(mystical.expand(graph, graph.getEntity("scout"), rng).entities.empty());

    ResourceAnalysis need;
    need.specific = "fishing";
    EXPECT_FALSE(generateResourceTheme(graph, need, rng).has_value());
    EXPECT_EQ(graph.discoveryState().discoveriesThisEpoch, 0u);
}

TEST(DiscoveryAnalysisTest, ResourceDeficit) {
    WorldGraph graph;
    DiscoveryConfig cfg;
    std::mt19937_64 rng(3);
    addPlain(graph, "c1", "location", "colony", "waning");
    addPlain(graph, "c2", "location", "colony", "waning");
    addPlain(graph, "c3", "location", "colony", "thriving");

    auto struggling = analyzeResourceDeficit(graph, cfg, rng);
    ASSERT_TRUE(struggling.has_value());
    EXPECT_EQ(struggling->primary, ResourceNeed::Food);
    EXPECT_EQ(struggling->specific, "fishing");
    EXPECT_EQ(struggling->affectedColonies, (std::vector<std::string>{"c1", "c2"}));

    for (const char* id : {"c1", "c2"}) {
        EntityChanges recovered;
        recovered.status = "thriving";
        ASSERT_TRUE(graph.updateEntity(id, recovered));
    }
    EXPECT_FALSE(analyzeResourceDeficit(graph, cfg, rng).has_value());

    // More than ten NPCs per colony
    for (int i = 0; i < 31; ++i) addPlain(graph, "n" + std::to_string(i), "npc", "merchant", "alive");
    auto crowded = analyzeResourceDeficit(graph, cfg, rng);
    ASSERT_TRUE(crowded.has_value());
    EXPECT_EQ(crowded->primary, ResourceNeed::Water);
    EXPECT_EQ(crowded->specific, "fresh_water");
    EXPECT_EQ(crowded->affectedColonies.size(), 3u);
}

TEST(DiscoveryAnalysisTest, ScarcityFallsBackWithoutFoodWords) {
    WorldGraph graph;
    DiscoveryConfig cfg;
    std::mt19937_64 rng(3);
    addPlain(graph, "c1", "location", "colony", "thriving");
    graph.pressures().set("resource_scarcity", 60.0);

    auto deficit = analyzeResourceDeficit(graph, cfg, rng);
    ASSERT_TRUE(deficit.has_value());
    EXPECT_EQ(deficit->specific, "food");
    EXPECT_DOUBLE_EQ(deficit->severity, 60.0);
}

TEST(DiscoveryAnalysisTest, ConflictPatterns) {
    WorldGraph graph;
    addPlain(graph, "f1", "faction", "political", "active");
    addPlain(graph, "f2", "faction", "political", "active");
    addPlain(graph, "town", "location", "colony", "thriving");
    graph.pressures().set("conflict", 20.0);
    EXPECT_FALSE(analyzeConflictPatterns(graph).has_value());

    graph.pressures().set("conflict", 50.0);
    EXPECT_FALSE(analyzeConflictPatterns(graph).has_value());

    graph.addRelationship("at_war_with", "f1", "f2");
    auto war = analyzeConflictPatterns(graph);
    ASSERT_TRUE(war.has_value());
    EXPECT_EQ(war->type, ConflictType::Territorial);
    EXPECT_DOUBLE_EQ(war->intensity, 50.0);
    EXPECT_EQ(war->factions, (std::vector<std::string>{"f1", "f2"}));
    EXPECT_FALSE(war->needsAdvantage);

    for (const char* id : {"r1", "r2", "r3"}) {
        addPlain(graph, id, "npc", "outlaw", "alive");
        graph.addRelationship("attacking", id, "town");
    }
    auto raids = analyzeConflictPatterns(graph);
    ASSERT_TRUE(raids.has_value());
    EXPECT_EQ(raids->type, ConflictType::Defensive);
    EXPECT_TRUE(raids->needsAdvantage);

    graph.pressures().set("cultural_tension", 50.0);
    EXPECT_EQ(analyzeConflictPatterns(graph)->type, ConflictType::Ideological);
    graph.pressures().set("resource_scarcity", 60.0);
    EXPECT_EQ(analyzeConflictPatterns(graph)->type, ConflictType::Resource);
}

TEST(DiscoveryAnalysisTest, MagicPresence) {
    WorldGraph graph;
    DiscoveryConfig cfg;
    graph.pressures().set("magical_instability", 10.0);
    EXPECT_FALSE(analyzeMagicPresence(graph, cfg).has_value());

    graph.pressures().set("magical_instability", 30.0);
    for (const char* id : {"m1", "m2", "m3", "m4"}) addPlain(graph, id, "abilities", "magic", "active");
    auto artifacts = analyzeMagicPresence(graph, cfg);
    ASSERT_TRUE(artifacts.has_value());
    EXPECT_EQ(artifacts->existingMagic.size(), 4u);
    EXPECT_EQ(artifacts->manifestation, Manifestation::Artifact);

    for (const char* id : {"a1", "a2", "a3"}) addPlain(graph, id, "location", "anomaly", "active");
    auto convergence = analyzeMagicPresence(graph, cfg);
    ASSERT_TRUE(convergence.has_value());
    EXPECT_EQ(convergence->anomalyCount, 3u);
    EXPECT_EQ(convergence->manifestation, Manifestation::Convergence);
}

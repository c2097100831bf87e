#include "domain/FrostDomain.h"

#include <algorithm>
#include <utility>
#include "kernel/Queries.h"
#include "kernel/Random.h"
#include "modules/AllianceFormation.h"
#include "modules/BeliefContagion.h"
#include "modules/ConflictContagion.h"
#include "modules/CulturalDrift.h"
#include "modules/LegendCrystallization.h"
#include "modules/ProminenceEvolution.h"
#include "modules/RelationshipCulling.h"
#include "modules/RelationshipDecay.h"
#include "modules/RelationshipFormation.h"
#include "modules/RelationshipReinforcement.h"
#include "modules/ResourceFlow.h"
#include "modules/SuccessionVacuum.h"
#include "modules/ThermalCascade.h"
#include "templates/AbilityTemplates.h"
#include "templates/FactionTemplates.h"
#include "templates/LocationTemplates.h"
#include "templates/NpcTemplates.h"
#include "templates/RulesTemplates.h"

namespace {
const std::vector<std::string> kNoWords;

const std::vector<std::string> kGivenNames = {
    "Skua", "Pip", "Tarn", "Brine", "Holt", "Wren", "Fen", "Kestrel", "Rime", "Sleet",
    "Marrow", "Tilde", "Osk", "Nilla", "Grebe", "Corrie", "Bask", "Ysolde", "Quill", "Eider"};
const std::vector<std::string> kFamilyNames = {
    "Floehart", "Deepwater", "Rimeback", "Saltcrest", "Coldfin", "Shelfborn", "Icewake", "Driftmantle"};
const std::vector<std::string> kPlacePrefixes = {
    "Aurora", "Glacier", "Frost", "Pale", "Krill", "Northwind", "Berg", "Sable", "Hoar", "Tidewhite"};
const std::vector<std::string> kPlaceSuffixes = {
    "Reach", "Hollow", "Shelf", "Landing", "Rookery", "Haven", "Spit", "Drift"};
const std::vector<std::string> kFactionAdjectives = {
    "Icebound", "Deepwater", "Silent", "Pale", "Northern", "Tidebreaker", "Frostborn", "Hollow"};
const std::vector<std::string> kFactionNouns = {
    "Council", "Compact", "Syndicate", "Brotherhood", "Assembly", "Pod", "Guild", "Watch"};
const std::vector<std::string> kCultNouns = {"Circle", "Choir", "Order", "Vigil"};
const std::vector<std::string> kCultObjects = {"Deep Fissure", "Green Aurora", "Singing Ice", "Drowned Star"};
const std::vector<std::string> kRuleHeads = {"Accord", "Doctrine", "Covenant", "Creed", "Charter", "Way"};
const std::vector<std::string> kRuleObjects = {"Shared Catch", "Long Night", "Open Floe", "Old Ice", "Warm Current"};
const std::vector<std::string> kMagicFirst = {"Frost", "Ice", "Glow", "Rime", "Aurora"};
const std::vector<std::string> kMagicSecond = {"Ward", "Sight", "Bond", "Song", "Veil"};
const std::vector<std::string> kTechNames = {
    "Ice Drilling", "Thermal Preservation", "Echo-Location Nets", "Frost-Hardened Tools",
    "Glacial Navigation", "Ice-Melt Refinement", "Sonic Fish Herding", "Crystalline Storage"};

struct Allowed {
    const char* src;
    const char* kind;
    const char* dst;
};

const Allowed kRelationshipMatrix[] = {
    // npc <-> npc
    {"npc", "follower_of", "npc"}, {"npc", "rival_of", "npc"}, {"npc", "enemy_of", "npc"},
    {"npc", "lover_of", "npc"}, {"npc", "mentor_of", "npc"}, {"npc", "family_of", "npc"},
    {"npc", "friend_of", "npc"}, {"npc", "ally_of", "npc"}, {"npc", "searching_for", "npc"},
    // npc -> world
    {"npc", "resident_of", "location"}, {"npc", "explorer_of", "location"}, {"npc", "last_seen_at", "location"},
    {"npc", "member_of", "faction"}, {"npc", "leader_of", "faction"},
    {"npc", "practitioner_of", "abilities"}, {"npc", "discoverer_of", "abilities"},
    {"npc", "champion_of", "rules"}, {"npc", "believer_of", "rules"},
    // locations
    {"location", "adjacent_to", "location"}, {"location", "discovered_by", "npc"},
    {"location", "commemorates", "npc"},
    // factions
    {"faction", "split_from", "faction"}, {"faction", "at_war_with", "faction"},
    {"faction", "allied_with", "faction"}, {"faction", "enemy_of", "faction"}, {"faction", "ally_of", "faction"},
    {"faction", "occupies", "location"}, {"faction", "controls", "location"},
    {"faction", "seeks", "abilities"}, {"faction", "practitioner_of", "abilities"},
    // rules
    {"rules", "originated_in", "location"}, {"rules", "commemorates", "npc"},
    // abilities
    {"abilities", "manifests_at", "location"}, {"abilities", "originated_in", "location"},
    {"abilities", "related_to", "abilities"}, {"abilities", "derived_from", "abilities"},
};

EntitySpec seedEntity(const std::string& id, const std::string& kind, const std::string& subtype,
                      const std::string& name, const std::string& status, const std::string& description) {
    EntitySpec spec;
    spec.id = id;
    spec.kind = kind;
    spec.subtype = subtype;
    spec.name = name;
    spec.status = status;
    spec.description = description;
    spec.culture = "floe";
    return spec;
}

EntitySpec seedLocation(const std::string& id, const std::string& subtype, const std::string& name,
                        const std::string& status, double temp, Point3 at) {
    EntitySpec spec = seedEntity(id, "location", subtype, name, status, name + ", a landmark of the archipelago.");
    spec.tags.set("temp", ThermalCascade::formatTemperature(temp));
    spec.coordinates = at;
    return spec;
}

std::size_t countKind(const WorldGraph& graph, const std::string& kind) {
    std::size_t n = 0;
    for (const auto& rel : graph.relationships()) {
        if (rel.kind == kind && rel.status == RelationshipStatus::Active) ++n;
    }
    return n;
}

std::size_t countTagged(const WorldGraph& graph, const std::string& kind, const std::string& tag) {
    std::size_t n = 0;
    for (const auto& [id, e] : graph.entities()) {
        if (e.kind == kind && e.tags.has(tag)) ++n;
    }
    return n;
}
}

// ---------- FrostPlacement ----------

Point3 FrostPlacement::place(const WorldGraph& graph, const std::vector<std::string>& referenceIds,
                             std::mt19937_64& rng) const {
    Point3 p = deriveCoordinates(graph, referenceIds).value_or(Point3{});
    p.x += randomRange(-spread_, spread_, rng);
    p.y += randomRange(-spread_, spread_, rng);
    return p;
}

// ---------- FrostDomain ----------

FrostDomain::FrostDomain() {
    for (const auto& a : kRelationshipMatrix) {
        allowed_.emplace(a.src, a.kind, a.dst);
    }

    themes_["food_resources"] = {"krill", "fish", "kelp", "squid", "clams"};
    themes_["depth:expansion"] = {"shallow", "coastal", "sunlit"};
    themes_["depth:conflict"] = {"hidden", "contested", "shadowed"};
    themes_["depth:innovation"] = {"deep", "geothermal", "pressurized"};
    themes_["depth:invasion"] = {"sheltered", "fortified", "secret"};
    themes_["depth:reconstruction"] = {"restored", "renewed", "quiet"};
    themes_["resource:fishing"] = {"fish", "krill", "squid"};
    themes_["resource:fresh_water"] = {"meltwater", "spring", "icemelt"};
    themes_["resource:krill"] = {"krill", "swarm", "bloom"};
    themes_["resource:fish"] = {"fish", "shoal", "run"};
    themes_["resource:kelp"] = {"kelp", "weed", "forest"};
    themes_["resource:squid"] = {"squid", "ink", "tentacle"};
    themes_["resource:clams"] = {"clam", "shell", "bed"};
    themes_["form:resource_site"] = {"grounds", "channel", "pool", "canyon", "shelf", "floe", "field"};

    themes_["advantage"] = {"defensible", "fortified", "strategic", "elevated"};
    themes_["concealment"] = {"hidden", "neutral", "secret", "isolated"};
    themes_["form:territorial"] = {"ridge", "pass", "ice_bridge", "crossing"};
    themes_["form:defensive"] = {"peak", "berg", "bulwark", "rampart"};
    themes_["form:resource"] = {"cache", "reserve", "depot", "stockpile"};
    themes_["form:ideological"] = {"sanctuary", "refuge", "haven", "retreat"};

    themes_["intensity:wild"] = {"chaotic", "wild", "unstable", "volatile"};
    themes_["intensity:dormant"] = {"ancient", "dormant", "sleeping", "frozen"};
    themes_["form:convergence"] = {"nexus", "focus", "node", "junction"};
    themes_["form:artifact"] = {"vault", "chamber", "repository", "archive"};
    themes_["form:phenomenon"] = {"aurora", "glow", "shimmer", "echo"};
    themes_["form:temple"] = {"shrine", "temple", "sanctum", "altar"};
}

std::vector<std::string> FrostDomain::entityKinds() const {
    return {"npc", "faction", "rules", "abilities", "location"};
}

bool FrostDomain::allowsRelationship(const std::string& srcKind, const std::string& kind,
                                     const std::string& dstKind) const {
    return allowed_.count(std::make_tuple(srcKind, kind, dstKind)) > 0;
}

StructureValidator FrostDomain::structureValidator() const {
    return [](const Entity& e) {
        StructureCheck check;
        if (e.name.empty()) check.missing.push_back("name");
        if (e.status.empty()) check.missing.push_back("status");
        if (e.kind == "npc" && e.status == "alive") {
            const bool housed = std::any_of(e.links.begin(), e.links.end(), [](const Relationship& r) {
                return r.kind == "resident_of" && r.status == RelationshipStatus::Active;
            });
            if (!housed) check.missing.push_back("resident_of");
        }
        if (e.kind == "location" && e.subtype == "colony" && !e.coordinates) {
            check.missing.push_back("coordinates");
        }
        check.valid = check.missing.empty();
        return check;
    };
}

std::string FrostDomain::generateName(const std::string& kind, const std::string& subtype,
                                      std::mt19937_64& rng) const {
    if (kind == "npc") {
        if (subtype == "family") return pickRandom(kFamilyNames, rng);
        return pickRandom(kGivenNames, rng);
    }
    if (kind == "location") {
        return pickRandom(kPlacePrefixes, rng) + " " + pickRandom(kPlaceSuffixes, rng);
    }
    if (kind == "faction") {
        if (subtype == "cult") {
            return "The " + pickRandom(kCultNouns, rng) + " of the " + pickRandom(kCultObjects, rng);
        }
        return "The " + pickRandom(kFactionAdjectives, rng) + " " + pickRandom(kFactionNouns, rng);
    }
    if (kind == "rules") {
        return "The " + pickRandom(kRuleHeads, rng) + " of the " + pickRandom(kRuleObjects, rng);
    }
    if (kind == "abilities") {
        if (subtype == "technology") return pickRandom(kTechNames, rng);
        return pickRandom(kMagicFirst, rng) + " " + pickRandom(kMagicSecond, rng);
    }
    return {};
}

const std::vector<std::string>& FrostDomain::themeWords(const std::string& list) const {
    auto it = themes_.find(list);
    return it != themes_.end() ? it->second : kNoWords;
}

// ---------- Eras and pressures ----------

std::vector<Era> frostEras() {
    std::vector<Era> eras(5);

    eras[0].id = "expansion";
    eras[0].name = "The Great Thaw";
    eras[0].description = "Colonies spread across newly opened ice.";
    eras[0].templateWeights = {{"colony_founding", 2.0}, {"resource_location_discovery", 1.5},
                               {"kinship_constellation", 1.5}, {"faction_splinter", 0.5}};
    eras[0].systemModifiers = {{"conflict_contagion", 0.5}, {"resource_flow", 1.5}};
    eras[0].pressureModifiers = {{"conflict", 0.7}};

    eras[1].id = "conflict";
    eras[1].name = "The Floe Wars";
    eras[1].description = "Factions fight over the krill grounds.";
    eras[1].templateWeights = {{"faction_splinter", 2.0}, {"strategic_location_discovery", 2.0},
                               {"hero_emergence", 1.5}, {"colony_founding", 0.5}};
    eras[1].systemModifiers = {{"conflict_contagion", 1.5}, {"alliance_formation", 1.5},
                               {"succession_vacuum", 1.5}};
    eras[1].pressureModifiers = {{"conflict", 1.5}, {"stability", 0.7}};

    eras[2].id = "innovation";
    eras[2].name = "The Age of Invention";
    eras[2].description = "New tools and stranger magic reshape daily life.";
    eras[2].templateWeights = {{"tech_innovation", 2.0}, {"magic_discovery", 1.5},
                               {"ideology_emergence", 1.5}, {"mystical_location_discovery", 1.5}};
    eras[2].systemModifiers = {{"belief_contagion", 1.5}, {"cultural_drift", 1.2}};
    eras[2].pressureModifiers = {{"magical_instability", 1.3}};

    eras[3].id = "invasion";
    eras[3].name = "The Orca Incursion";
    eras[3].description = "Raiders from the deep press on every colony.";
    eras[3].templateWeights = {{"hero_emergence", 2.0}, {"mysterious_vanishing", 1.5},
                               {"cult_formation", 1.5}, {"ideology_emergence", 0.5}};
    eras[3].systemModifiers = {{"conflict_contagion", 2.0}, {"alliance_formation", 2.0}};
    eras[3].pressureModifiers = {{"external_threat", 2.0}, {"conflict", 1.3}};

    eras[4].id = "reconstruction";
    eras[4].name = "The Long Mending";
    eras[4].description = "Survivors rebuild and remember.";
    eras[4].templateWeights = {{"ideology_emergence", 1.5}, {"colony_founding", 1.2},
                               {"faction_splinter", 0.5}};
    eras[4].systemModifiers = {{"alliance_formation", 1.5}, {"legend_crystallization", 1.5},
                               {"conflict_contagion", 0.5}};
    eras[4].pressureModifiers = {{"conflict", 0.5}, {"stability", 1.5}};

    return eras;
}

std::vector<PressureDefinition> frostPressures() {
    std::vector<PressureDefinition> defs;
    defs.push_back({"resource_scarcity", "Resource Scarcity", 20.0, 6.0, [](const WorldGraph& g) {
        const auto colonies = g.findEntities({std::string("location"), std::string("colony"), std::nullopt});
        double waning = 0.0;
        for (const Entity* c : colonies) {
            if (c->status == "waning") waning += 1.0;
        }
        const double crowding = static_cast<double>(g.getEntityCount("npc")) /
                                static_cast<double>(std::max<std::size_t>(colonies.size(), 1));
        return 3.0 * waning + 0.5 * crowding;
    }});
    defs.push_back({"conflict", "Conflict", 15.0, 5.0, [](const WorldGraph& g) {
        return 2.0 * static_cast<double>(countKind(g, "at_war_with")) +
               0.3 * static_cast<double>(countKind(g, "enemy_of"));
    }});
    defs.push_back({"magical_instability", "Magical Instability", 10.0, 3.0, [](const WorldGraph& g) {
        return 2.0 * static_cast<double>(g.getEntityCount("location", "anomaly")) +
               static_cast<double>(g.getEntityCount("abilities", "magic"));
    }});
    defs.push_back({"cultural_tension", "Cultural Tension", 5.0, 5.0, [](const WorldGraph& g) {
        const double proposed =
            static_cast<double>(g.findEntities({std::string("rules"), std::nullopt, std::string("proposed")}).size());
        return 2.0 * static_cast<double>(countTagged(g, "location", "divergent")) + 2.0 * proposed +
               0.5 * static_cast<double>(g.getEntityCount("faction"));
    }});
    defs.push_back({"stability", "Stability", 50.0, 3.0, [](const WorldGraph& g) {
        const double enacted =
            static_cast<double>(g.findEntities({std::string("rules"), std::nullopt, std::string("enacted")}).size());
        return 2.0 + 1.5 * enacted + static_cast<double>(countKind(g, "allied_with"));
    }});
    defs.push_back({"external_threat", "External Threat", 0.0, 2.0, [](const WorldGraph& g) {
        return g.currentEra().id == "invasion" ? 8.0 : 0.0;
    }});
    return defs;
}

DiscoveryConfig frostDiscoveryConfig() {
    DiscoveryConfig cfg;
    cfg.eraDiscoveryChance = {{"expansion", 0.5}, {"conflict", 0.3}, {"innovation", 0.4},
                              {"invasion", 0.2}, {"reconstruction", 0.3}};
    return cfg;
}

ThresholdTrigger::Config warBrewingTrigger() {
    ThresholdTrigger::Config cfg;
    cfg.id = "war_brewing";
    cfg.name = "War Brewing";
    cfg.filter.kind = "faction";
    TriggerCondition atWar;
    atWar.type = ConditionType::RelationshipCount;
    atWar.relationshipKind = "at_war_with";
    atWar.direction = Direction::Both;
    atWar.min = 1;
    cfg.conditions.push_back(atWar);
    cfg.clusterMode = ClusterMode::ByRelationship;
    cfg.clusterRelationshipKind = "at_war_with";
    cfg.minClusterSize = 2;
    cfg.cooldownTag = "war_brewing";
    TriggerAction tag;
    tag.type = ActionType::SetClusterTag;
    tag.key = "war_brewing";
    cfg.actions.push_back(tag);
    TriggerAction pressure;
    pressure.type = ActionType::ModifyPressure;
    pressure.pressure = "conflict";
    pressure.delta = 3.0;
    cfg.actions.push_back(pressure);
    return cfg;
}

// ---------- Seed world ----------

WorldSetup makeFrostWorld() {
    WorldSetup setup;
    setup.schema = std::make_shared<FrostDomain>();
    setup.eras = frostEras();
    setup.pressures = frostPressures();

    auto& e = setup.entities;
    e.push_back(seedLocation("loc_aurora", "colony", "Aurora Berg", "thriving", 0.5, {0.0, 0.0, 0.0}));
    e.push_back(seedLocation("loc_glacier", "colony", "Glacier Reach", "thriving", 0.45, {20.0, 5.0, 0.0}));
    e.push_back(seedLocation("loc_frostmaw", "colony", "Frostmaw Shelf", "waning", 0.3, {-15.0, 18.0, 0.0}));
    e.push_back(seedLocation("loc_shoals", "geographic_feature", "Krill Shoals", "unspoiled", 0.55, {10.0, -12.0, 0.0}));
    e.back().tags.setFlag("resource");
    e.push_back(seedLocation("loc_fissure", "anomaly", "Whisper Fissure", "active", 0.65, {-8.0, -20.0, 0.0}));
    e.back().tags.setFlag("mystical");

    e.push_back(seedEntity("fac_council", "faction", "political", "The Icebound Council", "active",
                           "The elected council that keeps order on Aurora Berg."));
    e.back().tags.setFlag("traditional");
    e.push_back(seedEntity("fac_traders", "faction", "company", "The Deepwater Traders", "active",
                           "Merchants who run the krill routes between colonies."));
    e.push_back(seedEntity("fac_shadow", "faction", "criminal", "The Shadow Pod", "active",
                           "Smugglers who answer to no council."));

    e.push_back(seedEntity("npc_mayor", "npc", "mayor", "Mayor Holt Floehart", "alive", "Mayor of Aurora Berg."));
    e.back().prominence = Prominence::Renowned;
    e.push_back(seedEntity("npc_hero", "npc", "hero", "Wren Saltcrest", "alive", "A young diver with a reckless streak."));
    e.back().prominence = Prominence::Recognized;
    e.back().tags.setFlag("charismatic");
    e.push_back(seedEntity("npc_trader", "npc", "merchant", "Fen Deepwater", "alive", "Head of the Deepwater Traders."));
    e.back().prominence = Prominence::Recognized;
    e.push_back(seedEntity("npc_clerk", "npc", "merchant", "Pip Coldfin", "alive", "A ledger keeper for the traders."));
    e.push_back(seedEntity("npc_outlaw", "npc", "outlaw", "Sleet Rimeback", "alive", "Leader of the Shadow Pod."));
    e.back().prominence = Prominence::Recognized;
    e.push_back(seedEntity("npc_smuggler", "npc", "outlaw", "Grebe Icewake", "alive", "A smuggler of the Shadow Pod."));
    e.push_back(seedEntity("npc_elder", "npc", "mayor", "Ysolde Shelfborn", "alive", "Elder of Frostmaw Shelf."));
    e.push_back(seedEntity("npc_guard", "npc", "hero", "Tarn Floehart", "alive", "Council guard on Aurora Berg."));

    e.push_back(seedEntity("rule_catch", "rules", "edict", "The Accord of the Shared Catch", "enacted",
                           "Every colony may fish the Krill Shoals in turn."));
    e.push_back(seedEntity("abl_icesight", "abilities", "magic", "Ice Sight", "active",
                           "Visions glimpsed in the glow of the fissure."));
    e.push_back(seedEntity("abl_drilling", "abilities", "technology", "Ice Drilling", "active",
                           "Bore holes through the shelf to reach the fish below."));

    auto relate = [&setup](const char* kind, const char* src, const char* dst) {
        setup.relationships.push_back(SeedRelationship{kind, src, dst, std::nullopt, std::nullopt});
    };
    relate("adjacent_to", "loc_aurora", "loc_glacier");
    relate("adjacent_to", "loc_glacier", "loc_aurora");
    relate("adjacent_to", "loc_aurora", "loc_frostmaw");
    relate("adjacent_to", "loc_frostmaw", "loc_aurora");
    relate("adjacent_to", "loc_glacier", "loc_shoals");
    relate("adjacent_to", "loc_shoals", "loc_glacier");
    relate("adjacent_to", "loc_frostmaw", "loc_fissure");
    relate("adjacent_to", "loc_fissure", "loc_frostmaw");

    relate("controls", "fac_council", "loc_aurora");
    relate("controls", "fac_traders", "loc_glacier");
    relate("occupies", "fac_shadow", "loc_frostmaw");
    relate("at_war_with", "fac_council", "fac_shadow");

    relate("resident_of", "npc_mayor", "loc_aurora");
    relate("resident_of", "npc_hero", "loc_aurora");
    relate("resident_of", "npc_guard", "loc_aurora");
    relate("resident_of", "npc_trader", "loc_glacier");
    relate("resident_of", "npc_clerk", "loc_glacier");
    relate("resident_of", "npc_outlaw", "loc_frostmaw");
    relate("resident_of", "npc_smuggler", "loc_frostmaw");
    relate("resident_of", "npc_elder", "loc_frostmaw");

    relate("leader_of", "npc_mayor", "fac_council");
    relate("member_of", "npc_mayor", "fac_council");
    relate("member_of", "npc_guard", "fac_council");
    relate("member_of", "npc_hero", "fac_council");
    relate("leader_of", "npc_trader", "fac_traders");
    relate("member_of", "npc_trader", "fac_traders");
    relate("member_of", "npc_clerk", "fac_traders");
    relate("leader_of", "npc_outlaw", "fac_shadow");
    relate("member_of", "npc_outlaw", "fac_shadow");
    relate("member_of", "npc_smuggler", "fac_shadow");

    relate("follower_of", "npc_guard", "npc_mayor");
    relate("mentor_of", "npc_elder", "npc_hero");
    relate("enemy_of", "npc_hero", "npc_outlaw");

    relate("originated_in", "rule_catch", "loc_aurora");
    relate("champion_of", "npc_mayor", "rule_catch");
    relate("manifests_at", "abl_icesight", "loc_fissure");
    relate("practitioner_of", "npc_elder", "abl_icesight");
    relate("originated_in", "abl_drilling", "loc_glacier");
    relate("practitioner_of", "fac_traders", "abl_drilling");
    relate("discoverer_of", "npc_clerk", "abl_drilling");

    return setup;
}

void registerFrostSystems(WorldEngine& engine) {
    engine.addSystem(std::make_unique<RelationshipDecay>());
    engine.addSystem(std::make_unique<RelationshipReinforcement>());
    engine.addSystem(std::make_unique<RelationshipFormation>());
    engine.addSystem(std::make_unique<ConflictContagion>());
    engine.addSystem(std::make_unique<ResourceFlow>());
    engine.addSystem(std::make_unique<CulturalDrift>());
    engine.addSystem(std::make_unique<ProminenceEvolution>());
    engine.addSystem(std::make_unique<AllianceFormation>());
    engine.addSystem(std::make_unique<LegendCrystallization>());
    engine.addSystem(std::make_unique<ThermalCascade>());
    engine.addSystem(std::make_unique<BeliefContagion>());
    engine.addSystem(std::make_unique<SuccessionVacuum>());
    engine.addSystem(std::make_unique<ThresholdTrigger>(warBrewingTrigger()));
    engine.addSystem(std::make_unique<RelationshipCulling>());
}

void registerFrostTemplates(WorldEngine& engine) {
    const DiscoveryConfig discovery = frostDiscoveryConfig();
    engine.addTemplate(std::make_unique<HeroEmergence>());
    engine.addTemplate(std::make_unique<KinshipConstellation>());
    engine.addTemplate(std::make_unique<MysteriousVanishing>());
    engine.addTemplate(std::make_unique<FactionSplinter>());
    engine.addTemplate(std::make_unique<CultFormation>());
    engine.addTemplate(std::make_unique<ColonyFounding>());
    engine.addTemplate(std::make_unique<ResourceLocationDiscovery>(discovery));
    engine.addTemplate(std::make_unique<StrategicLocationDiscovery>(discovery));
    engine.addTemplate(std::make_unique<MysticalLocationDiscovery>(discovery));
    engine.addTemplate(std::make_unique<IdeologyEmergence>());
    engine.addTemplate(std::make_unique<MagicDiscovery>());
    engine.addTemplate(std::make_unique<TechInnovation>());
}

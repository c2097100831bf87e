#include "templates/NpcTemplates.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
bool isColony(const Entity& e) {
    return e.kind == "location" && e.subtype == "colony" && e.status != "abandoned";
}

bool isNotable(const Entity& npc) {
    return npc.status == "alive" && npc.prominence >= Prominence::Recognized;
}

// Factions a threshold trigger has marked as heading for war
bool warBrewing(const WorldGraph& graph) {
    for (const Entity* f : graph.findEntities({std::string("faction"), std::nullopt, std::nullopt})) {
        if (f->tags.has("war_brewing")) return true;
    }
    return false;
}

std::vector<const Entity*> liveColonies(const WorldGraph& graph) {
    std::vector<const Entity*> out;
    for (const Entity* e : graph.findEntities({std::string("location"), std::string("colony"), std::nullopt})) {
        if (isColony(*e)) out.push_back(e);
    }
    return out;
}

enum class FamilyRole { Matriarch, Patriarch, Provider, Prodigy, BlackSheep, Bridge, Hermit };

const char* roleName(FamilyRole role) {
    switch (role) {
        case FamilyRole::Matriarch: return "matriarch";
        case FamilyRole::Patriarch: return "patriarch";
        case FamilyRole::Provider: return "provider";
        case FamilyRole::Prodigy: return "prodigy";
        case FamilyRole::BlackSheep: return "black sheep";
        case FamilyRole::Bridge: return "bridge";
        case FamilyRole::Hermit: return "hermit";
    }
    return "provider";
}

const char* roleSubtype(FamilyRole role) {
    switch (role) {
        case FamilyRole::Matriarch:
        case FamilyRole::Patriarch: return "mayor";
        case FamilyRole::Prodigy: return "hero";
        case FamilyRole::BlackSheep: return "outlaw";
        default: return "merchant";
    }
}

// Local energy of spin i on an open chain: -J s_i (s_{i-1} + s_{i+1}) - h s_i
double siteEnergy(const std::vector<int>& spins, std::size_t i, double coupling, double field) {
    int neighbours = 0;
    if (i > 0) neighbours += spins[i - 1];
    if (i + 1 < spins.size()) neighbours += spins[i + 1];
    return -coupling * spins[i] * neighbours - field * spins[i];
}
}

// ---------- HeroEmergence ----------

bool HeroEmergence::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (liveColonies(graph).empty()) return false;
    if (saturated(graph, "npc", "hero", cfg_.target)) return false;

    const double conflict = graph.getPressure("conflict");
    if (conflict > cfg_.suppressAbove) {
        return chance(cfg_.suppressedChance, rng);
    }
    if (conflict >= cfg_.minConflict || graph.getPressure("external_threat") >= cfg_.minConflict ||
        warBrewing(graph)) {
        return true;
    }
    return chance(cfg_.quietChance, rng);
}

std::vector<const Entity*> HeroEmergence::findTargets(const WorldGraph& graph) const {
    return liveColonies(graph);
}

TemplateResult HeroEmergence::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("No colony for a hero to rise in");
    }

    EntitySpec hero;
    hero.kind = "npc";
    hero.subtype = "hero";
    hero.name = generateEntityName(graph, "npc", "hero", rng);
    hero.description = "A hero risen from " + target->name + " in troubled times.";
    hero.status = "alive";
    hero.culture = target->culture;
    hero.tags.setFlag("brave");
    hero.coordinates = deriveCoordinates(graph, {target->id});

    TemplateResult result;
    const EntityRef ref = result.addEntity(hero);
    result.relate("resident_of", ref, target->id);

    std::vector<const Entity*> patrons = getRelated(graph, target->id, "controls", Direction::Incoming);
    if (patrons.empty()) patrons = getRelated(graph, target->id, "occupies", Direction::Incoming);
    if (!patrons.empty()) {
        result.relate("member_of", ref, pickRandom(patrons, rng)->id);
    }

    std::vector<const Entity*> locals;
    for (const Entity* npc : getResidents(graph, target->id)) {
        if (npc->status == "alive") locals.push_back(npc);
    }
    for (const Entity* follower : pickMultiple(locals, cfg_.maxFollowers, rng)) {
        result.relate("follower_of", follower->id, ref);
    }

    result.description = hero.name + " emerges as a hero of " + target->name;
    return result;
}

// ---------- KinshipConstellation ----------

bool KinshipConstellation::canApply(const WorldGraph& graph, std::mt19937_64& /*rng*/) const {
    const auto factions = graph.findEntities({std::string("faction"), std::nullopt, std::string("active")});
    const auto npcs = graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")});
    return !factions.empty() && !liveColonies(graph).empty() && npcs.size() < cfg_.maxNpcs;
}

std::vector<const Entity*> KinshipConstellation::findTargets(const WorldGraph& graph) const {
    return graph.findEntities({std::string("faction"), std::nullopt, std::string("active")});
}

TemplateResult KinshipConstellation::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("Cannot create a family without a faction");
    }

    const Entity* home = nullptr;
    const auto controlled = getRelated(graph, target->id, "controls", Direction::Outgoing);
    if (!controlled.empty()) {
        home = controlled.front();
    } else {
        const auto colonies = liveColonies(graph);
        if (!colonies.empty()) home = pickRandom(colonies, rng);
    }
    if (!home) {
        return TemplateResult::none(target->name + " has no location for a family to settle");
    }

    const int size = randomInt(cfg_.minFamily, cfg_.maxFamily, rng);
    std::vector<FamilyRole> roles = {FamilyRole::Matriarch, FamilyRole::Provider, FamilyRole::Prodigy,
                                     FamilyRole::BlackSheep, FamilyRole::Bridge};
    if (size > 5) roles.push_back(FamilyRole::Hermit);
    if (size > 6) roles.push_back(FamilyRole::Patriarch);
    while (static_cast<int>(roles.size()) < size) roles.push_back(FamilyRole::Provider);
    roles.resize(static_cast<std::size_t>(size));

    std::vector<int> spins(roles.size());
    for (auto& s : spins) s = chance(0.5, rng) ? 1 : -1;
    const double field = target->tags.has("traditional") ? cfg_.field : -cfg_.field;
    std::uniform_int_distribution<std::size_t> site(0, spins.size() - 1);
    for (int sweep = 0; sweep < cfg_.sweeps; ++sweep) {
        const std::size_t i = site(rng);
        const double before = siteEnergy(spins, i, cfg_.coupling, field);
        spins[i] = -spins[i];
        const double delta = siteEnergy(spins, i, cfg_.coupling, field) - before;
        if (!chance(std::min(1.0, std::exp(-delta / cfg_.temperature)), rng)) {
            spins[i] = -spins[i];
        }
    }

    const std::string family = generateEntityName(graph, "npc", "family", rng);
    TemplateResult result;
    std::vector<EntityRef> members;
    for (std::size_t i = 0; i < roles.size(); ++i) {
        const FamilyRole role = roles[i];
        const bool traditional = spins[i] > 0;
        EntitySpec npc;
        npc.kind = "npc";
        npc.subtype = roleSubtype(role);
        npc.name = generateEntityName(graph, "npc", npc.subtype, rng) + " " + family;
        npc.description = std::string("A ") + roleName(role) + " of the " + family + " family, " +
                          (traditional ? "upholding tradition." : "embracing change.");
        npc.status = "alive";
        npc.prominence = role == FamilyRole::Prodigy ? Prominence::Recognized : Prominence::Marginal;
        npc.culture = target->culture.empty() ? home->culture : target->culture;
        npc.tags.set("family", family);
        npc.tags.setFlag(traditional ? "traditional" : "radical");
        if (role == FamilyRole::Prodigy) npc.tags.setFlag("talented");
        if (role == FamilyRole::BlackSheep) npc.tags.setFlag("rebellious");
        npc.coordinates = deriveCoordinates(graph, {home->id});

        const EntityRef ref = result.addEntity(std::move(npc));
        result.relate("resident_of", ref, home->id);
        result.relate("member_of", ref, target->id);
        if (i > 0) result.relate("family_of", ref, members.front());
        members.push_back(ref);
    }

    // Elder mentors the prodigy
    result.relate("mentor_of", members[0], members[2]);

    std::set<std::pair<std::size_t, std::size_t>> rivals;
    for (std::size_t i = 0; i + 1 < members.size(); ++i) {
        if (spins[i] != spins[i + 1] && chance(cfg_.rivalChance, rng)) {
            result.relate("rival_of", members[i], members[i + 1]);
            rivals.insert({i, i + 1});
        }
    }

    const auto bridge = std::find(roles.begin(), roles.end(), FamilyRole::Bridge) - roles.begin();
    const auto provider = std::find(roles.begin(), roles.end(), FamilyRole::Provider) - roles.begin();
    const auto lo = static_cast<std::size_t>(std::min(bridge, provider));
    const auto hi = static_cast<std::size_t>(std::max(bridge, provider));
    if (!rivals.count({lo, hi}) && chance(cfg_.loverChance, rng)) {
        result.relate("lover_of", members[static_cast<std::size_t>(bridge)], members[static_cast<std::size_t>(provider)]);
    }

    result.description = "The " + family + " family (" + std::to_string(size) + ") settles in " + home->name +
                         " under " + target->name;
    return result;
}

// ---------- MysteriousVanishing ----------

bool MysteriousVanishing::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (!chance(cfg_.activationChance, rng)) return false;
    if (graph.findEntities({std::string("location"), std::string("anomaly"), std::nullopt}).empty()) return false;
    return !findTargets(graph).empty();
}

std::vector<const Entity*> MysteriousVanishing::findTargets(const WorldGraph& graph) const {
    std::vector<const Entity*> out;
    for (const Entity* npc : graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")})) {
        if (isNotable(*npc)) out.push_back(npc);
    }
    return out;
}

TemplateResult MysteriousVanishing::expand(WorldGraph& graph, const Entity* /*target*/, std::mt19937_64& rng) {
    // Victim drawn by proximity weight rather than the uniform target pick
    const auto candidates = findTargets(graph);
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const Entity* npc : candidates) {
        const Entity* home = getLocation(graph, npc->id);
        double weight = 0.0;
        if (home) {
            if (home->subtype == "anomaly") {
                weight = 10.0;
            } else {
                for (const Entity* n : getRelated(graph, home->id, "adjacent_to", Direction::Both)) {
                    if (n->subtype == "anomaly") weight += 3.0;
                }
            }
        }
        if (npc->prominence == Prominence::Mythic) weight *= 2.0;
        if (npc->prominence == Prominence::Renowned) weight *= 1.5;
        weights.push_back(weight);
    }

    const std::size_t pick = weightedIndex(weights, rng);
    if (pick >= candidates.size()) {
        return TemplateResult::none("No notable NPCs near anomalies to vanish");
    }
    const Entity* victim = candidates[pick];
    const Entity* lastHome = getLocation(graph, victim->id);

    TemplateResult result;
    EntityRef site = lastHome->id;
    if (lastHome->subtype != "anomaly") {
        EntitySpec anomaly;
        anomaly.kind = "location";
        anomaly.subtype = "anomaly";
        anomaly.name = lastHome->name + " (Site of " + victim->name + "'s Disappearance)";
        anomaly.description = "A strange glow lingers where " + victim->name + " was last seen.";
        anomaly.status = "thriving";
        anomaly.prominence = Prominence::Recognized;
        anomaly.culture = lastHome->culture;
        anomaly.tags.setFlag("mystery");
        anomaly.tags.setFlag("vanishing");
        anomaly.tags.set("temp", lastHome->tags.getString("temp", "0.500"));
        anomaly.coordinates = deriveCoordinates(graph, {lastHome->id});
        site = result.addEntity(std::move(anomaly));
        result.relate("adjacent_to", site, lastHome->id);
    }

    result.relate("last_seen_at", victim->id, site);
    EntityChanges missing;
    missing.status = "missing";
    result.modify(victim->id, missing);

    std::vector<const Entity*> lovedOnes;
    std::set<std::string> seen;
    auto consider = [&](const std::vector<const Entity*>& group) {
        for (const Entity* e : group) {
            if (e->status == "alive" && e->id != victim->id && seen.insert(e->id).second) lovedOnes.push_back(e);
        }
    };
    consider(getRelated(graph, victim->id, "lover_of", Direction::Incoming));
    consider(getRelated(graph, victim->id, "follower_of", Direction::Incoming));
    consider(getRelated(graph, victim->id, "mentor_of", Direction::Outgoing));

    std::size_t searchers = 0;
    // Searchers keep their old bond; the search is what remains of it
    for (const Entity* searcher : pickMultiple(lovedOnes, cfg_.maxSearchers, rng)) {
        result.relate("searching_for", searcher->id, victim->id);
        ++searchers;
    }

    result.description = victim->name + " vanishes near " + lastHome->name + "; " + std::to_string(searchers) +
                         " begin a desperate search";
    return result;
}

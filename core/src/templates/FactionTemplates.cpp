#include "templates/FactionTemplates.h"

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
std::vector<const Entity*> activeMembers(const WorldGraph& graph, const std::string& factionId) {
    std::vector<const Entity*> out;
    for (const Entity* npc : getRelated(graph, factionId, "member_of", Direction::Incoming)) {
        if (npc->status == "alive") out.push_back(npc);
    }
    return out;
}

bool isLeader(const WorldGraph& graph, const std::string& npcId) {
    return !getRelated(graph, npcId, "leader_of", Direction::Outgoing).empty();
}

std::string splinterSubtype(const std::string& parent, std::mt19937_64& rng) {
    const double roll = uniform01(rng);
    if (parent == "political") {
        if (roll < 0.2) return "criminal";
        if (roll < 0.4) return "cult";
        return "political";
    }
    if (parent == "company") {
        return roll < 0.3 ? "criminal" : "company";
    }
    return parent.empty() ? "political" : parent;
}

const Entity* factionSeat(const WorldGraph& graph, const Entity& faction, std::mt19937_64& rng) {
    for (const char* kind : {"controls", "occupies"}) {
        const auto held = getRelated(graph, faction.id, kind, Direction::Outgoing);
        if (!held.empty()) return held.front();
    }
    const auto colonies = graph.findEntities({std::string("location"), std::string("colony"), std::nullopt});
    return colonies.empty() ? nullptr : pickRandom(colonies, rng);
}
}

// ---------- FactionSplinter ----------

bool FactionSplinter::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (saturated(graph, "faction", "", cfg_.target)) return false;
    if (findTargets(graph).empty()) return false;
    if (graph.getPressure("conflict") > cfg_.tensionThreshold ||
        graph.getPressure("cultural_tension") > cfg_.tensionThreshold) {
        return true;
    }
    return chance(cfg_.quietChance, rng);
}

std::vector<const Entity*> FactionSplinter::findTargets(const WorldGraph& graph) const {
    std::vector<const Entity*> out;
    for (const Entity* f : graph.findEntities({std::string("faction"), std::nullopt, std::nullopt})) {
        if (f->status == "dissolved") continue;
        if (activeMembers(graph, f->id).size() >= cfg_.minMembers) out.push_back(f);
    }
    return out;
}

TemplateResult FactionSplinter::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("Cannot splinter without a parent faction");
    }
    const Entity* seat = factionSeat(graph, *target, rng);
    if (!seat) {
        return TemplateResult::none(target->name + " cannot splinter: no locations available");
    }

    const std::string subtype = splinterSubtype(target->subtype, rng);
    const bool radical = subtype != target->subtype;
    const double distance = radical ? randomRange(0.6, 0.8, rng) : randomRange(0.15, 0.35, rng);

    EntitySpec splinter;
    splinter.kind = "faction";
    splinter.subtype = subtype;
    splinter.name = generateEntityName(graph, "faction", subtype, rng);
    splinter.description = "A splinter group that broke away from " + target->name + ".";
    splinter.status = "active";
    splinter.culture = target->culture;
    splinter.tags.setFlag("splinter");
    for (const auto& [key, value] : target->tags.entries()) {
        if (splinter.tags.size() >= 3) break;
        if (key != "splinter") splinter.tags.set(key, value);
    }

    TemplateResult result;
    const EntityRef ref = result.addEntity(std::move(splinter));
    result.relate("split_from", ref, target->id, std::nullopt, distance);
    result.relate("at_war_with", ref, target->id);
    result.relate("occupies", ref, seat->id);

    std::vector<const Entity*> members = activeMembers(graph, target->id);
    std::vector<const Entity*> followers;
    std::copy_if(members.begin(), members.end(), std::back_inserter(followers),
                 [&](const Entity* m) { return !isLeader(graph, m->id); });

    std::string leaderName;
    if (!followers.empty()) {
        const Entity* defector = pickRandom(followers, rng);
        leaderName = defector->name;
        result.archive(defector->id, target->id, "member_of");
        result.relate("leader_of", defector->id, ref);
        result.relate("member_of", defector->id, ref);
        if (!getLocation(graph, defector->id)) {
            result.relate("resident_of", defector->id, seat->id);
        }
    } else {
        EntitySpec leader;
        leader.kind = "npc";
        leader.subtype = chance(cfg_.newLeaderHeroChance, rng) ? "hero" : "outlaw";
        leader.name = generateEntityName(graph, "npc", leader.subtype, rng);
        leader.description = "Charismatic leader of a faction that broke away from " + target->name + ".";
        leader.status = "alive";
        leader.prominence = Prominence::Recognized;
        leader.culture = target->culture;
        leader.tags.setFlag("rebel");
        leader.tags.setFlag("charismatic");
        leaderName = leader.name;
        const EntityRef leaderRef = result.addEntity(std::move(leader));
        result.relate("leader_of", leaderRef, ref);
        result.relate("member_of", leaderRef, ref);
        result.relate("resident_of", leaderRef, seat->id);
    }

    result.adjustPressure("conflict", 3.0);
    result.description = leaderName + " leads a splinter faction away from " + target->name;
    return result;
}

// ---------- CultFormation ----------

bool CultFormation::canApply(const WorldGraph& graph, std::mt19937_64& /*rng*/) const {
    const bool anomalies = !graph.findEntities({std::string("location"), std::string("anomaly"), std::nullopt}).empty();
    const bool magic = !graph.findEntities({std::string("abilities"), std::string("magic"), std::nullopt}).empty();
    if (!anomalies && !magic) return false;
    return !saturated(graph, "faction", "cult", cfg_.target);
}

std::vector<const Entity*> CultFormation::findTargets(const WorldGraph& graph) const {
    std::vector<const Entity*> out;
    std::vector<std::string> seen;
    auto add = [&](const Entity* e) {
        if (std::find(seen.begin(), seen.end(), e->id) != seen.end()) return;
        seen.push_back(e->id);
        out.push_back(e);
    };
    for (const Entity* anomaly : graph.findEntities({std::string("location"), std::string("anomaly"), std::nullopt})) {
        add(anomaly);
        for (const Entity* near : getRelated(graph, anomaly->id, "adjacent_to", Direction::Both)) {
            add(near);
        }
    }
    return out;
}

TemplateResult CultFormation::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("Cannot form a cult: no anomaly nearby");
    }

    EntitySpec cult;
    cult.kind = "faction";
    cult.subtype = "cult";
    cult.name = generateEntityName(graph, "faction", "cult", rng);
    cult.description = "A mystical cult drawn to the power near " + target->name + ".";
    cult.status = "active";
    cult.culture = target->culture;
    cult.tags.setFlag("mystical");
    cult.tags.setFlag("secretive");

    EntitySpec prophet;
    prophet.kind = "npc";
    prophet.subtype = "hero";
    prophet.name = generateEntityName(graph, "npc", "hero", rng);
    prophet.description = "The enigmatic prophet of " + cult.name + ".";
    prophet.status = "alive";
    prophet.culture = target->culture;
    prophet.tags.setFlag("prophet");
    prophet.tags.setFlag("mystic");
    prophet.coordinates = deriveCoordinates(graph, {target->id});

    TemplateResult result;
    const std::string cultName = cult.name;
    const std::string prophetName = prophet.name;
    const EntityRef cultRef = result.addEntity(std::move(cult));
    const EntityRef prophetRef = result.addEntity(std::move(prophet));
    result.relate("occupies", cultRef, target->id);
    result.relate("leader_of", prophetRef, cultRef);
    result.relate("member_of", prophetRef, cultRef);
    result.relate("resident_of", prophetRef, target->id);

    const auto alive = graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")});
    std::vector<const Entity*> drifters;
    for (const Entity* npc : alive) {
        if (npc->subtype == "mayor") continue;
        if (!getRelated(graph, npc->id, "member_of", Direction::Outgoing).empty()) continue;
        drifters.push_back(npc);
    }
    const auto& pool = drifters.size() >= cfg_.cultists ? drifters : alive;
    const std::size_t recruits = std::min(cfg_.cultists, pool.size());
    for (std::size_t i = 0; i < recruits; ++i) {
        const Entity* cultist = pool[i];
        result.relate("member_of", cultist->id, cultRef);
        const Entity* home = getLocation(graph, cultist->id);
        if (home && home->id != target->id) {
            result.archive(cultist->id, home->id, "resident_of");
        }
        result.relate("resident_of", cultist->id, target->id);
    }

    const auto magic = graph.findEntities({std::string("abilities"), std::string("magic"), std::nullopt});
    if (!magic.empty()) {
        result.relate("seeks", cultRef, magic.front()->id);
        result.relate("practitioner_of", prophetRef, magic.front()->id);
    }

    result.adjustPressure("cultural_tension", 2.0);
    result.description = cultName + " forms with " + prophetName + " as prophet and " +
                         std::to_string(recruits) + " followers";
    return result;
}

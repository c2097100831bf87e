#include "templates/AbilityTemplates.h"

#include <string>
#include <utility>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
std::vector<const Entity*> anomalies(const WorldGraph& graph) {
    return graph.findEntities({std::string("location"), std::string("anomaly"), std::nullopt});
}

std::size_t outgoingCount(const Entity& e, const std::string& kind) {
    std::size_t n = 0;
    for (const auto& link : e.links) {
        if (link.kind == kind && link.status == RelationshipStatus::Active) ++n;
    }
    return n;
}
}

// ---------- MagicDiscovery ----------

bool MagicDiscovery::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    const double instability = graph.getPressure("magical_instability");
    if (instability < cfg_.minInstability) return false;
    if (anomalies(graph).empty() && instability < cfg_.anomalyFreeInstability) return false;
    if (findTargets(graph).empty()) return false;
    if (instability > cfg_.volatileAbove) return chance(cfg_.volatileChance, rng);
    return !saturated(graph, "abilities", "magic", cfg_.target);
}

std::vector<const Entity*> MagicDiscovery::findTargets(const WorldGraph& graph) const {
    std::vector<const Entity*> out;
    for (const Entity* hero : graph.findEntities({std::string("npc"), std::string("hero"), std::nullopt})) {
        if (outgoingCount(*hero, "discoverer_of") < cfg_.maxDiscoveriesPerHero) out.push_back(hero);
    }
    return out;
}

TemplateResult MagicDiscovery::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("Cannot discover magic - no heroes exist");
    }
    const auto sites = anomalies(graph);
    const Entity* anomaly = sites.empty() ? nullptr : pickRandom(sites, rng);

    std::vector<const Entity*> existing;
    for (const Entity* m : graph.findEntities({std::string("abilities"), std::string("magic"), std::nullopt})) {
        if (m->status != "lost") existing.push_back(m);
    }
    const Entity* parent = nullptr;
    if (!existing.empty()) {
        std::vector<const Entity*> local;
        if (anomaly) {
            for (const Entity* m : existing) {
                if (hasRelationship(graph, m->id, anomaly->id, "manifests_at")) local.push_back(m);
            }
        }
        parent = pickRandom(local.empty() ? existing : local, rng);
    }

    EntitySpec magic;
    magic.kind = "abilities";
    magic.subtype = "magic";
    magic.name = generateEntityName(graph, "abilities", "magic", rng);
    magic.description = "Mystical ability discovered by " + target->name +
                        (parent ? " related to " + parent->name : std::string());
    magic.status = "emergent";
    magic.prominence = Prominence::Recognized;
    magic.culture = !target->culture.empty() ? target->culture : (anomaly ? anomaly->culture : std::string());
    magic.tags.setFlag("magic");
    magic.tags.setFlag("mystical");
    const std::string magicName = magic.name;

    TemplateResult result;
    const EntityRef ref = result.addEntity(std::move(magic));
    result.relate("discoverer_of", target->id, ref);
    result.relate("practitioner_of", target->id, ref);
    if (anomaly) {
        result.relate("manifests_at", ref, anomaly->id);
    }
    if (parent) {
        result.relate("related_to", ref, parent->id, 0.5, randomRange(0.5, 0.9, rng));
    }
    result.adjustPressure("magical_instability", 2.0);
    result.description = target->name + " discovers " + magicName +
                         (anomaly ? " at " + anomaly->name : std::string(" through mystical insight"));
    return result;
}

// ---------- TechInnovation ----------

bool TechInnovation::canApply(const WorldGraph& graph, std::mt19937_64& /*rng*/) const {
    if (saturated(graph, "abilities", "technology", cfg_.target)) return false;
    return !findTargets(graph).empty();
}

std::vector<const Entity*> TechInnovation::findTargets(const WorldGraph& graph) const {
    std::vector<const Entity*> out;
    for (const Entity* f : graph.findEntities({std::string("faction"), std::nullopt, std::nullopt})) {
        if (f->status != "dissolved" && outgoingCount(*f, "controls") > 0) out.push_back(f);
    }
    return out;
}

TemplateResult TechInnovation::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target || target->kind != "faction") {
        return TemplateResult::none("No valid faction target");
    }
    const auto held = getRelated(graph, target->id, "controls", Direction::Outgoing);
    if (held.empty()) {
        return TemplateResult::none(target->name + " controls no locations for innovation");
    }
    const Entity* origin = pickRandom(held, rng);

    std::vector<const Entity*> active;
    std::vector<const Entity*> practised;
    for (const Entity* tech : graph.findEntities({std::string("abilities"), std::string("technology"), std::string("active")})) {
        active.push_back(tech);
        if (hasRelationship(graph, target->id, tech->id, "practitioner_of")) practised.push_back(tech);
    }
    const Entity* parent = nullptr;
    if (!active.empty()) parent = pickRandom(practised.empty() ? active : practised, rng);

    std::vector<std::string> refs = {target->id, origin->id};
    if (parent) refs.push_back(parent->id);

    EntitySpec tech;
    tech.kind = "abilities";
    tech.subtype = "technology";
    tech.name = generateEntityName(graph, "abilities", "technology", rng);
    tech.description = "A breakthrough developed by " + target->name + " at " + origin->name + ".";
    tech.status = "active";
    tech.prominence = Prominence::Recognized;
    tech.culture = target->culture;
    tech.tags.setFlag("technology");
    tech.tags.setFlag("innovation");
    if (!target->subtype.empty()) tech.tags.setFlag(target->subtype);
    tech.coordinates = deriveCoordinates(graph, refs);
    const std::string techName = tech.name;

    TemplateResult result;
    const EntityRef ref = result.addEntity(std::move(tech));
    result.relate("practitioner_of", target->id, ref);
    result.relate("originated_in", ref, origin->id);
    if (parent) {
        result.relate("derived_from", ref, parent->id, std::nullopt, randomRange(0.2, 0.4, rng));
    }
    if (const Entity* leader = getFactionLeader(graph, target->id)) {
        result.relate("discoverer_of", leader->id, ref);
    }
    result.adjustPressure("stability", 1.0);
    result.description = target->name + " develops " + techName + " at " + origin->name +
                         (parent ? " building on " + parent->name : std::string());
    return result;
}

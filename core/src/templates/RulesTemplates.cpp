#include "templates/RulesTemplates.h"

#include <string>
#include <utility>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
struct IdeologyFlavor {
    std::vector<std::string> subtypes;
    std::vector<std::string> themes;
};

const IdeologyFlavor& flavorFor(const WorldGraph& graph) {
    static const IdeologyFlavor kMartial{{"edict", "social"}, {"militarism", "pacifism", "unity", "isolation"}};
    static const IdeologyFlavor kSocial{{"social"}, {"equality", "tradition", "innovation", "hierarchy"}};
    static const IdeologyFlavor kMystic{{"taboo", "social"}, {"mysticism", "rationalism", "asceticism", "hedonism"}};
    if (graph.getPressure("conflict") > 60.0) return kMartial;
    if (graph.getPressure("cultural_tension") > 50.0) return kSocial;
    return kMystic;
}
}

bool IdeologyEmergence::canApply(const WorldGraph& graph, std::mt19937_64& rng) const {
    if (graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")}).size() < cfg_.minAliveNpcs) {
        return false;
    }
    if (graph.getPressure("cultural_tension") > cfg_.tensionThreshold) return true;
    const std::string& era = graph.currentEra().id;
    if (era == "innovation" || era == "reconstruction") return true;
    return graph.getPressure("stability") < cfg_.unstableBelow && chance(cfg_.unstableChance, rng);
}

std::vector<const Entity*> IdeologyEmergence::findTargets(const WorldGraph& graph) const {
    const auto alive = graph.findEntities({std::string("npc"), std::nullopt, std::string("alive")});
    std::vector<const Entity*> charismatic;
    for (const Entity* npc : alive) {
        if (npc->subtype == "hero" || npc->tags.has("charismatic") || npc->tags.has("mystic")) {
            charismatic.push_back(npc);
        }
    }
    return charismatic.empty() ? alive : charismatic;
}

TemplateResult IdeologyEmergence::expand(WorldGraph& graph, const Entity* target, std::mt19937_64& rng) {
    if (!target) {
        return TemplateResult::none("No champion found for ideology");
    }

    const IdeologyFlavor& flavor = flavorFor(graph);
    const std::string subtype = pickRandom(flavor.subtypes, rng);
    const std::string theme = pickRandom(flavor.themes, rng);

    EntitySpec ideology;
    ideology.kind = "rules";
    ideology.subtype = subtype;
    ideology.name = generateEntityName(graph, "rules", subtype, rng);
    ideology.description = "A " + theme + " ideology championed by " + target->name + ".";
    ideology.status = "proposed";
    ideology.culture = target->culture;
    ideology.tags.setFlag(theme);
    ideology.tags.setFlag("ideology");
    if (theme == "innovation" || theme == "equality") ideology.tags.setFlag("radical");
    const std::string ideologyName = ideology.name;

    TemplateResult result;
    const EntityRef ref = result.addEntity(std::move(ideology));
    result.relate("champion_of", target->id, ref);
    if (const Entity* home = getLocation(graph, target->id)) {
        result.relate("originated_in", ref, home->id);
    }

    std::size_t believers = 0;
    const auto followers = getRelated(graph, target->id, "follower_of", Direction::Incoming);
    for (std::size_t i = 0; i < followers.size() && i < cfg_.followerBelievers; ++i) {
        result.relate("believer_of", followers[i]->id, ref);
        ++believers;
    }
    const auto factions = getRelated(graph, target->id, "member_of", Direction::Outgoing);
    if (!factions.empty()) {
        std::size_t added = 0;
        for (const Entity* member : getFactionMembers(graph, factions.front()->id)) {
            if (added >= cfg_.memberBelievers) break;
            if (member->id == target->id) continue;
            result.relate("believer_of", member->id, ref);
            ++added;
        }
        believers += added;
    }

    result.adjustPressure("cultural_tension", 2.0);
    result.description = target->name + " champions new " + theme + " ideology: " + ideologyName +
                         " (" + std::to_string(believers) + " believers)";
    return result;
}

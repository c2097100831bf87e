#include "modules/LegendCrystallization.h"

#include <set>
#include <vector>
#include "kernel/Queries.h"
#include "kernel/Random.h"

namespace {
struct Archetype {
    const char* ruleSubtype;
    const char* verb;
    const char* theme;
};

Archetype archetypeFor(const std::string& subtype) {
    if (subtype == "hero") return {"taboo", "Never forget", "courage"};
    if (subtype == "mayor") return {"social", "Honor the memory of", "leadership"};
    if (subtype == "merchant") return {"social", "Trade fairly in memory of", "prosperity"};
    if (subtype == "outlaw") return {"taboo", "Never speak ill of", "freedom"};
    return {"social", "Remember", "honor"};
}
}

SystemResult LegendCrystallization::apply(WorldGraph& graph, double eraModifier, std::mt19937_64& rng) {
    if (!rollProbability(cfg_.throttleChance, eraModifier, rng)) {
        return dormant();
    }

    SystemResult result;
    int legends = 0;
    std::set<std::string> renamedHomes;   // one memorial name per home per batch

    for (const Entity* npc : graph.findEntities({std::string("npc"), std::nullopt, std::string("dead")})) {
        if (graph.tick() < npc->updatedAt + cfg_.crystallizationAge) continue;
        if (npc->prominence != Prominence::Renowned && npc->prominence != Prominence::Mythic) continue;

        EntityChanges legend;
        legend.status = "legend";
        legend.prominence = Prominence::Mythic;
        legend.description = npc->description + " Their deeds have passed into legend.";
        result.modify(npc->id, legend);
        ++legends;

        const Entity* home = getLocation(graph, npc->id);
        if (home && renamedHomes.count(home->id) == 0 && home->name.find('(') == std::string::npos &&
            home->name.find(npc->name) == std::string::npos) {
            const std::vector<std::string> suffixes = {
                "(" + npc->name + "'s Fall)", "(" + npc->name + "'s Rest)", "(Echo of " + npc->name + ")",
                "(Where " + npc->name + " Fell)", "(" + npc->name + "'s Memorial)"
            };
            EntityChanges renamed;
            renamed.name = home->name + " " + pickRandom(suffixes, rng);
            result.modify(home->id, renamed);
            result.relate("commemorates", home->id, npc->id);
            renamedHomes.insert(home->id);
        }

        const Archetype archetype = archetypeFor(npc->subtype);
        EntitySpec rule;
        rule.kind = "rules";
        rule.subtype = archetype.ruleSubtype;
        rule.name = std::string(archetype.verb) + " " + npc->name;
        rule.description = "A memorial tradition honoring " + npc->name + ", who embodied " +
                           archetype.theme + " in life and legend.";
        rule.status = "enacted";
        rule.prominence = Prominence::Renowned;
        rule.culture = npc->culture;
        rule.tags.setFlag("memorial");
        rule.tags.set("theme", std::string(archetype.theme));
        const EntityRef ruleRef = result.addEntity(std::move(rule));
        result.relate("commemorates", ruleRef, npc->id);
        if (home) {
            result.relate("originated_in", ruleRef, home->id);
        }
    }

    if (legends == 0) {
        return SystemResult::none(name() + ": no heroes ready for legend");
    }
    result.description = name() + ": " + std::to_string(legends) + " heroes crystallize into legend";
    return result;
}

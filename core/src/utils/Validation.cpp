#include "utils/Validation.h"

#include <map>
#include <sstream>
#include <unordered_map>
#include <omp.h>

namespace {
constexpr std::size_t kMaxDetailLines = 10;
constexpr std::size_t kSampleEntities = 5;

void appendLimited(std::ostringstream& os, const std::vector<std::string>& lines) {
    for (std::size_t i = 0; i < lines.size() && i < kMaxDetailLines; ++i) {
        os << "  - " << lines[i] << "\n";
    }
    if (lines.size() > kMaxDetailLines) {
        os << "  ... and " << (lines.size() - kMaxDetailLines) << " more\n";
    }
}

std::unordered_map<std::string, std::size_t> countBySource(const WorldGraph& graph) {
    std::unordered_map<std::string, std::size_t> counts;
    for (const auto& rel : graph.relationships()) {
        ++counts[rel.src];
    }
    return counts;
}
}

const ValidationResult* ValidationReport::find(const std::string& name) const {
    for (const auto& result : results) {
        if (result.name == name) return &result;
    }
    return nullptr;
}

ValidationResult validateConnectedEntities(const WorldGraph& graph) {
    ValidationResult result;
    result.name = "Connected Entities";

    std::unordered_map<std::string, bool> hasIncoming;
    for (const auto& rel : graph.relationships()) {
        hasIncoming[rel.dst] = true;
    }

    const auto entities = graph.getEntities();
    const std::size_t n = entities.size();
    std::vector<char> unconnected(n, 0);
    #pragma omp parallel for schedule(static)
    for (std::size_t i = 0; i < n; ++i) {
        const Entity& e = *entities[i];
        unconnected[i] = (e.links.empty() && hasIncoming.find(e.id) == hasIncoming.end()) ? 1 : 0;
    }

    std::map<std::string, std::size_t> byKind;
    std::vector<const Entity*> failed;
    for (std::size_t i = 0; i < n; ++i) {
        if (!unconnected[i]) continue;
        failed.push_back(entities[i]);
        result.failedEntities.push_back(entities[i]->id);
        ++byKind[entities[i]->kind + ":" + entities[i]->subtype];
    }

    result.failureCount = failed.size();
    result.passed = failed.empty();
    std::ostringstream os;
    if (result.passed) {
        os << "All entities have at least one connection";
    } else {
        os << failed.size() << " entities have no connections:\n";
        for (const auto& [kind, count] : byKind) {
            os << "  - " << kind << ": " << count << "\n";
        }
        os << "\nSample unconnected entities:\n";
        for (std::size_t i = 0; i < failed.size() && i < kSampleEntities; ++i) {
            os << "  - " << failed[i]->name << " (" << failed[i]->kind << ":" << failed[i]->subtype
               << ", created tick " << failed[i]->createdAt << ")\n";
        }
    }
    result.details = os.str();
    return result;
}

ValidationResult validateEntityStructure(const WorldGraph& graph, const StructureValidator& validator) {
    ValidationResult result;
    result.name = "Entity Structure";
    if (!validator) {
        result.skipped = true;
        result.details = "Skipped: domain provides no entity structure validator";
        return result;
    }

    // kind:subtype -> missing relationship kind -> count
    std::map<std::string, std::map<std::string, std::size_t>> missing;
    for (const Entity* entity : graph.getEntities()) {
        const StructureCheck check = validator(*entity);
        if (check.valid) continue;
        result.failedEntities.push_back(entity->id);
        auto& perKind = missing[entity->kind + ":" + entity->subtype];
        for (const auto& rel : check.missing) {
            ++perKind[rel];
        }
    }

    result.failureCount = result.failedEntities.size();
    result.passed = result.failedEntities.empty();
    std::ostringstream os;
    if (result.passed) {
        os << "All entities have required relationships";
    } else {
        os << result.failureCount << " entities missing required relationships:\n";
        for (const auto& [kindSubtype, rels] : missing) {
            for (const auto& [rel, count] : rels) {
                os << "  - " << kindSubtype << ": " << count << " (missing " << rel << ")\n";
            }
        }
    }
    result.details = os.str();
    return result;
}

ValidationResult validateRelationshipIntegrity(const WorldGraph& graph) {
    ValidationResult result;
    result.name = "Relationship Integrity";

    const auto& rels = graph.relationships();
    const std::size_t n = rels.size();
    std::vector<char> srcMissing(n, 0);
    std::vector<char> dstMissing(n, 0);
    #pragma omp parallel for schedule(static)
    for (std::size_t i = 0; i < n; ++i) {
        srcMissing[i] = graph.hasEntity(rels[i].src) ? 0 : 1;
        dstMissing[i] = graph.hasEntity(rels[i].dst) ? 0 : 1;
    }

    auto displayName = [&](const std::string& id) {
        const Entity* entity = graph.getEntity(id);
        return entity ? entity->name : id;
    };

    std::vector<std::string> broken;
    for (std::size_t i = 0; i < n; ++i) {
        if (!srcMissing[i] && !dstMissing[i]) continue;
        std::ostringstream line;
        line << "[" << i << "] " << rels[i].kind << ": " << displayName(rels[i].src) << " → "
             << displayName(rels[i].dst) << " (" << (srcMissing[i] ? "src missing" : "") << " "
             << (dstMissing[i] ? "dst missing" : "") << ")";
        broken.push_back(line.str());
    }

    result.failureCount = broken.size();
    result.passed = broken.empty();
    std::ostringstream os;
    if (result.passed) {
        os << "All relationships reference existing entities";
    } else {
        os << broken.size() << " broken relationships:\n";
        appendLimited(os, broken);
    }
    result.details = os.str();
    return result;
}

ValidationResult validateLinkSync(const WorldGraph& graph) {
    ValidationResult result;
    result.name = "Link Synchronization";

    const auto sourceCounts = countBySource(graph);
    const auto entities = graph.getEntities();
    const std::size_t n = entities.size();
    std::vector<std::size_t> actual(n, 0);
    #pragma omp parallel for schedule(static)
    for (std::size_t i = 0; i < n; ++i) {
        auto it = sourceCounts.find(entities[i]->id);
        actual[i] = it != sourceCounts.end() ? it->second : 0;
    }

    std::vector<std::string> mismatched;
    for (std::size_t i = 0; i < n; ++i) {
        const Entity& entity = *entities[i];
        if (entity.links.size() == actual[i]) continue;
        result.failedEntities.push_back(entity.id);
        mismatched.push_back(entity.name + ": " + std::to_string(entity.links.size()) +
                             " in links array, " + std::to_string(actual[i]) + " in relationships");
    }

    result.failureCount = mismatched.size();
    result.passed = mismatched.empty();
    std::ostringstream os;
    if (result.passed) {
        os << "All entity links match relationships";
    } else {
        os << mismatched.size() << " entities with mismatched links:\n";
        appendLimited(os, mismatched);
    }
    result.details = os.str();
    return result;
}

ValidationReport validateWorld(const WorldGraph& graph, const StructureValidator& validator) {
    ValidationReport report;
    report.results.push_back(validateConnectedEntities(graph));
    report.results.push_back(validateEntityStructure(graph, validator));
    report.results.push_back(validateRelationshipIntegrity(graph));
    report.results.push_back(validateLinkSync(graph));

    report.totalChecks = report.results.size();
    for (const auto& result : report.results) {
        if (result.passed) {
            ++report.passed;
        } else {
            ++report.failed;
        }
    }
    return report;
}

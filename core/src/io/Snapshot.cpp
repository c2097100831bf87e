#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace {
std::string escapeJson(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                    out += hex.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}
}

std::string worldToJson(const WorldEngine& engine, std::size_t recentEvents) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4);

    const auto m = engine.computeMetrics();

    os << "{";
    os << "\"tick\":" << m.tick << ",";
    os << "\"epoch\":" << m.epoch << ",";
    os << "\"era\":\"" << escapeJson(m.era) << "\",";
    os << "\"entities\":" << m.entities << ",";
    os << "\"relationships\":" << m.relationships << ",";
    os << "\"historicalRelationships\":" << m.historicalRelationships << ",";
    os << "\"averageGrowth\":" << m.averageGrowth << ",";

    os << "\"byKind\":{";
    bool first = true;
    for (const auto& [kind, count] : m.entitiesByKind) {
        if (!first) os << ",";
        os << "\"" << escapeJson(kind) << "\":" << count;
        first = false;
    }
    os << "},";

    os << "\"pressures\":{";
    first = true;
    for (const auto& [id, value] : m.pressures) {
        if (!first) os << ",";
        os << "\"" << escapeJson(id) << "\":" << value;
        first = false;
    }
    os << "},";

    os << "\"history\":[";
    const auto events = engine.eventLog().recent(recentEvents);
    for (std::size_t i = 0; i < events.size(); ++i) {
        const auto& e = *events[i];
        os << "{";
        os << "\"tick\":" << e.tick << ",";
        os << "\"era\":\"" << escapeJson(e.era) << "\",";
        os << "\"type\":\"" << historyEventTypeName(e.type) << "\",";
        os << "\"description\":\"" << escapeJson(e.description) << "\",";
        os << "\"entitiesCreated\":" << e.entitiesCreated.size() << ",";
        os << "\"relationshipsCreated\":" << e.relationshipsCreated.size() << ",";
        os << "\"entitiesModified\":" << e.entitiesModified.size();
        os << "}";
        if (i + 1 < events.size()) os << ",";
    }
    os << "]";
    os << "}";

    return os.str();
}

void logMetricsHeader(const WorldEngine& engine, std::ostream& out) {
    out << "tick,entities,relationships,avg_growth";
    for (const auto& [id, value] : engine.graph().pressures().values()) {
        out << "," << id;
    }
    out << "\n";
}

void logMetrics(const WorldEngine& engine, std::ostream& out) {
    const auto m = engine.computeMetrics();
    out << m.tick << ","
        << m.entities << ","
        << m.relationships << ","
        << m.averageGrowth;
    for (const auto& [id, value] : m.pressures) {
        out << "," << value;
    }
    out << "\n";
}

std::string formatReport(const ValidationReport& report) {
    std::ostringstream os;
    os << "Validation: " << report.passed << "/" << report.totalChecks << " checks passed\n";
    for (const auto& r : report.results) {
        os << "  [" << (r.skipped ? "SKIP" : (r.passed ? "PASS" : "FAIL")) << "] " << r.name;
        if (!r.passed) {
            os << " (" << r.failureCount << " failures)";
        }
        if (!r.details.empty()) {
            os << ": " << r.details;
        }
        os << "\n";
        const std::size_t shown = std::min<std::size_t>(r.failedEntities.size(), 5);
        for (std::size_t i = 0; i < shown; ++i) {
            os << "      - " << r.failedEntities[i] << "\n";
        }
        if (r.failedEntities.size() > shown) {
            os << "      ... and " << (r.failedEntities.size() - shown) << " more\n";
        }
    }
    return os.str();
}

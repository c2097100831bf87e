#ifndef WORLD_SNAPSHOT_H
#define WORLD_SNAPSHOT_H

#include "kernel/Engine.h"
#include "utils/Validation.h"
#include <cstddef>
#include <string>
#include <iosfwd>

// JSON summary of a run: clock, era, counts by kind, pressures and the most
// recent history events
std::string worldToJson(const WorldEngine& engine, std::size_t recentEvents = 10);

// CSV metrics logging
void logMetricsHeader(const WorldEngine& engine, std::ostream& out);
void logMetrics(const WorldEngine& engine, std::ostream& out);

// Human-readable validation report
std::string formatReport(const ValidationReport& report);

#endif

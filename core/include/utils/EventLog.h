#ifndef EVENT_LOG_H
#define EVENT_LOG_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include "kernel/Relationship.h"

enum class HistoryEventType : std::uint8_t {
    Growth = 0,       // a template fired
    Simulation = 1,   // systems changed the world during a tick
    Special = 2       // initialisation, era transitions
};

struct HistoryEvent {
    std::uint64_t tick = 0;
    std::string era;
    HistoryEventType type = HistoryEventType::Special;
    std::string description;
    std::vector<std::string> entitiesCreated;
    std::vector<Relationship> relationshipsCreated;
    std::vector<std::string> entitiesModified;
};

const char* historyEventTypeName(HistoryEventType type);

// Chronological run history. With a non-zero capacity the oldest events are
// dropped first.
class EventLog {
public:
    explicit EventLog(std::size_t capacity = 0) : capacity_(capacity) {}

    void setCapacity(std::size_t capacity);
    void record(HistoryEvent event);
    void logSpecial(std::uint64_t tick, const std::string& era, const std::string& description);

    const std::deque<HistoryEvent>& events() const { return events_; }
    std::vector<const HistoryEvent*> eventsOfType(HistoryEventType type) const;
    std::vector<const HistoryEvent*> eventsBetween(std::uint64_t fromTick, std::uint64_t toTick) const;
    std::vector<const HistoryEvent*> recent(std::size_t count) const;

    std::size_t size() const { return events_.size(); }
    std::size_t dropped() const { return dropped_; }
    void clear();

private:
    void enforceCapacity();

    std::deque<HistoryEvent> events_;
    std::size_t capacity_ = 0;
    std::size_t dropped_ = 0;
};

#endif

#include "utils/EventLog.h"

const char* historyEventTypeName(HistoryEventType type) {
    switch (type) {
        case HistoryEventType::Growth: return "growth";
        case HistoryEventType::Simulation: return "simulation";
        case HistoryEventType::Special: return "special";
    }
    return "special";
}

void EventLog::setCapacity(std::size_t capacity) {
    capacity_ = capacity;
    enforceCapacity();
}

void EventLog::record(HistoryEvent event) {
    events_.push_back(std::move(event));
    enforceCapacity();
}

void EventLog::logSpecial(std::uint64_t tick, const std::string& era, const std::string& description) {
    HistoryEvent event;
    event.tick = tick;
    event.era = era;
    event.type = HistoryEventType::Special;
    event.description = description;
    record(std::move(event));
}

std::vector<const HistoryEvent*> EventLog::eventsOfType(HistoryEventType type) const {
    std::vector<const HistoryEvent*> out;
    for (const auto& event : events_) {
        if (event.type == type) out.push_back(&event);
    }
    return out;
}

std::vector<const HistoryEvent*> EventLog::eventsBetween(std::uint64_t fromTick, std::uint64_t toTick) const {
    std::vector<const HistoryEvent*> out;
    for (const auto& event : events_) {
        if (event.tick >= fromTick && event.tick <= toTick) out.push_back(&event);
    }
    return out;
}

std::vector<const HistoryEvent*> EventLog::recent(std::size_t count) const {
    std::vector<const HistoryEvent*> out;
    const std::size_t start = events_.size() > count ? events_.size() - count : 0;
    for (std::size_t i = start; i < events_.size(); ++i) {
        out.push_back(&events_[i]);
    }
    return out;
}

void EventLog::clear() {
    events_.clear();
    dropped_ = 0;
}

void EventLog::enforceCapacity() {
    if (capacity_ == 0) {
        return;
    }
    while (events_.size() > capacity_) {
        events_.pop_front();
        ++dropped_;
    }
}

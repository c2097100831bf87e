#include "kernel/TagMap.h"

#include <algorithm>
#include <cstdlib>

void TagMap::set(const std::string& key, bool value) {
    set(key, TagValue{value});
}

void TagMap::set(const std::string& key, const std::string& value) {
    set(key, TagValue{value});
}

void TagMap::set(const std::string& key, const TagValue& value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const auto& entry) { return entry.first == key; });
    if (it != entries_.end()) {
        it->second = value;
        return;
    }
    if (entries_.size() >= kMaxTags) {
        entries_.erase(entries_.begin());
    }
    entries_.emplace_back(key, value);
}

bool TagMap::remove(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const auto& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool TagMap::has(const std::string& key) const {
    return get(key) != nullptr;
}

const TagValue* TagMap::get(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string TagMap::getString(const std::string& key, const std::string& fallback) const {
    const TagValue* value = get(key);
    if (!value) {
        return fallback;
    }
    if (const auto* text = std::get_if<std::string>(value)) {
        return *text;
    }
    return fallback;
}

double TagMap::getNumber(const std::string& key, double fallback) const {
    const std::string text = getString(key);
    if (text.empty()) {
        return fallback;
    }
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return fallback;
    }
    return parsed;
}

std::string formatTagValue(const TagValue& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? "true" : "false";
    }
    return std::get<std::string>(value);
}

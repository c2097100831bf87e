#ifndef ENTITY_H
#define ENTITY_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "kernel/Relationship.h"
#include "kernel/TagMap.h"

enum class Prominence : std::uint8_t {
    Forgotten = 0,
    Marginal = 1,
    Recognized = 2,
    Renowned = 3,
    Mythic = 4
};

int prominenceValue(Prominence p);
Prominence prominenceFromValue(int value);            // clamps to [Forgotten, Mythic]
Prominence adjustProminence(Prominence p, int delta);
const char* prominenceName(Prominence p);
std::optional<Prominence> parseProminence(const std::string& name);

struct Point3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

// World node ("hard state"). kind/subtype/status are open vocabularies
// supplied by the domain schema.
struct Entity {
    std::string id;
    std::string kind;
    std::string subtype;
    std::string name;
    std::string description;
    std::string status;
    Prominence prominence = Prominence::Marginal;
    std::string culture;
    TagMap tags;
    std::vector<Relationship> links;   // cached outgoing relationships (src == id)
    std::uint64_t createdAt = 0;
    std::uint64_t updatedAt = 0;
    std::optional<Point3> coordinates;
};

// Proposed entity. An empty id lets the store assign one.
struct EntitySpec {
    std::string id;
    std::string kind;
    std::string subtype;
    std::string name;
    std::string description;
    std::string status;
    Prominence prominence = Prominence::Marginal;
    std::string culture;
    TagMap tags;
    std::optional<Point3> coordinates;
};

// Shallow partial update; unset fields are left alone.
struct EntityChanges {
    std::optional<std::string> subtype;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> status;
    std::optional<std::string> culture;
    std::optional<Prominence> prominence;
    std::optional<Point3> coordinates;
    std::vector<std::pair<std::string, TagValue>> setTags;
    std::vector<std::string> removeTags;

    EntityChanges& withStatus(const std::string& value) { status = value; return *this; }
    EntityChanges& withProminence(Prominence value) { prominence = value; return *this; }
    EntityChanges& withTag(const std::string& key, const std::string& value) {
        setTags.emplace_back(key, TagValue{value});
        return *this;
    }
    EntityChanges& withFlag(const std::string& key) {
        setTags.emplace_back(key, TagValue{true});
        return *this;
    }
    EntityChanges& withoutTag(const std::string& key) {
        removeTags.push_back(key);
        return *this;
    }

    bool empty() const {
        return !subtype && !name && !description && !status && !culture && !prominence &&
               !coordinates && setTags.empty() && removeTags.empty();
    }
};

#endif

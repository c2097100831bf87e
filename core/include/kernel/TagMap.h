#ifndef TAG_MAP_H
#define TAG_MAP_H

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using TagValue = std::variant<bool, std::string>;

// Bounded tag mapping (at most kMaxTags entries, insertion ordered).
// Writing a new key into a full map evicts the oldest entry.
class TagMap {
public:
    static constexpr std::size_t kMaxTags = 10;

    void set(const std::string& key, bool value);
    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value) { set(key, std::string(value)); }
    void set(const std::string& key, const TagValue& value);
    void setFlag(const std::string& key) { set(key, true); }

    bool remove(const std::string& key);
    bool has(const std::string& key) const;
    const TagValue* get(const std::string& key) const;

    // String value of a tag, or fallback when absent or boolean.
    std::string getString(const std::string& key, const std::string& fallback = "") const;
    // Numeric value encoded in a string tag, or fallback.
    double getNumber(const std::string& key, double fallback) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<std::pair<std::string, TagValue>>& entries() const { return entries_; }

    bool operator==(const TagMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const TagMap& other) const { return !(*this == other); }

private:
    std::vector<std::pair<std::string, TagValue>> entries_;
};

std::string formatTagValue(const TagValue& value);

#endif

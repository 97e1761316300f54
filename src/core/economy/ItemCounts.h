#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace GardenSim {

/**
 * Name -> quantity counts that remember insertion order.
 *
 * Entries are removed when their quantity reaches zero; re-adding a removed
 * name appends it at the end. Planting draws from the first entry, so the
 * order is observable.
 */
class ItemCounts {
public:
    using Entry = std::pair<std::string, int>;

    // False (and unchanged) for a non-positive quantity or when the count would overflow.
    bool add(const std::string& name, int quantity);

    bool canAdd(const std::string& name, int quantity) const;

    // False (and unchanged) when fewer than quantity are held.
    bool remove(const std::string& name, int quantity);

    void erase(const std::string& name);
    void clear() { entries_.clear(); }

    int count(const std::string& name) const;
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    int64_t total() const;

    // First name in insertion order, if any.
    std::optional<std::string> first() const;

    // Copy of the current entries, safe to iterate while mutating this object.
    std::vector<Entry> snapshot() const { return entries_; }

    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry>::iterator find(const std::string& name);
    std::vector<Entry>::const_iterator find(const std::string& name) const;

    std::vector<Entry> entries_;
};

// Serialized as an array of [name, quantity] pairs to keep order.
void to_json(nlohmann::json& j, const ItemCounts& counts);

} // namespace GardenSim

#include "ItemCounts.h"
#include <algorithm>
#include <limits>

namespace GardenSim {

std::vector<ItemCounts::Entry>::iterator ItemCounts::find(const std::string& name)
{
    return std::find_if(
        entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == name; });
}

std::vector<ItemCounts::Entry>::const_iterator ItemCounts::find(const std::string& name) const
{
    return std::find_if(
        entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == name; });
}

bool ItemCounts::canAdd(const std::string& name, int quantity) const
{
    if (quantity <= 0) return false;

    return count(name) <= std::numeric_limits<int>::max() - quantity;
}

bool ItemCounts::add(const std::string& name, int quantity)
{
    if (!canAdd(name, quantity)) return false;

    auto it = find(name);
    if (it != entries_.end()) {
        it->second += quantity;
    }
    else {
        entries_.emplace_back(name, quantity);
    }
    return true;
}

bool ItemCounts::remove(const std::string& name, int quantity)
{
    auto it = find(name);
    if (it == entries_.end() || it->second < quantity || quantity <= 0) {
        return false;
    }

    it->second -= quantity;
    if (it->second == 0) {
        entries_.erase(it);
    }
    return true;
}

void ItemCounts::erase(const std::string& name)
{
    auto it = find(name);
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

int ItemCounts::count(const std::string& name) const
{
    auto it = find(name);
    return it != entries_.end() ? it->second : 0;
}

int64_t ItemCounts::total() const
{
    int64_t sum = 0;
    for (const auto& [name, quantity] : entries_) {
        sum += quantity;
    }
    return sum;
}

std::optional<std::string> ItemCounts::first() const
{
    if (entries_.empty()) return std::nullopt;
    return entries_.front().first;
}

void to_json(nlohmann::json& j, const ItemCounts& counts)
{
    j = nlohmann::json::array();
    for (const auto& [name, quantity] : counts.entries()) {
        j.push_back(nlohmann::json::array({ name, quantity }));
    }
}

} // namespace GardenSim

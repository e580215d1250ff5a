//
// mapping.hpp
// Insertion-ordered record of original path -> materialized copy
//

#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace simgroup {

struct MappingEntry {
    std::string original;
    std::string destination;

    bool operator==(const MappingEntry&) const = default;
};

/**
 * Both originals and destinations are unique; insert() refuses an entry that would
 * repeat either. Iteration follows insertion order.
 */
class Mapping {
public:
    /**
     * @return false if the original or the destination is already recorded
     */
    bool insert(std::string original, std::string destination);

    std::optional<std::string> destinationOf(const std::string& original) const;
    bool containsDestination(const std::string& destination) const;

    const std::vector<MappingEntry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    auto begin() const { return m_entries.begin(); }
    auto end() const { return m_entries.end(); }

    bool operator==(const Mapping& other) const { return m_entries == other.m_entries; }

private:
    std::vector<MappingEntry> m_entries;
    std::unordered_map<std::string, size_t> m_byOriginal;
    std::unordered_set<std::string> m_destinations;
};

} // namespace simgroup

#include "mapping.hpp"

namespace simgroup {

bool Mapping::insert(std::string original, std::string destination)
{
    if (m_byOriginal.contains(original) || m_destinations.contains(destination)) return false;

    m_byOriginal.emplace(original, m_entries.size());
    m_destinations.insert(destination);
    m_entries.push_back(MappingEntry{ std::move(original), std::move(destination) });
    return true;
}

std::optional<std::string> Mapping::destinationOf(const std::string& original) const
{
    const auto it = m_byOriginal.find(original);
    if (it == m_byOriginal.end()) return std::nullopt;
    return m_entries[it->second].destination;
}

bool Mapping::containsDestination(const std::string& destination) const
{
    return m_destinations.contains(destination);
}

} // namespace simgroup

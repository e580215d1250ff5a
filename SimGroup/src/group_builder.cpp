#include "group_builder.hpp"
#include "logger.hpp"

namespace simgroup {

size_t GroupBuilder::intern(const std::string& identifier)
{
    auto [it, inserted] = m_index.try_emplace(identifier, m_identifiers.size());
    if (inserted) {
        m_identifiers.push_back(identifier);
        m_sets.add();
    }
    return it->second;
}

void GroupBuilder::addPair(const SimilarPair& pair)
{
    const size_t a = intern(pair.first);
    const size_t b = intern(pair.second);
    if (a == b) return;

    if (m_sets.unite(a, b)) ++m_merges;
}

void GroupBuilder::addPairs(const std::vector<SimilarPair>& pairs)
{
    for (const auto& pair : pairs) addPair(pair);
}

std::vector<Group> GroupBuilder::build()
{
    std::vector<Group> groups;
    std::unordered_map<size_t, size_t> rootToGroup;

    for (size_t i = 0; i < m_identifiers.size(); ++i) {
        const size_t root = m_sets.find(i);
        auto [it, inserted] = rootToGroup.try_emplace(root, groups.size());
        if (inserted) groups.emplace_back();
        groups[it->second].push_back(m_identifiers[i]);
    }

    std::erase_if(groups, [](const Group& g) { return g.size() < 2; });

    SIMGROUP_DEBUG("GroupBuilder", m_identifiers.size(), " identifier(s), ", m_merges, " merge(s), ",
                   groups.size(), " group(s)");
    return groups;
}

std::vector<Group> buildGroups(const std::vector<SimilarPair>& pairs)
{
    if (pairs.empty()) return {};

    GroupBuilder builder;
    builder.addPairs(pairs);
    return builder.build();
}

} // namespace simgroup

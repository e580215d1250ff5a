//
// group_builder.hpp
// Connected components over the similarity graph
//

#pragma once

#include "disjoint_sets.hpp"
#include "fingerprint.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace simgroup {

/**
 * Accumulates similar pairs and resolves them into groups: two identifiers share a
 * group iff a chain of pairs connects them. The identifier table is owned by the
 * builder and lives for one run.
 *
 * Groups come out ordered by the first appearance of any member in the pair stream,
 * members by their own first appearance. Not thread-safe.
 */
class GroupBuilder {
public:
    void addPair(const SimilarPair& pair);
    void addPairs(const std::vector<SimilarPair>& pairs);

    std::vector<Group> build();

    size_t identifierCount() const { return m_identifiers.size(); }
    size_t mergeCount() const { return m_merges; }

private:
    size_t intern(const std::string& identifier);

    std::vector<std::string> m_identifiers;
    std::unordered_map<std::string, size_t> m_index;
    DisjointSets m_sets;
    size_t m_merges = 0;
};

/**
 * One-shot grouping of a pair list. An empty list yields no groups.
 */
std::vector<Group> buildGroups(const std::vector<SimilarPair>& pairs);

} // namespace simgroup

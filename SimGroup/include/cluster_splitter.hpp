//
// cluster_splitter.hpp
// Breaks oversized, loosely-connected groups into denser sub-clusters
//

#pragma once

#include "fingerprint.hpp"

#include <cstddef>
#include <vector>

namespace simgroup {

// Groups larger than this are assumed to be chained together transitively
constexpr size_t kMaxGroupSize = 20;

/**
 * Split one group by highest-degree seed growth.
 *
 * Members are visited in descending order of internal degree (pairs with both ends in
 * the group); equal degrees keep their position in the group. Each unvisited member
 * seeds a sub-cluster made of itself and its unvisited direct neighbours, and all of
 * them become visited. A seed with no unvisited neighbour is dropped from the result.
 *
 * The result is not an optimal density partition, only a cheap way to cut chains.
 *
 * @return The group unchanged when it is within `maxGroupSize` or when no sub-cluster
 *         of two or more members could be formed, otherwise the sub-clusters
 */
std::vector<Group> splitLargeGroup(const Group& group,
                                   const std::vector<SimilarPair>& pairs,
                                   size_t maxGroupSize = kMaxGroupSize);

/**
 * Apply splitLargeGroup to every group; sub-clusters replace their parent in place.
 */
std::vector<Group> splitGroups(const std::vector<Group>& groups,
                               const std::vector<SimilarPair>& pairs,
                               size_t maxGroupSize = kMaxGroupSize);

} // namespace simgroup

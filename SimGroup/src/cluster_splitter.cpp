#include "cluster_splitter.hpp"
#include "logger.hpp"

#include <algorithm>
#include <numeric>
#include <string_view>
#include <unordered_map>

namespace simgroup {

std::vector<Group> splitLargeGroup(const Group& group,
                                   const std::vector<SimilarPair>& pairs,
                                   size_t maxGroupSize)
{
    if (group.size() <= maxGroupSize) return { group };

    const size_t m = group.size();
    std::unordered_map<std::string_view, size_t> position;
    position.reserve(m);
    for (size_t i = 0; i < m; ++i) position.try_emplace(group[i], i);

    std::vector<std::vector<size_t>> neighbours(m);
    std::vector<size_t> degree(m, 0);
    size_t internalPairs = 0;

    for (const auto& pair : pairs) {
        const auto a = position.find(pair.first);
        const auto b = position.find(pair.second);
        if (a == position.end() || b == position.end() || a->second == b->second) continue;

        ++internalPairs;
        ++degree[a->second];
        ++degree[b->second];
        neighbours[a->second].push_back(b->second);
        neighbours[b->second].push_back(a->second);
    }

    for (auto& list : neighbours) {
        std::ranges::sort(list);
        const auto dup = std::ranges::unique(list);
        list.erase(dup.begin(), dup.end());
    }

    std::vector<size_t> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::ranges::stable_sort(order, [&degree](size_t lhs, size_t rhs) { return degree[lhs] > degree[rhs]; });

    std::vector<Group> clusters;
    std::vector<bool> visited(m, false);
    size_t dropped = 0;

    for (const size_t seed : order) {
        if (visited[seed]) continue;

        std::vector<size_t> star{ seed };
        for (const size_t n : neighbours[seed]) {
            if (!visited[n] && n != seed) star.push_back(n);
        }

        for (const size_t idx : star) visited[idx] = true;

        // A seed with no unvisited neighbour is dropped
        if (star.size() < 2) {
            ++dropped;
            continue;
        }

        Group cluster;
        cluster.reserve(star.size());
        for (const size_t idx : star) cluster.push_back(group[idx]);
        clusters.push_back(std::move(cluster));
    }

    if (clusters.empty()) {
        SIMGROUP_WARN("ClusterSplitter", "Group of ", m, " images has no internal pairs, keeping it unsplit");
        return { group };
    }

    SIMGROUP_INFO("ClusterSplitter", "Split group of ", m, " images (", internalPairs, " internal pairs) into ",
                  clusters.size(), " cluster(s), ", dropped, " image(s) left ungrouped");
    return clusters;
}

std::vector<Group> splitGroups(const std::vector<Group>& groups,
                               const std::vector<SimilarPair>& pairs,
                               size_t maxGroupSize)
{
    std::vector<Group> result;
    result.reserve(groups.size());

    for (const auto& group : groups) {
        if (group.size() <= maxGroupSize) {
            result.push_back(group);
            continue;
        }

        auto clusters = splitLargeGroup(group, pairs, maxGroupSize);
        result.insert(result.end(), std::make_move_iterator(clusters.begin()), std::make_move_iterator(clusters.end()));
    }

    return result;
}

} // namespace simgroup

//
// simgroup.hpp
// Entry operations of the clustering engine
//

#pragma once

#include "cleaner.hpp"
#include "cluster_splitter.hpp"
#include "deletion_reconciler.hpp"
#include "fingerprint.hpp"
#include "group_builder.hpp"
#include "mapping_store.hpp"
#include "pair_finder.hpp"
#include "progress_tracker.hpp"
#include "result_materializer.hpp"

#include <filesystem>
#include <vector>

namespace simgroup {

struct ClusterOptions {
    int threads = 1;
    size_t maxGroupSize = kMaxGroupSize;
    ProgressTracker* progress = nullptr;
};

struct ClusterResult {
    std::vector<SimilarPair> pairs;
    std::vector<Group> groups;
};

struct ReconcileAndCleanSummary {
    ReconcileReport reconcile;
    CleanupSummary cleanup;
};

/**
 * Pairs, connected groups and split groups for one set of items.
 */
template <Fingerprint F>
ClusterResult clusterWithPairs(const std::vector<Item<F>>& items, int threshold, const ClusterOptions& options = {})
{
    ClusterResult result;

    if (items.empty()) {
        SIMGROUP_WARN("Engine", "No items to compare");
        return result;
    }

    result.pairs = findSimilarPairs(items, threshold, options.threads, options.progress);
    if (result.pairs.empty()) {
        SIMGROUP_INFO("Engine", "No similar images found");
        return result;
    }
    SIMGROUP_INFO("Engine", "Similar pairs found: ", result.pairs.size());

    result.groups = splitGroups(buildGroups(result.pairs), result.pairs, options.maxGroupSize);
    SIMGROUP_INFO("Engine", "Groups created: ", result.groups.size());
    return result;
}

/**
 * cluster(items, threshold) -> groups
 */
template <Fingerprint F>
std::vector<Group> cluster(const std::vector<Item<F>>& items, int threshold, const ClusterOptions& options = {})
{
    return clusterWithPairs(items, threshold, options).groups;
}

/**
 * Copy the groups into `outputRoot` and persist the realized mapping to `store`.
 * The mapping is written only once every copy has finished; with no groups nothing
 * on disk changes.
 */
MaterializeReport materialize(const std::vector<Group>& groups,
                              const std::filesystem::path& outputRoot,
                              const MappingStore& store,
                              int threads = 1,
                              ProgressTracker* progress = nullptr);

/**
 * Infer the deletion list from the output tree, persist it, then delete the listed originals.
 */
ReconcileAndCleanSummary reconcileAndClean(const MappingStore& store,
                                           const std::filesystem::path& outputRoot,
                                           const std::filesystem::path& deletionList,
                                           bool dryRun = false);

} // namespace simgroup

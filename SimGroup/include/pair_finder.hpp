//
// pair_finder.hpp
// All-pairs fingerprint comparison under a threshold
//

#pragma once

#include "concurrency.hpp"
#include "fingerprint.hpp"
#include "logger.hpp"
#include "progress_tracker.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <vector>

namespace simgroup {

/**
 * Number of comparisons findSimilarPairs performs for `count` items.
 */
inline size_t comparisonCount(size_t count)
{
    return count < 2 ? 0 : count * (count - 1) / 2;
}

/**
 * Find every unordered pair of items whose fingerprints are within `threshold`.
 *
 * Each pair is reported once, as (items[i], items[j]) with i < j, ordered by i then j.
 * Rows are spread across `threads` workers (-1 = auto); the result does not depend
 * on the worker count.
 *
 * @param items     Items to compare; identifiers are expected to be unique
 * @param threshold Maximum distance for two fingerprints to count as similar
 * @param threads   Worker threads for the comparison loop
 * @param progress  Optional tracker, advanced on PipelineStage::Compare
 * @return Similar pairs, empty when fewer than two items or nothing matches
 */
template <Fingerprint F>
std::vector<SimilarPair> findSimilarPairs(const std::vector<Item<F>>& items,
                                          int threshold,
                                          int threads = 1,
                                          ProgressTracker* progress = nullptr)
{
    const size_t n = items.size();
    if (n < 2 || threshold < 0) {
        if (progress) progress->update(PipelineStage::Compare, comparisonCount(n));
        return {};
    }

    const size_t workers = std::min<size_t>(static_cast<size_t>(resolveThreadCount(threads)), n - 1);
    std::vector<std::vector<SimilarPair>> rows(n);

    auto compareRow = [&](size_t i) {
        auto& row = rows[i];
        for (size_t j = i + 1; j < n; ++j) {
            const int d = static_cast<int>(items[i].fingerprint.distance(items[j].fingerprint));
            if (d <= threshold) {
                row.push_back(SimilarPair{ items[i].path, items[j].path, d });
            }
        }
        if (progress) progress->update(PipelineStage::Compare, n - 1 - i);
    };

    if (workers <= 1) {
        for (size_t i = 0; i + 1 < n; ++i) compareRow(i);
    }
    else {
        // Interleaved rows keep the triangular workload balanced
        std::vector<std::future<void>> tasks;
        tasks.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            tasks.push_back(std::async(std::launch::async, [&, w] {
                for (size_t i = w; i + 1 < n; i += workers) compareRow(i);
            }));
        }
        for (auto& task : tasks) task.get();
    }

    std::vector<SimilarPair> pairs;
    for (auto& row : rows) {
        pairs.insert(pairs.end(), std::make_move_iterator(row.begin()), std::make_move_iterator(row.end()));
    }

    SIMGROUP_DEBUG("PairFinder", "Compared ", n, " items on ", workers, " worker(s): ", pairs.size(), " similar pair(s)");
    return pairs;
}

} // namespace simgroup

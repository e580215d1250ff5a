//
// result_materializer.hpp
// Writes groups to a numbered output tree and records where every file went
//

#pragma once

#include "fingerprint.hpp"
#include "mapping.hpp"
#include "progress_tracker.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace simgroup {

// Longest safe name derived from a full path before falling back to the base name
constexpr size_t kMaxSafeNameLength = 200;
constexpr const char* kUnknownFileName = "unknown_file";

struct MaterializeReport {
    Mapping mapping;
    size_t groupDirectories = 0;
    size_t copied = 0;
    std::vector<ItemFailure> failures;
    bool mappingSaved = false;
};

/**
 * Derive a filesystem-safe file name from a full path.
 *
 * Every byte outside [A-Za-z0-9_.-] (multi-byte UTF-8 sequences are kept) becomes '_',
 * runs of '_' collapse to one and leading/trailing '_' are trimmed. An empty result or
 * one longer than kMaxSafeNameLength falls back to the base name, then to kUnknownFileName.
 */
std::string pathToSafeFilename(const std::filesystem::path& path);

/**
 * First of `desired`, `stem_1.ext`, `stem_2.ext`, ... that is neither in `taken`
 * nor present on disk.
 */
std::filesystem::path resolveCollision(const std::filesystem::path& desired,
                                       const std::unordered_set<std::string>& taken);

class ResultMaterializer {
public:
    /**
     * @param outputRoot Directory that receives one numbered sub-directory per group
     * @param threads    Copy workers (-1 = auto)
     * @param progress   Optional tracker, advanced on PipelineStage::Copy
     */
    explicit ResultMaterializer(std::filesystem::path outputRoot,
                                int threads = 1,
                                ProgressTracker* progress = nullptr);

    /**
     * Recreate the output root, create directories 1..N in list order and copy every
     * group member into its directory under a collision-free safe name.
     *
     * Missing sources and failed copies are reported in the result and skipped.
     * The returned mapping holds exactly the copies that succeeded.
     */
    MaterializeReport materialize(const std::vector<Group>& groups) const;

    const std::filesystem::path& outputRoot() const { return m_outputRoot; }

private:
    std::filesystem::path m_outputRoot;
    int m_threads;
    ProgressTracker* m_progress;
};

} // namespace simgroup

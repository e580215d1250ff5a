//
// cleaner.hpp
// Deletes the originals listed in a deletion list
//

#pragma once

#include "fingerprint.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace simgroup {

struct CleanupSummary {
    bool listFound = false;
    size_t deleted = 0;
    size_t skipped = 0;
    size_t failed = 0;
    std::uintmax_t freedBytes = 0;
    std::vector<std::string> deletedPaths;
    std::vector<std::string> skippedPaths;
    std::vector<ItemFailure> failures;
};

/**
 * Read a newline-delimited deletion list; blank lines and trailing '\r' are ignored.
 * @return std::nullopt (with a warning) if the file is missing or unreadable
 */
std::optional<std::vector<std::string>> readDeletionList(const std::filesystem::path& file);

class Cleaner {
public:
    /**
     * @param dryRun Report what would be deleted without removing anything
     */
    explicit Cleaner(bool dryRun = false) : m_dryRun(dryRun) {}

    /**
     * Delete every listed path that still exists. Paths already gone are skipped,
     * failures are recorded and the batch continues.
     */
    CleanupSummary clean(const std::vector<std::string>& paths) const;

    /**
     * Same as clean() for the paths stored in `deletionList`.
     */
    CleanupSummary cleanFromFile(const std::filesystem::path& deletionList) const;

private:
    bool m_dryRun;
};

} // namespace simgroup

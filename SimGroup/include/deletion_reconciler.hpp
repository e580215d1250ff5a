//
// deletion_reconciler.hpp
// Infers which originals to delete from copies the user removed
//

#pragma once

#include "mapping.hpp"
#include "mapping_store.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace simgroup {

struct ReconcileReport {
    bool mappingLoaded = false;
    bool outputListed = false;
    size_t mappingRecords = 0;
    size_t remainingFiles = 0;
    std::vector<std::string> toDelete;
    bool listWritten = false;
};

/**
 * Normalized absolute form used when comparing recorded and listed paths.
 */
std::filesystem::path normalizePath(const std::filesystem::path& path);

/**
 * Regular files currently under `root` (recursive), as normalized path strings.
 * Enumerated fresh on every call. Any folder that cannot be read makes the whole
 * listing fail with std::nullopt.
 */
std::optional<std::vector<std::string>> listOutputFiles(const std::filesystem::path& root);

/**
 * Every original whose recorded copy no longer exists under `outputRoot`, in mapping order.
 * A copy whose status cannot be determined is treated as present.
 */
std::vector<std::string> findDeletedOriginals(const Mapping& mapping, const std::filesystem::path& outputRoot);

/**
 * Write a deletion list as newline-delimited paths.
 * @return false if the file could not be written
 */
bool writeDeletionList(const std::filesystem::path& file, const std::vector<std::string>& paths);

class DeletionReconciler {
public:
    DeletionReconciler(const MappingStore& store, std::filesystem::path outputRoot, std::filesystem::path deletionList);

    /**
     * Load the mapping, diff it against the output tree and write the deletion list.
     *
     * Nothing to delete is a normal outcome: no list is written and a stale list from
     * an earlier run is removed. A missing mapping or output tree is a warning. An
     * output tree that cannot be fully listed leaves `outputListed` false and writes
     * no list.
     */
    ReconcileReport reconcile() const;

private:
    const MappingStore& m_store;
    std::filesystem::path m_outputRoot;
    std::filesystem::path m_deletionList;
};

} // namespace simgroup

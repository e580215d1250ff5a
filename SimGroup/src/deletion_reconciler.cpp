#include "deletion_reconciler.hpp"
#include "logger.hpp"

#include <fstream>
#include <optional>
#include <unordered_set>

namespace simgroup {

namespace fs = std::filesystem;

fs::path normalizePath(const fs::path& path)
{
    std::error_code ec;
    auto normalized = fs::weakly_canonical(path, ec);
    if (ec) {
        normalized = fs::absolute(path, ec);
        if (ec) normalized = path;
    }
    return normalized.lexically_normal();
}

std::optional<std::vector<std::string>> listOutputFiles(const fs::path& root)
{
    std::vector<std::string> files;
    std::error_code ec;

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        SIMGROUP_WARN("Reconciler", "Cannot list ", root, ": ", ec.message());
        return std::nullopt;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            SIMGROUP_WARN("Reconciler", "Error while listing ", root, ": ", ec.message());
            return std::nullopt;
        }

        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            files.push_back(normalizePath(it->path()).string());
        }
    }
    if (ec) {
        SIMGROUP_WARN("Reconciler", "Error while listing ", root, ": ", ec.message());
        return std::nullopt;
    }

    return files;
}

namespace {

// Only a destination the filesystem reports as absent counts as deleted
bool copyIsGone(const std::string& destination)
{
    std::error_code ec;
    const auto status = fs::symlink_status(destination, ec);
    if (status.type() == fs::file_type::not_found) return true;

    if (ec) {
        SIMGROUP_WARN("Reconciler", "Cannot check ", destination, ": ", ec.message(), ", keeping its original");
    }
    return false;
}

std::vector<std::string> deletedOriginals(const Mapping& mapping, const std::vector<std::string>& listed)
{
    const std::unordered_set<std::string> existing(listed.begin(), listed.end());

    std::vector<std::string> deleted;
    for (const auto& entry : mapping) {
        const auto destination = normalizePath(entry.destination).string();
        if (existing.contains(destination) || !copyIsGone(destination)) continue;

        SIMGROUP_INFO("Reconciler", "File deleted from output: ", entry.destination, " -> adding to delete: ",
                      entry.original);
        deleted.push_back(entry.original);
    }
    return deleted;
}

} // namespace

std::vector<std::string> findDeletedOriginals(const Mapping& mapping, const fs::path& outputRoot)
{
    const auto listed = listOutputFiles(outputRoot);
    return deletedOriginals(mapping, listed ? *listed : std::vector<std::string>{});
}

bool writeDeletionList(const fs::path& file, const std::vector<std::string>& paths)
{
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            SIMGROUP_ERROR("Reconciler", "Cannot create ", file.parent_path(), ": ", ec.message());
            return false;
        }
    }

    std::ofstream out(file, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        SIMGROUP_ERROR("Reconciler", "Cannot write ", file);
        return false;
    }

    for (const auto& path : paths) out << path << '\n';

    if (!out.flush()) {
        SIMGROUP_ERROR("Reconciler", "Failed while writing ", file);
        return false;
    }
    return true;
}

DeletionReconciler::DeletionReconciler(const MappingStore& store, fs::path outputRoot, fs::path deletionList)
    : m_store(store), m_outputRoot(std::move(outputRoot)), m_deletionList(std::move(deletionList))
{
}

ReconcileReport DeletionReconciler::reconcile() const
{
    ReconcileReport report;

    std::error_code ec;
    if (!fs::is_directory(m_outputRoot, ec)) {
        SIMGROUP_WARN("Reconciler", "Results folder ", m_outputRoot, " not found");
        return report;
    }

    const auto mapping = m_store.load();
    if (!mapping) return report;

    report.mappingLoaded = true;
    report.mappingRecords = mapping->size();

    const auto listed = listOutputFiles(m_outputRoot);
    if (!listed) {
        SIMGROUP_WARN("Reconciler", "Output folder ", m_outputRoot, " could not be fully listed, no deletion list written");
        return report;
    }

    report.outputListed = true;
    report.remainingFiles = listed->size();
    report.toDelete = deletedOriginals(*mapping, *listed);

    SIMGROUP_INFO("Reconciler", "Found files in ", m_outputRoot, ": ", report.remainingFiles);

    if (report.toDelete.empty()) {
        SIMGROUP_INFO("Reconciler", "No files to delete");
        if (fs::remove(m_deletionList, ec)) {
            SIMGROUP_INFO("Reconciler", "Removed stale deletion list ", m_deletionList);
        }
        else if (ec) {
            SIMGROUP_WARN("Reconciler", "Cannot remove stale deletion list ", m_deletionList, ": ", ec.message());
        }
        return report;
    }

    report.listWritten = writeDeletionList(m_deletionList, report.toDelete);
    if (report.listWritten) {
        SIMGROUP_INFO("Reconciler", "Wrote ", report.toDelete.size(), " paths for deletion to ", m_deletionList);
    }

    SIMGROUP_INFO("Reconciler", "Total files saved: ", report.mappingRecords);
    SIMGROUP_INFO("Reconciler", "Remaining in output: ", report.remainingFiles);
    SIMGROUP_INFO("Reconciler", "Marked for deletion: ", report.toDelete.size());
    return report;
}

} // namespace simgroup

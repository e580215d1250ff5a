#include "cleaner.hpp"
#include "logger.hpp"

#include <fstream>

namespace simgroup {

namespace fs = std::filesystem;

std::optional<std::vector<std::string>> readDeletionList(const fs::path& file)
{
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        SIMGROUP_WARN("Cleaner", "File ", file, " not found");
        return std::nullopt;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        SIMGROUP_WARN("Cleaner", "Cannot open ", file);
        return std::nullopt;
    }

    std::vector<std::string> paths;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        paths.push_back(line);
    }

    if (in.bad()) {
        SIMGROUP_WARN("Cleaner", "Error reading ", file);
        return std::nullopt;
    }

    return paths;
}

CleanupSummary Cleaner::clean(const std::vector<std::string>& paths) const
{
    CleanupSummary summary;
    summary.listFound = true;

    for (const auto& path : paths) {
        std::error_code ec;
        const auto status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            SIMGROUP_WARN("Cleaner", "File does not exist anymore: ", path);
            ++summary.skipped;
            summary.skippedPaths.push_back(path);
            continue;
        }

        const auto size = fs::is_regular_file(status) ? fs::file_size(path, ec) : 0;
        const std::uintmax_t bytes = ec ? 0 : size;

        if (m_dryRun) {
            SIMGROUP_INFO("Cleaner", "Would delete: ", path);
            ++summary.deleted;
            summary.freedBytes += bytes;
            summary.deletedPaths.push_back(path);
            continue;
        }

        if (fs::remove(path, ec)) {
            SIMGROUP_INFO("Cleaner", "Deleted file: ", path);
            ++summary.deleted;
            summary.freedBytes += bytes;
            summary.deletedPaths.push_back(path);
        }
        else {
            const std::string reason = ec ? ec.message() : "file disappeared before removal";
            SIMGROUP_ERROR("Cleaner", "Error deleting ", path, ": ", reason);
            ++summary.failed;
            summary.failures.push_back({ path, reason });
        }
    }

    SIMGROUP_INFO("Cleaner", "=== DELETION RESULT ===");
    SIMGROUP_INFO("Cleaner", m_dryRun ? "Would delete: " : "Successfully deleted: ", summary.deleted);
    SIMGROUP_INFO("Cleaner", "Already gone: ", summary.skipped);
    SIMGROUP_INFO("Cleaner", "Errors during deletion: ", summary.failed);
    return summary;
}

CleanupSummary Cleaner::cleanFromFile(const fs::path& deletionList) const
{
    const auto paths = readDeletionList(deletionList);
    if (!paths) return CleanupSummary{};

    return clean(*paths);
}

} // namespace simgroup

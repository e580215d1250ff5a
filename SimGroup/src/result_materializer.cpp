#include "result_materializer.hpp"
#include "concurrency.hpp"
#include "logger.hpp"
#include "work_queue.hpp"

#include <algorithm>
#include <thread>

namespace simgroup {

namespace fs = std::filesystem;

namespace {

constexpr size_t QUEUE_FACTOR = 8;

struct CopyTask {
    std::string source;
    fs::path destination;
    size_t group = 0;
    bool copied = false;
    std::string error;
};

bool isSafeByte(unsigned char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '_' || c == '.' || c == '-' || c >= 0x80;
}

void runCopy(CopyTask& task)
{
    std::error_code ec;
    if (!fs::copy_file(task.source, task.destination, fs::copy_options::none, ec)) {
        task.error = ec ? ec.message() : "destination already exists";
        return;
    }

    task.copied = true;

    // Keep the original modification time on the copy
    const auto stamp = fs::last_write_time(task.source, ec);
    if (!ec) fs::last_write_time(task.destination, stamp, ec);
    if (ec) {
        SIMGROUP_DEBUG("Materializer", "Could not preserve timestamp of ", task.destination, ": ", ec.message());
    }
}

} // namespace

std::string pathToSafeFilename(const fs::path& path)
{
    const std::string raw = path.string();

    std::string safe;
    safe.reserve(raw.size());
    for (const char ch : raw) {
        const char mapped = isSafeByte(static_cast<unsigned char>(ch)) ? ch : '_';
        if (mapped == '_' && !safe.empty() && safe.back() == '_') continue;
        safe.push_back(mapped);
    }

    const auto first = safe.find_first_not_of('_');
    if (first == std::string::npos) {
        safe.clear();
    }
    else {
        const auto last = safe.find_last_not_of('_');
        safe = safe.substr(first, last - first + 1);
    }

    if (safe.empty() || safe.size() > kMaxSafeNameLength) {
        safe = path.filename().string();
        if (safe.empty()) safe = kUnknownFileName;
    }

    return safe;
}

fs::path resolveCollision(const fs::path& desired, const std::unordered_set<std::string>& taken)
{
    auto isFree = [&taken](const fs::path& candidate) {
        std::error_code ec;
        return !taken.contains(candidate.string()) && !fs::exists(candidate, ec);
    };

    if (isFree(desired)) return desired;

    const auto parent = desired.parent_path();
    const auto stem = desired.stem().string();
    const auto extension = desired.extension().string();

    for (size_t counter = 1;; ++counter) {
        auto candidate = parent / (stem + "_" + std::to_string(counter) + extension);
        if (isFree(candidate)) return candidate;
    }
}

ResultMaterializer::ResultMaterializer(fs::path outputRoot, int threads, ProgressTracker* progress)
    : m_outputRoot(fs::absolute(outputRoot).lexically_normal()),
      m_threads(resolveThreadCount(threads)),
      m_progress(progress)
{
}

MaterializeReport ResultMaterializer::materialize(const std::vector<Group>& groups) const
{
    MaterializeReport report;

    if (groups.empty()) {
        SIMGROUP_WARN("Materializer", "No groups to save");
        return report;
    }

    auto failAll = [&](const std::string& reason) {
        for (const auto& group : groups) {
            for (const auto& path : group) report.failures.push_back({ path, reason });
        }
        if (m_progress) m_progress->updateFailed(report.failures.size());
    };

    std::error_code ec;
    if (fs::exists(m_outputRoot, ec)) {
        SIMGROUP_INFO("Materializer", "Clearing existing results folder: ", m_outputRoot);
        fs::remove_all(m_outputRoot, ec);
        if (ec) {
            SIMGROUP_ERROR("Materializer", "Cannot clear ", m_outputRoot, ": ", ec.message());
            failAll("cannot clear output directory: " + ec.message());
            return report;
        }
    }

    fs::create_directories(m_outputRoot, ec);
    if (ec) {
        SIMGROUP_ERROR("Materializer", "Cannot create ", m_outputRoot, ": ", ec.message());
        failAll("cannot create output directory: " + ec.message());
        return report;
    }
    SIMGROUP_INFO("Materializer", "Created results folder: ", m_outputRoot);

    // Names are resolved up front, one directory at a time, so copies never race for a name
    std::vector<CopyTask> tasks;
    for (size_t g = 0; g < groups.size(); ++g) {
        const fs::path groupDir = m_outputRoot / std::to_string(g + 1);
        fs::create_directory(groupDir, ec);
        if (ec) {
            SIMGROUP_ERROR("Materializer", "Cannot create group folder ", groupDir, ": ", ec.message());
            for (const auto& path : groups[g]) {
                report.failures.push_back({ path, "cannot create group folder: " + ec.message() });
            }
            if (m_progress) m_progress->updateFailed(groups[g].size());
            continue;
        }
        ++report.groupDirectories;

        SIMGROUP_INFO("Materializer", "Saving group ", g + 1, " (", groups[g].size(), " files)");

        std::unordered_set<std::string> taken;
        for (const auto& path : groups[g]) {
            if (!fs::is_regular_file(path, ec)) {
                SIMGROUP_WARN("Materializer", "  File not found: ", path);
                report.failures.push_back({ path, "file not found" });
                if (m_progress) m_progress->updateFailed(1);
                continue;
            }

            auto destination = resolveCollision(groupDir / pathToSafeFilename(path), taken);
            taken.insert(destination.string());
            tasks.push_back(CopyTask{ path, std::move(destination), g });
        }
    }

    const size_t workers = std::min<size_t>(static_cast<size_t>(m_threads), std::max<size_t>(1, tasks.size()));
    if (workers <= 1) {
        for (auto& task : tasks) {
            runCopy(task);
            if (m_progress) m_progress->update(PipelineStage::Copy, 1);
        }
    }
    else {
        WorkQueue<CopyTask> queue(workers * QUEUE_FACTOR);
        std::vector<std::thread> pool;
        pool.reserve(workers);

        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back([this, &queue] {
                while (CopyTask* task = queue.pop()) {
                    runCopy(*task);
                    if (m_progress) m_progress->update(PipelineStage::Copy, 1);
                }
            });
        }

        for (auto& task : tasks) queue.push(&task);
        queue.setSentinel();

        for (auto& worker : pool) worker.join();
    }

    // The mapping is assembled only after every copy has finished
    for (const auto& task : tasks) {
        if (!task.copied) {
            SIMGROUP_ERROR("Materializer", "  Error copying ", task.source, ": ", task.error);
            report.failures.push_back({ task.source, task.error });
            if (m_progress) m_progress->updateFailed(1);
            continue;
        }

        SIMGROUP_DEBUG("Materializer", "  ", fs::path(task.source).filename(), " -> ", task.destination.filename());
        if (report.mapping.insert(task.source, task.destination.string())) {
            ++report.copied;
        }
        else {
            SIMGROUP_WARN("Materializer", "  ", task.source, " appears in more than one group, keeping its first copy");
        }
    }

    SIMGROUP_INFO("Materializer", "Total files copied: ", report.copied);
    SIMGROUP_INFO("Materializer", "Results saved in: ", m_outputRoot);
    return report;
}

} // namespace simgroup

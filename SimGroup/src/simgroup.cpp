#include "simgroup.hpp"
#include "logger.hpp"

namespace simgroup {

MaterializeReport materialize(const std::vector<Group>& groups,
                              const std::filesystem::path& outputRoot,
                              const MappingStore& store,
                              int threads,
                              ProgressTracker* progress)
{
    if (groups.empty()) {
        SIMGROUP_WARN("Engine", "No groups to save");
        return {};
    }

    ResultMaterializer materializer(outputRoot, threads, progress);
    auto report = materializer.materialize(groups);

    // The output tree was rebuilt, so an older mapping must not survive even when every copy failed
    report.mappingSaved = store.save(report.mapping);
    if (!report.mappingSaved) {
        SIMGROUP_ERROR("Engine", "Mapping could not be persisted to ", store.file());
    }

    return report;
}

ReconcileAndCleanSummary reconcileAndClean(const MappingStore& store,
                                           const std::filesystem::path& outputRoot,
                                           const std::filesystem::path& deletionList,
                                           bool dryRun)
{
    ReconcileAndCleanSummary summary;

    DeletionReconciler reconciler(store, outputRoot, deletionList);
    summary.reconcile = reconciler.reconcile();

    if (!summary.reconcile.listWritten) return summary;

    Cleaner cleaner(dryRun);
    summary.cleanup = cleaner.cleanFromFile(deletionList);
    return summary;
}

} // namespace simgroup

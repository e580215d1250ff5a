#include "check_deleted_command.hpp"
#include "helpers.hpp"
#include "deletion_reconciler.hpp"
#include "logger.hpp"
#include "mapping_store.hpp"

#include <rang.hpp>

#include <iostream>

using namespace rang;
using namespace simgroup_app;

int simgroup_app::handleCheckDeletedCommand(const Arguments& args)
{
    try {
        std::cout << "Searching for files to delete...\n";

        const simgroup::MappingStore store(args.mappingFile);
        const simgroup::DeletionReconciler reconciler(store, args.outputDir, args.deleteList);
        const auto report = reconciler.reconcile();

        if (!report.mappingLoaded) {
            std::cout << fg::yellow << "Nothing to check: no usable mapping in " << args.mappingFile.string()
                << " or no results folder at " << args.outputDir.string() << fg::reset << '\n';
            return 0;
        }

        if (!report.outputListed) {
            std::cerr << fg::red << "Error: could not read every folder under " << args.outputDir.string()
                << ", no files were marked for deletion" << fg::reset << '\n';
            return 1;
        }

        printReconcileReport(report, args.deleteList);

        if (!report.toDelete.empty() && !report.listWritten) return 1;

        if (report.listWritten) {
            std::cout << style::italic << "\nReview the list, then run 'simgroup cleanup'." << style::reset << '\n';
        }
    }
    catch (const std::exception& e) {
        SIMGROUP_ERROR("CheckDeleted", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

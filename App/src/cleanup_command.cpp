#include "cleanup_command.hpp"
#include "helpers.hpp"
#include "cleaner.hpp"
#include "logger.hpp"

#include <rang.hpp>

#include <iostream>

using namespace rang;
using namespace simgroup_app;

int simgroup_app::handleCleanupCommand(const Arguments& args)
{
    try {
        const auto paths = simgroup::readDeletionList(args.deleteList);
        if (!paths) {
            std::cout << fg::yellow << "No deletion list at " << args.deleteList.string()
                << " (run 'simgroup check-deleted' first)" << fg::reset << '\n';
            return 0;
        }

        if (paths->empty()) {
            std::cout << "Deletion list is empty.\n";
            return 0;
        }

        std::cout << "Files listed for deletion: " << withCommas(paths->size()) << '\n';
        std::cout << "Potential space savings: " << formatFileSize(totalFileSize(*paths)) << '\n';

        if (args.dryRun) {
            std::cout << "(DRY RUN - no files will be deleted)\n";
        }
        else if (!args.assumeYes && !queryYesNo("\nDelete " + std::to_string(paths->size()) + " original image(s)?")) {
            std::cout << "Deletion cancelled.\n";
            return 0;
        }

        const simgroup::Cleaner cleaner(args.dryRun);
        const auto summary = cleaner.clean(*paths);

        printCleanupSummary(summary, args.dryRun);

        if (summary.failed > 0) return 1;
    }
    catch (const std::exception& e) {
        SIMGROUP_ERROR("Cleanup", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

#include "group_command.hpp"
#include "helpers.hpp"
#include "hash_csv.hpp"
#include "logger.hpp"
#include "simgroup.hpp"

#include <rang.hpp>
#include <indicators/multi_progress.hpp>

#include <array>
#include <chrono>
#include <iostream>
#include <numeric>

namespace fs = std::filesystem;
using namespace rang;
using namespace simgroup_app;

int simgroup_app::handleGroupCommand(const Arguments& args)
{
    try {
        auto start = std::chrono::high_resolution_clock::now();

        std::cout << "Reading hashes from " << args.hashFile.string() << "...\n";
        auto csv = simgroup::readHashCsv(args.hashFile);

        printFailures("row(s) skipped in the hash file", csv.rejected);

        if (csv.items.empty()) {
            std::cout << fg::yellow << "No images found in " << args.hashFile.string() << fg::reset << '\n';
            return 0;
        }

        printConfiguration(args.hashFile, csv.items.size(), csv.items.front().fingerprint.bits(), args.threads, args.threshold);

        hideCursor();

        std::array<indicators::ProgressBar, 2> bar_arr = {
            bar("Compare "),
            bar("Copy    ", true)
        };
        indicators::MultiProgress<indicators::ProgressBar, 2> bars(bar_arr[0], bar_arr[1]);

        simgroup::ProgressTracker compareProgress(simgroup::comparisonCount(csv.items.size()), 0,
            [&bars](const simgroup::ProgressInfo& info) {
                bars.set_progress<0>(info.percentComplete(simgroup::PipelineStage::Compare));
            });

        simgroup::ClusterOptions options;
        options.threads = args.threads;
        options.progress = &compareProgress;

        const auto result = simgroup::clusterWithPairs(csv.items, args.threshold, options);
        bars.set_progress<0>(size_t{ 100 });

        if (result.groups.empty()) {
            bars.set_progress<1>(size_t{ 100 });
            showCursor();
            std::cout << fg::green << "\nNo similar images found." << fg::reset << '\n';
            return 0;
        }

        const size_t members = std::accumulate(result.groups.begin(), result.groups.end(), size_t{ 0 },
            [](size_t sum, const simgroup::Group& g) { return sum + g.size(); });

        if (args.printOnly) {
            bars.set_progress<1>(size_t{ 100 });
            showCursor();
            std::cout << "\nFound " << withCommas(result.pairs.size()) << " similar pair(s) in "
                << withCommas(result.groups.size()) << " group(s) of " << withCommas(members) << " image(s)\n\n";
            printGroups(result.groups, true);
            std::cout << "No files copied (--print-only)\n";
            return 0;
        }

        simgroup::ProgressTracker copyProgress(0, members,
            [&bars, &bar_arr](const simgroup::ProgressInfo& info) {
                bars.set_progress<1>(info.percentComplete(simgroup::PipelineStage::Copy));
                if (info.failedItems > 0) {
                    bar_arr[1].set_option(indicators::option::ForegroundColor{ indicators::Color::yellow });
                    bar_arr[1].set_option(indicators::option::PostfixText{ "(" + std::to_string(info.failedItems) + " failed)" });
                }
            });

        const simgroup::MappingStore store(args.mappingFile);
        const auto report = simgroup::materialize(result.groups, args.outputDir, store, args.threads, &copyProgress);
        copyProgress.forceUpdate();
        bars.set_progress<1>(size_t{ 100 });

        showCursor();

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

        std::cout << fg::green << "\nCompleted in " << duration.count() / 1000.0 << " seconds\n\n" << fg::reset;
        std::cout << "Found " << withCommas(result.pairs.size()) << " similar pair(s) in "
            << withCommas(result.groups.size()) << " group(s)\n\n";

        printGroups(result.groups, false);
        printFailures("image(s) could not be copied", report.failures);

        std::cout << "Copied " << withCommas(report.copied) << " image(s) into " << args.outputDir.string() << '\n';

        if (!report.mappingSaved) {
            std::cerr << fg::red << "Error: could not save the mapping to " << args.mappingFile.string() << fg::reset << '\n';
            return 1;
        }

        std::cout << "Mapping saved to " << args.mappingFile.string() << '\n';
        std::cout << style::italic << "\nDelete the copies you do not want from " << args.outputDir.string()
            << ", then run 'simgroup check-deleted'." << style::reset << '\n';
    }
    catch (const std::exception& e) {
        showCursor();
        SIMGROUP_ERROR("Group", e.what());
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}

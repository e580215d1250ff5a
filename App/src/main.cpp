//
//  CLI front-end for the simgroup near-duplicate image grouper
//

#include <argparse/argparse.hpp>

#include "arguments.hpp"
#include "check_deleted_command.hpp"
#include "cleanup_command.hpp"
#include "group_command.hpp"
#include "logger.hpp"

#include <iostream>
#include <optional>
#include <string>

using namespace simgroup_app;

namespace {

int run(const RawArguments& raw, Arguments::Command command, int (*handler)(const Arguments&))
{
    std::optional<Arguments> args;
    try {
        args.emplace(raw, command);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    simgroup::logger::init(static_cast<simgroup::logger::Level>(args->logLevel - 1), 4096, args->logFile);
    const int status = handler(*args);
    simgroup::logger::shutdown();
    return status;
}

} // namespace

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("simgroup", "1.0");
    program.add_description("Groups near-duplicate images by perceptual hash so you can review and remove them");
    program.add_epilog("Examples:\n  simgroup group -i hashes.csv -o output_dir -t 5\n  simgroup check-deleted -o output_dir\n"
                       "  simgroup cleanup --dry-run\n\n"
                       "For detailed options: simgroup <command> --help");

    RawArguments raw;

    argparse::ArgumentParser group_command("group");
    group_command.add_description("Cluster similar images and copy each group into a numbered folder");

    argparse::ArgumentParser check_command("check-deleted");
    check_command.add_description("List the originals whose copies were removed from the output folder");

    argparse::ArgumentParser cleanup_command("cleanup");
    cleanup_command.add_description("Delete the originals named in the deletion list");

    auto addLoggingArgs = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-l", "--log-level")
            .default_value(defaults::LOG_LEVEL)
            .scan<'i', int>()
            .store_into(raw.logLevel)
            .help("Internal logging verbosity (5=errors only, 4=warnings, 3=info, 2=debug, 1=trace)");

        cmd.add_argument("--log-file")
            .default_value(std::string(defaults::LOG_FILE))
            .store_into(raw.logFile)
            .help("File that receives a copy of the log (empty = console only)");
    };

    auto addOutputArgs = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-o", "--output-dir")
            .default_value(std::string(defaults::OUTPUT_DIR))
            .store_into(raw.outputDir)
            .help("Folder that holds the numbered group folders");

        cmd.add_argument("-m", "--mapping")
            .default_value(std::string(defaults::MAPPING_FILE))
            .store_into(raw.mappingFile)
            .help("JSON file recording which original every copy came from");
    };

    auto addDeleteListArg = [&](argparse::ArgumentParser& cmd) {
        cmd.add_argument("-D", "--delete-list")
            .default_value(std::string(defaults::DELETE_LIST))
            .store_into(raw.deleteList)
            .help("Text file with one original path per line");
    };

    // group
    group_command.add_argument("-i", "--input")
        .required()
        .store_into(raw.hashFile)
        .help("CSV file of 'filepath,phash_hex' rows");

    addOutputArgs(group_command);

    group_command.add_argument("-t", "--threshold")
        .default_value(defaults::THRESHOLD)
        .scan<'i', int>()
        .store_into(raw.threshold)
        .help("Maximum Hamming distance for two images to count as similar (0=exact duplicate)");

    group_command.add_argument("-T", "--threads")
        .default_value(defaults::THREADS)
        .scan<'i', int>()
        .store_into(raw.threads)
        .help("Number of CPU threads for comparison and copying (-1 = auto-detect)");

    group_command.add_argument("-p", "--print-only")
        .implicit_value(true)
        .default_value(defaults::PRINT_ONLY)
        .store_into(raw.printOnly)
        .help("Only display the groups without copying anything");

    addLoggingArgs(group_command);

    // check-deleted
    addOutputArgs(check_command);
    addDeleteListArg(check_command);
    addLoggingArgs(check_command);

    // cleanup
    addDeleteListArg(cleanup_command);

    cleanup_command.add_argument("--dry-run")
        .implicit_value(true)
        .default_value(defaults::DRY_RUN)
        .store_into(raw.dryRun)
        .help("Show what would be deleted without actually deleting");

    cleanup_command.add_argument("-y", "--yes")
        .implicit_value(true)
        .default_value(defaults::ASSUME_YES)
        .store_into(raw.assumeYes)
        .help("Delete without asking for confirmation");

    addLoggingArgs(cleanup_command);

    program.add_subparser(group_command);
    program.add_subparser(check_command);
    program.add_subparser(cleanup_command);

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    if (program.is_subcommand_used("group")) {
        return run(raw, Arguments::Command::Group, handleGroupCommand);
    }
    else if (program.is_subcommand_used("check-deleted")) {
        return run(raw, Arguments::Command::CheckDeleted, handleCheckDeletedCommand);
    }
    else if (program.is_subcommand_used("cleanup")) {
        return run(raw, Arguments::Command::Cleanup, handleCleanupCommand);
    }
    else {
        std::cerr << "No command specified. Use 'group', 'check-deleted' or 'cleanup'\n";
        std::cerr << program;
        return 1;
    }
}

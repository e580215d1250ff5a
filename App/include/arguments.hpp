#pragma once

#include <filesystem>
#include <string>

namespace simgroup_app {

namespace defaults {
    constexpr const char* OUTPUT_DIR = "output_dir";
    constexpr const char* MAPPING_FILE = "info.json";
    constexpr const char* DELETE_LIST = "to_delete.txt";
    constexpr const char* LOG_FILE = "simgroup.log";

    constexpr int THRESHOLD = 5;
    constexpr int THREADS = -1;
    constexpr int LOG_LEVEL = 4;
    constexpr bool PRINT_ONLY = false;
    constexpr bool DRY_RUN = false;
    constexpr bool ASSUME_YES = false;
}

struct RawArguments {
    std::string hashFile;
    std::string outputDir = defaults::OUTPUT_DIR;
    std::string mappingFile = defaults::MAPPING_FILE;
    std::string deleteList = defaults::DELETE_LIST;
    std::string logFile = defaults::LOG_FILE;

    int threshold = defaults::THRESHOLD;
    int threads = defaults::THREADS;
    int logLevel = defaults::LOG_LEVEL;
    bool printOnly = defaults::PRINT_ONLY;
    bool dryRun = defaults::DRY_RUN;
    bool assumeYes = defaults::ASSUME_YES;
};

class Arguments {
public:
    enum class Command { Group, CheckDeleted, Cleanup };

    Arguments(const RawArguments& raw, Command command);

    const Command command;
    const std::filesystem::path hashFile;
    const std::filesystem::path outputDir;
    const std::filesystem::path mappingFile;
    const std::filesystem::path deleteList;
    const std::string logFile;

    const int threshold;
    const int threads;
    const int logLevel;
    const bool printOnly;
    const bool dryRun;
    const bool assumeYes;
};

} // namespace simgroup_app

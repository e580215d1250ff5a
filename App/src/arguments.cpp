#include "arguments.hpp"

#include <concepts>
#include <format>
#include <stdexcept>
#include <string_view>

namespace simgroup_app {

namespace fs = std::filesystem;

namespace {

template<std::integral T>
T validateInRange(std::string_view flag, T value, T min, T max)
{
    if (value < min || value > max) {
        throw std::invalid_argument(std::format("{} must be between {} and {} (received {}).", flag, min, max, value));
    }
    return value;
}

fs::path resolvePath(std::string_view flag, const fs::path& input)
{
    if (input.empty()) {
        throw std::invalid_argument(std::format("A path must be provided ({}).", flag));
    }

    std::error_code ec;
    const auto absolutePath = fs::weakly_canonical(fs::absolute(input, ec), ec);
    if (ec) {
        throw std::invalid_argument("Unable to resolve path '" + input.string() + "': " + ec.message());
    }

    return absolutePath;
}

fs::path validateHashFile(const fs::path& input, Arguments::Command command)
{
    if (command != Arguments::Command::Group) return input;

    if (input.empty()) {
        throw std::invalid_argument("A hash file must be provided (--input).");
    }

    std::error_code ec;
    if (!fs::exists(input, ec)) {
        throw std::invalid_argument("Hash file '" + input.string() + "' does not exist.");
    }

    if (!fs::is_regular_file(input, ec)) {
        throw std::invalid_argument("Path '" + input.string() + "' is not a file.");
    }

    return resolvePath("--input", input);
}

// The output directory is wiped on every grouping run
fs::path validateOutputDir(const fs::path& input, const fs::path& hashFile)
{
    const auto resolved = resolvePath("--output-dir", input);

    if (resolved == resolved.root_path()) {
        throw std::invalid_argument("Output directory '" + resolved.string() + "' is a filesystem root.");
    }

    std::error_code ec;
    if (fs::exists(resolved, ec) && !fs::is_directory(resolved, ec)) {
        throw std::invalid_argument("Path '" + resolved.string() + "' is not a directory.");
    }

    if (!hashFile.empty()) {
        const auto rel = hashFile.lexically_relative(resolved);
        if (!rel.empty() && *rel.begin() != "..") {
            throw std::invalid_argument("Output directory '" + resolved.string() + "' contains the hash file.");
        }
    }

    return resolved;
}

int validateThreads(int value)
{
    if (value == -1 || value > 0) return value;

    throw std::invalid_argument(
        std::format("--threads must be -1 (auto) or greater than zero (received {}).", value));
}

} // namespace

Arguments::Arguments(const RawArguments& raw, Command command)
    : command(command),
      hashFile(validateHashFile(raw.hashFile, command)),
      outputDir(validateOutputDir(raw.outputDir, hashFile)),
      mappingFile(resolvePath("--mapping", raw.mappingFile)),
      deleteList(resolvePath("--delete-list", raw.deleteList)),
      logFile(raw.logFile),
      threshold(command == Command::Group ? validateInRange("--threshold", raw.threshold, 0, 256) : raw.threshold),
      threads(validateThreads(raw.threads)),
      logLevel(validateInRange("--log-level", raw.logLevel, 1, 5)),
      printOnly(raw.printOnly),
      dryRun(raw.dryRun),
      assumeYes(raw.assumeYes)
{
}

} // namespace simgroup_app

//
// helpers.cpp
// General utility and helper functions for the simgroup CLI application
//

#include "helpers.hpp"
#include <rang.hpp>
#include <tabulate/table.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <ranges>

namespace simgroup_app {

namespace fs = std::filesystem;
using namespace rang;
using namespace tabulate;

namespace {

void printLogo()
{
    constexpr std::string_view asciiArt = R"(
       _                                        
   ___(_)_ __ ___   __ _ _ __ ___  _   _ _ __  
  / __| | '_ ` _ \ / _` | '__/ _ \| | | | '_ \ 
  \__ \ | | | | | | (_| | | | (_) | |_| | |_) |
  |___/_|_| |_| |_|\__, |_|  \___/ \__,_| .__/ 
                   |___/                |_|    

)";
    std::cout << asciiArt;
}

std::string centerText(std::string_view text, int width) {
    if (text.length() >= static_cast<size_t>(width)) return std::string(text);
    int leftPadding = (width - static_cast<int>(text.length())) / 2;
    return std::string(leftPadding, ' ') + std::string(text);
}

std::string trimCopy(std::string_view value)
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};

    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

} // namespace

indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed, bool show_remaining) {
    return indicators::ProgressBar{
        indicators::option::BarWidth{30},
        indicators::option::PrefixText{std::string(prefix)},
        indicators::option::Start{"["},
        indicators::option::Fill{"="},
        indicators::option::Lead{">"},
        indicators::option::Remainder{" "},
        indicators::option::End{"]"},
        indicators::option::ShowPercentage{true},
        indicators::option::ShowElapsedTime{show_elapsed},
        indicators::option::ShowRemainingTime{show_remaining},
        indicators::option::Stream{std::cout}
    };
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool queryYesNo(const std::string& prompt)
{
    std::cout << prompt << " [y/N] " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return false;

    const auto answer = toLower(trimCopy(line));
    return answer == "y" || answer == "yes" || answer == "1";
}

std::string formatFileSize(std::uintmax_t bytes)
{
    const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    if (bytes == 0) return "0.00 B";

    int unit = std::min(4, static_cast<int>(std::log(static_cast<double>(bytes)) / std::log(1024.0)));
    double size = static_cast<double>(bytes) / std::pow(1024.0, unit);

    return std::format("{:.2f} {}", size, units[unit]);
}

std::uintmax_t totalFileSize(const std::vector<std::string>& paths)
{
    std::uintmax_t total = 0;
    for (const auto& path : paths) {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (!ec) total += size;
    }
    return total;
}

void printConfiguration(const fs::path& hashFile, size_t numImages, int hashBits, int threads, int threshold)
{
    printLogo();

    constexpr int colWidth = 16;
    constexpr int tableWidth = (colWidth * 3) + 4;

    std::cout << style::italic << centerText(hashFile.filename().string(), tableWidth) << '\n'
        << centerText(withCommas(numImages) + " images", tableWidth) << style::reset << '\n';

    std::string hashBitsStr = std::to_string(hashBits) + " bits";
    std::string threadsStr = (threads == -1 ? "auto" : std::to_string(threads));

    Table configurations;
    configurations.add_row({ "Hash Size", "CPU Threads", "Threshold" });
    configurations.add_row({ hashBitsStr, threadsStr, std::to_string(threshold) });
    configurations.format().width(colWidth).font_align(FontAlign::center);
    configurations[0].format().font_style({ FontStyle::bold });

    std::cout << configurations << std::endl << std::endl;
}

void printGroups(const std::vector<simgroup::Group>& groups, bool showAll)
{
    const size_t displayCount = showAll ? groups.size() : std::min<size_t>(20, groups.size());

    Table table;
    table.add_row({ "Group", "Images", "Example" });

    for (size_t i : std::views::iota(size_t{ 0 }, displayCount)) {
        const auto& group = groups[i];
        table.add_row({ std::to_string(i + 1), std::to_string(group.size()), fs::path(group.front()).filename().string() });
    }

    table.format().font_align(FontAlign::left);
    table[0].format().font_style({ FontStyle::bold });
    table.column(1).format().font_align(FontAlign::right);

    std::cout << table << '\n';

    if (displayCount < groups.size()) {
        std::cout << "... and " << (groups.size() - displayCount) << " more group(s)\n";
    }

    if (showAll) {
        for (size_t i = 0; i < groups.size(); ++i) {
            std::cout << '\n' << style::bold << "Group " << (i + 1) << style::reset << '\n';
            for (const auto& path : groups[i]) std::cout << "  " << path << '\n';
        }
    }
    std::cout << '\n';
}

void printFailures(std::string_view title, const std::vector<simgroup::ItemFailure>& failures, size_t limit)
{
    if (failures.empty()) return;

    std::cout << fg::yellow << "Warning: " << withCommas(failures.size()) << ' ' << title << fg::reset << '\n';

    const size_t shown = std::min(limit, failures.size());
    for (size_t i = 0; i < shown; ++i) {
        std::cout << "  " << failures[i].path << ": " << failures[i].reason << '\n';
    }
    if (shown < failures.size()) {
        std::cout << "  ... and " << (failures.size() - shown) << " more\n";
    }
}

void printReconcileReport(const simgroup::ReconcileReport& report, const fs::path& deleteList)
{
    Table stats;
    stats.add_row({ "Saved Files", "Remaining", "Marked for Deletion" });
    stats.add_row({ withCommas(report.mappingRecords), withCommas(report.remainingFiles), withCommas(report.toDelete.size()) });
    stats.format().width(20).font_align(FontAlign::center);
    stats[0].format().font_style({ FontStyle::bold });

    std::cout << stats << "\n\n";

    if (report.toDelete.empty()) {
        std::cout << fg::green << "No files to delete." << fg::reset << '\n';
        return;
    }

    if (report.listWritten) {
        std::cout << "Wrote " << withCommas(report.toDelete.size()) << " path(s) for deletion to " << deleteList.string() << '\n';
        std::cout << "Potential space savings: " << formatFileSize(totalFileSize(report.toDelete)) << '\n';
    }
    else {
        std::cerr << fg::red << "Error: could not write " << deleteList.string() << fg::reset << '\n';
    }
}

void printCleanupSummary(const simgroup::CleanupSummary& summary, bool dryRun)
{
    std::cout << "\nSummary:\n";
    if (dryRun) {
        std::cout << "DRY RUN: Would delete " << withCommas(summary.deleted) << " file(s)\n";
        std::cout << "Would free " << formatFileSize(summary.freedBytes) << " of disk space\n";
    }
    else {
        std::cout << fg::green << "Deleted " << withCommas(summary.deleted) << " file(s)" << fg::reset << '\n';
        std::cout << "Freed " << formatFileSize(summary.freedBytes) << " of disk space\n";
    }

    if (summary.skipped > 0) {
        std::cout << fg::yellow << "Skipped " << withCommas(summary.skipped) << " file(s) that no longer exist" << fg::reset << '\n';
    }

    if (summary.failed > 0) {
        std::cout << fg::red << "Failed to delete " << withCommas(summary.failed) << " file(s)" << fg::reset << '\n';
        for (const auto& failure : summary.failures) {
            std::cerr << "Error deleting '" << failure.path << "': " << failure.reason << '\n';
        }
    }
}

} // namespace simgroup_app

//
// helpers.hpp
// General utility and helper functions for the simgroup CLI application
//

#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <locale>
#include <string>
#include <string_view>
#include <vector>
#include <indicators/progress_bar.hpp>

#include "cleaner.hpp"
#include "deletion_reconciler.hpp"
#include "fingerprint.hpp"

namespace simgroup_app {

// Cursor visibility control
inline void hideCursor() { std::cout << "\033[?25l" << std::flush; }
inline void showCursor() { std::cout << "\033[?25h" << std::flush; }

// Progress bar creation
indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed = false, bool show_remaining = false);

// Number formatting
template <std::integral T>
std::string withCommas(T number)
{
    try {
        static const auto loc = std::locale("");
        return std::format(loc, "{:L}", number);
    }
    catch (const std::runtime_error&) {
        return std::format("{}", number);
    }
}

// String manipulation
std::string toLower(std::string s);

// User interaction
bool queryYesNo(const std::string& prompt);

// File size formatting
std::string formatFileSize(std::uintmax_t bytes);

// Total size of the files that still exist
std::uintmax_t totalFileSize(const std::vector<std::string>& paths);

// Result display functions
void printConfiguration(const std::filesystem::path& hashFile, size_t numImages, int hashBits,
                        int threads, int threshold);

void printGroups(const std::vector<simgroup::Group>& groups, bool showAll);

void printFailures(std::string_view title, const std::vector<simgroup::ItemFailure>& failures, size_t limit = 20);

void printReconcileReport(const simgroup::ReconcileReport& report, const std::filesystem::path& deleteList);

void printCleanupSummary(const simgroup::CleanupSummary& summary, bool dryRun);

} // namespace simgroup_app

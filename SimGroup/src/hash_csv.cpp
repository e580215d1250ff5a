#include "hash_csv.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace simgroup {

namespace fs = std::filesystem;

namespace {

std::string_view trim(std::string_view value)
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};

    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

struct CsvRow {
    std::string path;
    std::string hash;
};

// Comma-separated field starting right after `comma`
std::string_view fieldAfter(std::string_view line, size_t comma)
{
    const auto next = line.find(',', comma + 1);
    return trim(line.substr(comma + 1, next == std::string_view::npos ? std::string_view::npos : next - comma - 1));
}

/**
 * Split a row into path and hash. With `trailingColumns` known from the header, the hash
 * is the column that many fields before the end; otherwise it is the first hexadecimal
 * field after the path, falling back to the last field.
 */
std::optional<CsvRow> splitRow(std::string_view line, std::optional<size_t> trailingColumns = std::nullopt)
{
    line = trim(line);
    if (line.empty()) return std::nullopt;

    CsvRow row;
    std::string_view rest;

    if (line.front() == '"') {
        size_t i = 1;
        bool closed = false;
        while (i < line.size()) {
            if (line[i] == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    row.path.push_back('"');
                    i += 2;
                    continue;
                }
                closed = true;
                ++i;
                break;
            }
            row.path.push_back(line[i++]);
        }
        if (!closed) return std::nullopt;

        rest = trim(line.substr(i));
        if (rest.empty() || rest.front() != ',') return std::nullopt;
        rest.remove_prefix(1);
    }
    else {
        // Hashes never contain commas, paths might
        std::vector<size_t> commas;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == ',') commas.push_back(i);
        }
        if (commas.empty()) return std::nullopt;

        size_t hashComma = commas.back();
        if (trailingColumns) {
            if (commas.size() <= *trailingColumns) return std::nullopt;
            hashComma = commas[commas.size() - 1 - *trailingColumns];
        }
        else {
            for (const size_t comma : commas) {
                if (PerceptualHash::fromHex(fieldAfter(line, comma))) {
                    hashComma = comma;
                    break;
                }
            }
        }

        row.path = std::string(trim(line.substr(0, hashComma)));
        rest = line.substr(hashComma + 1);
    }

    // Extra columns (e.g. a size or timestamp) are ignored
    rest = trim(rest);
    rest = trim(rest.substr(0, rest.find(',')));
    row.hash = std::string(rest);
    return row;
}

// A first line whose hash column is not hexadecimal is a column header
bool isHeader(std::string_view line)
{
    const auto row = splitRow(line);
    return row && !PerceptualHash::fromHex(row->hash);
}

// Columns a header declares after `filepath,phash_hex`
size_t trailingColumnCount(std::string_view header)
{
    const auto columns = static_cast<size_t>(std::ranges::count(header, ',')) + 1;
    return columns > 2 ? columns - 2 : 0;
}

} // namespace

HashCsvContents parseHashCsv(std::istream& in, const fs::path& baseDirectory)
{
    HashCsvContents contents;
    std::unordered_set<std::string> seen;
    int width = -1;

    std::string line;
    size_t lineNumber = 0;
    bool firstRow = true;
    std::optional<size_t> trailingColumns;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (trim(line).empty()) continue;
        if (std::exchange(firstRow, false) && isHeader(line)) {
            trailingColumns = trailingColumnCount(trim(line));
            continue;
        }

        ++contents.rows;

        auto row = splitRow(line, trailingColumns);
        if (!row || row->path.empty()) {
            SIMGROUP_WARN("HashCsv", "Line ", lineNumber, ": malformed row, skipped");
            contents.rejected.push_back({ std::string(trim(line)), std::format("line {}: malformed row", lineNumber) });
            continue;
        }

        fs::path path(row->path);
        if (path.is_relative()) path = baseDirectory / path;
        const std::string identifier = path.lexically_normal().string();

        auto hash = PerceptualHash::fromHex(row->hash);
        if (!hash) {
            SIMGROUP_WARN("HashCsv", "Line ", lineNumber, ": '", row->hash, "' is not a hexadecimal hash");
            contents.rejected.push_back({ identifier, std::format("line {}: invalid hash '{}'", lineNumber, row->hash) });
            continue;
        }

        if (width < 0) width = hash->bits();
        if (hash->bits() != width) {
            SIMGROUP_WARN("HashCsv", "Line ", lineNumber, ": ", hash->bits(), "-bit hash, expected ", width, " bits");
            contents.rejected.push_back({ identifier,
                std::format("line {}: {}-bit hash, expected {} bits", lineNumber, hash->bits(), width) });
            continue;
        }

        if (!seen.insert(identifier).second) {
            SIMGROUP_WARN("HashCsv", "Line ", lineNumber, ": duplicate entry for ", identifier);
            contents.rejected.push_back({ identifier, std::format("line {}: duplicate path", lineNumber) });
            continue;
        }

        contents.items.push_back(Item<PerceptualHash>{ identifier, std::move(*hash) });
    }

    return contents;
}

HashCsvContents readHashCsv(const fs::path& file)
{
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error(std::format("Cannot open hash file '{}'", file.string()));
    }

    std::error_code ec;
    auto base = fs::absolute(file, ec).parent_path();
    if (ec) base = file.parent_path();

    auto contents = parseHashCsv(in, base);
    SIMGROUP_INFO("HashCsv", "Loaded ", contents.items.size(), " of ", contents.rows, " hash row(s) from ", file);
    return contents;
}

} // namespace simgroup

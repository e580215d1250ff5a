//
// hash_csv.hpp
// Loads (path, perceptual hash) items from a hash CSV
//

#pragma once

#include "fingerprint.hpp"
#include "perceptual_hash.hpp"

#include <filesystem>
#include <istream>
#include <vector>

namespace simgroup {

struct HashCsvContents {
    std::vector<Item<PerceptualHash>> items;
    std::vector<ItemFailure> rejected;
    size_t rows = 0;
};

/**
 * Parse hash CSV rows of the form `filepath,phash_hex` (path optionally double-quoted,
 * with "" as an escaped quote). A first line without a hexadecimal hash is taken as
 * the column header and skipped. Columns after the hash are ignored: a header fixes how
 * many there are, otherwise an unquoted path ends before the first hexadecimal field.
 *
 * Rows are rejected, not fatal, when the hash is not hexadecimal, when its width differs
 * from the first accepted hash, or when the path repeats an earlier row. Relative paths
 * are resolved against `baseDirectory`.
 */
HashCsvContents parseHashCsv(std::istream& in, const std::filesystem::path& baseDirectory);

/**
 * parseHashCsv() on a file; relative paths resolve against the file's directory.
 * @throws std::runtime_error if the file cannot be opened
 */
HashCsvContents readHashCsv(const std::filesystem::path& file);

} // namespace simgroup

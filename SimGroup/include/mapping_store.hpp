//
// mapping_store.hpp
// Durable JSON storage for the original -> copy mapping
//

#pragma once

#include "mapping.hpp"

#include <filesystem>
#include <optional>

namespace simgroup {

class MappingStore {
public:
    explicit MappingStore(std::filesystem::path file);

    /**
     * Replace the stored mapping with `mapping` (one JSON object, keys in mapping order).
     * Parent directories are created as needed; the file is swapped in atomically.
     * @return false if the file could not be written; the previous file is left intact
     */
    bool save(const Mapping& mapping) const;

    /**
     * @return The stored mapping, or std::nullopt (with a warning) when the file is
     *         missing, unreadable or not a JSON object of strings
     */
    std::optional<Mapping> load() const;

    const std::filesystem::path& file() const { return m_file; }

private:
    std::filesystem::path m_file;
};

} // namespace simgroup

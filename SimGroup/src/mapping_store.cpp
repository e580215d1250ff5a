#include "mapping_store.hpp"
#include "logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace simgroup {

namespace fs = std::filesystem;
using json = nlohmann::ordered_json;

MappingStore::MappingStore(fs::path file)
    : m_file(std::move(file))
{
}

bool MappingStore::save(const Mapping& mapping) const
{
    std::error_code ec;
    if (m_file.has_parent_path()) {
        fs::create_directories(m_file.parent_path(), ec);
        if (ec) {
            SIMGROUP_ERROR("MappingStore", "Cannot create ", m_file.parent_path(), ": ", ec.message());
            return false;
        }
    }

    json j = json::object();
    for (const auto& entry : mapping) {
        j[entry.original] = entry.destination;
    }

    fs::path staging = m_file;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out) {
            SIMGROUP_ERROR("MappingStore", "Cannot write ", staging);
            return false;
        }
        out << j.dump(2) << '\n';
        if (!out.flush()) {
            SIMGROUP_ERROR("MappingStore", "Failed while writing ", staging);
            out.close();
            fs::remove(staging, ec);
            return false;
        }
    }

    fs::rename(staging, m_file, ec);
    if (ec) {
        SIMGROUP_ERROR("MappingStore", "Cannot replace ", m_file, ": ", ec.message());
        fs::remove(staging, ec);
        return false;
    }

    SIMGROUP_INFO("MappingStore", "Information about saved files written to ", m_file);
    SIMGROUP_INFO("MappingStore", "Total records in mapping: ", mapping.size());
    return true;
}

std::optional<Mapping> MappingStore::load() const
{
    std::error_code ec;
    if (!fs::exists(m_file, ec)) {
        SIMGROUP_WARN("MappingStore", "Info file ", m_file, " not found");
        return std::nullopt;
    }

    std::ifstream in(m_file, std::ios::binary);
    if (!in) {
        SIMGROUP_WARN("MappingStore", "Cannot open ", m_file);
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(in);
    }
    catch (const json::parse_error& e) {
        SIMGROUP_WARN("MappingStore", "Error reading ", m_file, ": ", e.what());
        return std::nullopt;
    }

    if (!j.is_object()) {
        SIMGROUP_WARN("MappingStore", m_file, " does not hold a JSON object");
        return std::nullopt;
    }

    Mapping mapping;
    for (const auto& [original, destination] : j.items()) {
        if (!destination.is_string()) {
            SIMGROUP_WARN("MappingStore", m_file, ": value for '", original, "' is not a path string");
            return std::nullopt;
        }
        if (!mapping.insert(original, destination.get<std::string>())) {
            SIMGROUP_WARN("MappingStore", m_file, ": destination of '", original, "' is recorded twice");
            return std::nullopt;
        }
    }

    SIMGROUP_INFO("MappingStore", "Loaded mapping from ", m_file, " (", mapping.size(), " records)");
    return mapping;
}

} // namespace simgroup

#pragma once

#include "arguments.hpp"

namespace simgroup_app {

/**
 * Handles the 'check-deleted' command: finds copies the user removed from the output
 * tree and writes their originals to the deletion list
 * @param args Command arguments containing the output directory, mapping and list paths
 * @return 0 on success, 1 on error
 */
int handleCheckDeletedCommand(const Arguments& args);

} // namespace simgroup_app

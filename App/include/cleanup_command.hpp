#pragma once

#include "arguments.hpp"

namespace simgroup_app {

/**
 * Handles the 'cleanup' command: deletes the originals listed in the deletion list
 * @param args Command arguments containing the list path and deletion options
 * @return 0 on success, 1 on error or when deletions failed
 */
int handleCleanupCommand(const Arguments& args);

} // namespace simgroup_app

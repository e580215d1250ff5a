#pragma once

#include "arguments.hpp"

namespace simgroup_app {

/**
 * Handles the 'group' command: clusters the images of a hash file and copies every
 * group into the numbered output tree, recording the mapping
 * @param args Command arguments containing the hash file, threshold and output options
 * @return 0 on success (including "nothing similar found"), 1 on error
 */
int handleGroupCommand(const Arguments& args);

} // namespace simgroup_app

//
// concurrency.hpp
// Worker-count resolution shared by the parallel stages
//

#pragma once

#include <thread>

namespace simgroup {

/**
 * Resolve a worker-count option: -1 (auto) maps to the hardware concurrency.
 */
inline int resolveThreadCount(int threads)
{
    if (threads > 0) return threads;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<int>(hw);
}

} // namespace simgroup

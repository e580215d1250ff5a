//
// fingerprint.hpp
// Core value types shared by the clustering engine
//

#pragma once

#include <concepts>
#include <string>
#include <vector>

namespace simgroup {

/**
 * Anything the engine can cluster: a copyable value exposing a symmetric,
 * non-negative distance to another value of the same type.
 */
template <typename T>
concept Fingerprint = std::copyable<T> && requires(const T& a, const T& b) {
    { a.distance(b) } -> std::convertible_to<int>;
};

template <Fingerprint F>
struct Item {
    std::string path;
    F fingerprint;
};

/**
 * Two distinct identifiers found within threshold of each other.
 * `first` always comes before `second` in the input order.
 */
struct SimilarPair {
    std::string first;
    std::string second;
    int distance = 0;

    bool operator==(const SimilarPair&) const = default;
};

using Group = std::vector<std::string>;

// Per-item problem reported by an I/O step; the batch carries on without the item
struct ItemFailure {
    std::string path;
    std::string reason;
};

template <Fingerprint F>
bool areSimilar(const F& a, const F& b, int threshold)
{
    return static_cast<int>(a.distance(b)) <= threshold;
}

} // namespace simgroup

//
// perceptual_hash.hpp
// Fixed-width perceptual hash compared by Hamming distance
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simgroup {

class PerceptualHash {
public:
    PerceptualHash() = default;

    // 64-bit hash, the common 8x8 pHash layout
    explicit PerceptualHash(uint64_t value);

    // Words are little-endian (words[0] holds the lowest 64 bits); bits above `bits` are cleared.
    PerceptualHash(std::vector<uint64_t> words, int bits);

    /**
     * Parse a hexadecimal hash as written by pHash tools (most significant nibble first).
     * An optional "0x" prefix is accepted; the width is 4 bits per digit.
     * @return std::nullopt for empty input or non-hex characters
     */
    static std::optional<PerceptualHash> fromHex(std::string_view hex);

    std::string toHex() const;

    int bits() const { return m_bits; }

    /**
     * Hamming distance between the two hashes
     * @throws std::invalid_argument if the hashes have different widths
     */
    int distance(const PerceptualHash& other) const;

    bool operator==(const PerceptualHash& other) const = default;

private:
    std::vector<uint64_t> m_words;
    int m_bits = 0;
};

} // namespace simgroup

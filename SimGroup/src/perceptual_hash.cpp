#include "perceptual_hash.hpp"

#include <bit>
#include <format>
#include <stdexcept>

namespace simgroup {

namespace {

int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

PerceptualHash::PerceptualHash(uint64_t value)
    : m_words{ value }, m_bits(64)
{
}

PerceptualHash::PerceptualHash(std::vector<uint64_t> words, int bits)
    : m_words(std::move(words)), m_bits(bits)
{
    if (bits < 0) {
        throw std::invalid_argument(std::format("Hash width must not be negative (received {}).", bits));
    }

    m_words.resize((static_cast<size_t>(bits) + 63) / 64, 0);

    if (const int tail = bits % 64; tail != 0) {
        m_words.back() &= (uint64_t{ 1 } << tail) - 1;
    }
}

std::optional<PerceptualHash> PerceptualHash::fromHex(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X")) hex.remove_prefix(2);
    if (hex.empty()) return std::nullopt;

    const size_t digits = hex.size();
    std::vector<uint64_t> words((digits * 4 + 63) / 64, 0);

    // The last digit is the lowest nibble
    for (size_t k = 0; k < digits; ++k) {
        const int value = hexValue(hex[digits - 1 - k]);
        if (value < 0) return std::nullopt;
        words[k / 16] |= static_cast<uint64_t>(value) << ((k % 16) * 4);
    }

    return PerceptualHash(std::move(words), static_cast<int>(digits * 4));
}

std::string PerceptualHash::toHex() const
{
    static constexpr char digitsTable[] = "0123456789abcdef";

    const size_t digits = (static_cast<size_t>(m_bits) + 3) / 4;
    std::string out(digits, '0');

    for (size_t k = 0; k < digits; ++k) {
        const auto nibble = (m_words[k / 16] >> ((k % 16) * 4)) & 0xF;
        out[digits - 1 - k] = digitsTable[nibble];
    }

    return out;
}

int PerceptualHash::distance(const PerceptualHash& other) const
{
    if (m_bits != other.m_bits) {
        throw std::invalid_argument(
            std::format("Cannot compare hashes of different widths ({} and {} bits).", m_bits, other.m_bits));
    }

    int total = 0;
    for (size_t i = 0; i < m_words.size(); ++i) {
        total += std::popcount(m_words[i] ^ other.m_words[i]);
    }
    return total;
}

} // namespace simgroup

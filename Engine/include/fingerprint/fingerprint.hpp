/**
 * @file fingerprint.hpp
 * @brief Fixed-width binary perceptual fingerprint and Hamming distance
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Lookalike {

/**
 * @brief Fixed-width binary code (perceptual hash).
 *
 * Bits are stored little-endian in 64-bit words; bit i lives in
 * words()[i / 64] at position i % 64. Bits above bits() are always zero,
 * so word-wise comparison and hashing are exact.
 */
class Fingerprint {
public:
    static constexpr size_t MAX_BITS = 512;

    Fingerprint() = default;

    /**
     * @brief All-zero code of the given width
     * @throws std::invalid_argument if bits is 0 or above MAX_BITS
     */
    explicit Fingerprint(size_t bits);

    static Fingerprint from_u64(uint64_t value, size_t bits = 64);

    /**
     * @brief Parse hex text, most significant digit first
     *
     * @param hex   Digits, optionally prefixed by "0x"
     * @param bits  Code width; 0 means four bits per digit
     * @throws std::invalid_argument on bad digits or a value wider than bits
     */
    static Fingerprint from_hex(const std::string& hex, size_t bits = 0);

    /**
     * @brief Hex text of ceil(bits/4) digits, most significant first
     */
    std::string to_hex() const;

    size_t bits() const { return bits_; }
    bool empty() const { return bits_ == 0; }
    const std::vector<uint64_t>& words() const { return words_; }

    bool bit(size_t index) const;
    void set_bit(size_t index, bool value = true);
    void flip_bit(size_t index);

    /**
     * @brief Extract width bits starting at offset (width <= 64)
     */
    uint64_t slice(size_t offset, size_t width) const;

    size_t popcount() const;

    /**
     * @brief Number of differing bits
     * @throws std::invalid_argument if the widths differ
     */
    static uint32_t hamming(const Fingerprint& a, const Fingerprint& b);

    bool operator==(const Fingerprint& other) const {
        return bits_ == other.bits_ && words_ == other.words_;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }
    bool operator<(const Fingerprint& other) const;

private:
    size_t bits_ = 0;
    std::vector<uint64_t> words_;
};

struct FingerprintHasher {
    size_t operator()(const Fingerprint& fp) const {
        size_t h = std::hash<size_t>{}(fp.bits());
        for (uint64_t w : fp.words()) {
            h ^= std::hash<uint64_t>{}(w) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};

} // namespace Lookalike

/**
 * @file fingerprint.cpp
 * @brief Fingerprint parsing, slicing and Hamming distance
 */

#include <fingerprint/fingerprint.hpp>
#include <algorithm>
#include <stdexcept>

namespace Lookalike {

namespace {

constexpr char k_hex_lut[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

size_t word_count(size_t bits) {
    return (bits + 63) / 64;
}

} // namespace

Fingerprint::Fingerprint(size_t bits) : bits_(bits), words_(word_count(bits), 0) {
    if (bits == 0 || bits > MAX_BITS) {
        throw std::invalid_argument("Fingerprint width must be 1.." + std::to_string(MAX_BITS) +
                                    " bits, got " + std::to_string(bits));
    }
}

Fingerprint Fingerprint::from_u64(uint64_t value, size_t bits) {
    Fingerprint fp(bits);
    if (bits < 64 && (value >> bits) != 0) {
        throw std::invalid_argument("Value does not fit in " + std::to_string(bits) + " bits");
    }
    fp.words_[0] = value;
    return fp;
}

Fingerprint Fingerprint::from_hex(const std::string& hex, size_t bits) {
    size_t begin = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        begin = 2;
    }
    size_t digits = hex.size() - begin;
    if (digits == 0) {
        throw std::invalid_argument("Empty fingerprint text");
    }
    if (bits == 0) {
        bits = digits * 4;
    }

    Fingerprint fp(bits);

    // Walk from the least significant digit (rightmost)
    for (size_t i = 0; i < digits; ++i) {
        char c = hex[hex.size() - 1 - i];
        int v = hex_value(c);
        if (v < 0) {
            throw std::invalid_argument(std::string("Invalid hex digit '") + c + "' in fingerprint");
        }
        for (size_t b = 0; b < 4; ++b) {
            if (!((v >> b) & 1)) continue;
            size_t index = i * 4 + b;
            if (index >= bits) {
                throw std::invalid_argument("Fingerprint '" + hex + "' is wider than " +
                                            std::to_string(bits) + " bits");
            }
            fp.set_bit(index);
        }
    }
    return fp;
}

std::string Fingerprint::to_hex() const {
    size_t digits = (bits_ + 3) / 4;
    std::string out(digits, '0');
    for (size_t i = 0; i < digits; ++i) {
        size_t width = std::min<size_t>(4, bits_ - i * 4);
        auto v = static_cast<unsigned>(slice(i * 4, width));
        out[digits - 1 - i] = k_hex_lut[v];
    }
    return out;
}

bool Fingerprint::bit(size_t index) const {
    if (index >= bits_) throw std::out_of_range("Fingerprint bit index out of range");
    return (words_[index / 64] >> (index % 64)) & 1u;
}

void Fingerprint::set_bit(size_t index, bool value) {
    if (index >= bits_) throw std::out_of_range("Fingerprint bit index out of range");
    uint64_t mask = uint64_t{1} << (index % 64);
    if (value) words_[index / 64] |= mask;
    else       words_[index / 64] &= ~mask;
}

void Fingerprint::flip_bit(size_t index) {
    if (index >= bits_) throw std::out_of_range("Fingerprint bit index out of range");
    words_[index / 64] ^= uint64_t{1} << (index % 64);
}

uint64_t Fingerprint::slice(size_t offset, size_t width) const {
    if (width == 0) return 0;
    if (width > 64 || offset + width > bits_) {
        throw std::out_of_range("Fingerprint slice out of range");
    }

    size_t word = offset / 64;
    size_t shift = offset % 64;
    uint64_t value = words_[word] >> shift;
    if (shift != 0 && shift + width > 64) {
        value |= words_[word + 1] << (64 - shift);
    }
    if (width < 64) {
        value &= (uint64_t{1} << width) - 1;
    }
    return value;
}

size_t Fingerprint::popcount() const {
    size_t count = 0;
    for (uint64_t w : words_) count += static_cast<size_t>(__builtin_popcountll(w));
    return count;
}

uint32_t Fingerprint::hamming(const Fingerprint& a, const Fingerprint& b) {
    if (a.bits_ != b.bits_) {
        throw std::invalid_argument("Hamming distance between fingerprints of different widths (" +
                                    std::to_string(a.bits_) + " vs " + std::to_string(b.bits_) + ")");
    }
    uint32_t distance = 0;
    for (size_t i = 0; i < a.words_.size(); ++i) {
        distance += static_cast<uint32_t>(__builtin_popcountll(a.words_[i] ^ b.words_[i]));
    }
    return distance;
}

bool Fingerprint::operator<(const Fingerprint& other) const {
    if (bits_ != other.bits_) return bits_ < other.bits_;
    // Compare from the most significant word down
    for (size_t i = words_.size(); i-- > 0;) {
        if (words_[i] != other.words_[i]) return words_[i] < other.words_[i];
    }
    return false;
}

} // namespace Lookalike

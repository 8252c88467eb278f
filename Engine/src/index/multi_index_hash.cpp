#include <index/multi_index_hash.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace Lookalike {

namespace {

// Visit v and every value reachable by flipping at most `left` bits at
// positions >= from; each value is visited once.
template<typename Visit>
void for_each_neighbor(uint64_t v, size_t width, size_t from, uint32_t left, Visit& visit) {
    visit(v);
    if (left == 0) return;
    for (size_t b = from; b < width; ++b) {
        for_each_neighbor(v ^ (uint64_t(1) << b), width, b + 1, left - 1, visit);
    }
}

// Sum of C(width, i) for i = 0..r, saturating in double
double ball_size(size_t width, uint32_t r) {
    double total = 0.0;
    double term = 1.0;
    for (uint32_t i = 0; i <= r && i <= width; ++i) {
        total += term;
        term = term * static_cast<double>(width - i) / static_cast<double>(i + 1);
    }
    return total;
}

} // namespace

MultiIndexHash::MultiIndexHash(size_t bits, size_t slices) : bits_(bits) {
    if (slices == 0 || slices > bits) {
        throw std::invalid_argument("MultiIndexHash: need 1.." + std::to_string(bits) + " slices, got " +
                                    std::to_string(slices));
    }

    size_t base = bits / slices;
    size_t extra = bits % slices;
    size_t offset = 0;
    for (size_t s = 0; s < slices; ++s) {
        size_t width = base + (s < extra ? 1 : 0);
        if (width > 64) {
            throw std::invalid_argument("MultiIndexHash: slice of " + std::to_string(width) + " bits exceeds 64");
        }
        widths_.push_back(width);
        offsets_.push_back(offset);
        offset += width;
    }
    tables_.resize(slices);
}

void MultiIndexHash::add(uint32_t key, const Fingerprint& fingerprint) {
    if (fingerprint.bits() != bits_) {
        throw std::invalid_argument("MultiIndexHash: expected " + std::to_string(bits_) + "-bit fingerprint");
    }
    uint32_t entry = static_cast<uint32_t>(entries_.size());
    entries_.emplace_back(key, fingerprint);
    for (size_t s = 0; s < widths_.size(); ++s) {
        tables_[s][fingerprint.slice(offsets_[s], widths_[s])].push_back(entry);
    }
}

void MultiIndexHash::clear() {
    entries_.clear();
    for (auto& table : tables_) table.clear();
}

double MultiIndexHash::probe_count(uint32_t radius) const {
    uint32_t r = radius / static_cast<uint32_t>(widths_.size());
    double total = 0.0;
    for (size_t width : widths_) total += ball_size(width, r);
    return total;
}

std::vector<uint32_t> MultiIndexHash::candidates(const Fingerprint& fingerprint, uint32_t radius) const {
    std::vector<uint32_t> out;

    // Enumerating the ball costs more than reading every entry: scan instead.
    if (probe_count(radius) >= static_cast<double>(entries_.size())) {
        out.resize(entries_.size());
        for (uint32_t i = 0; i < out.size(); ++i) out[i] = i;
        return out;
    }

    uint32_t r = radius / static_cast<uint32_t>(widths_.size());
    std::vector<char> seen(entries_.size(), 0);
    for (size_t s = 0; s < widths_.size(); ++s) {
        const auto& table = tables_[s];
        auto visit = [&](uint64_t value) {
            auto it = table.find(value);
            if (it == table.end()) return;
            for (uint32_t entry : it->second) {
                if (!seen[entry]) {
                    seen[entry] = 1;
                    out.push_back(entry);
                }
            }
        };
        for_each_neighbor(fingerprint.slice(offsets_[s], widths_[s]), widths_[s], 0, r, visit);
    }
    return out;
}

std::vector<std::pair<uint32_t, uint32_t>> MultiIndexHash::query(const Fingerprint& fingerprint,
                                                                 uint32_t radius) const {
    if (fingerprint.bits() != bits_) {
        throw std::invalid_argument("MultiIndexHash: expected " + std::to_string(bits_) + "-bit fingerprint");
    }

    std::vector<std::pair<uint32_t, uint32_t>> out;
    for (uint32_t entry : candidates(fingerprint, radius)) {
        const auto& [key, code] = entries_[entry];
        uint32_t d = Fingerprint::hamming(code, fingerprint);
        if (d <= radius) out.emplace_back(key, d);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace Lookalike

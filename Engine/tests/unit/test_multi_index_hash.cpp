/**
 * @file test_multi_index_hash.cpp
 * @brief Slice-table prefilter returns exactly the linear-scan result
 */

#include <gtest/gtest.h>
#include <index/multi_index_hash.hpp>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace Lookalike;

namespace {

using Matches = std::vector<std::pair<uint32_t, uint32_t>>;

Matches linear(const std::vector<Fingerprint>& codes, const Fingerprint& probe, uint32_t radius) {
    Matches out;
    for (uint32_t i = 0; i < codes.size(); ++i) {
        uint32_t d = Fingerprint::hamming(codes[i], probe);
        if (d <= radius) out.emplace_back(i, d);
    }
    return out;
}

std::vector<Fingerprint> near_codes(size_t count, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<Fingerprint> codes;
    uint64_t centre = rng();
    for (size_t i = 0; i < count; ++i) {
        if (i % 50 == 0) centre = rng();
        uint64_t code = centre;
        size_t flips = rng() % 12;
        for (size_t f = 0; f < flips; ++f) code ^= uint64_t(1) << (rng() % 64);
        codes.push_back(Fingerprint::from_u64(code));
    }
    return codes;
}

} // namespace

TEST(MultiIndexHashTest, SliceLayout) {
    MultiIndexHash mih(64, 5);
    EXPECT_EQ(mih.slices(), 5u);
    EXPECT_EQ(mih.slice_widths(), (std::vector<size_t>{13, 13, 13, 13, 12}));

    EXPECT_THROW(MultiIndexHash(64, 0), std::invalid_argument);
    EXPECT_THROW(MultiIndexHash(64, 65), std::invalid_argument);
    EXPECT_THROW(MultiIndexHash(256, 2), std::invalid_argument);
}

TEST(MultiIndexHashTest, RadiusBelowSliceCount) {
    auto codes = near_codes(2000, 17);
    MultiIndexHash mih(64, 8);
    for (uint32_t i = 0; i < codes.size(); ++i) mih.add(i, codes[i]);

    // t < k: every probe is a single bucket lookup per slice
    EXPECT_DOUBLE_EQ(mih.probe_count(5), 8.0);
    for (size_t i = 0; i < codes.size(); i += 37) {
        EXPECT_EQ(mih.query(codes[i], 5), linear(codes, codes[i], 5));
    }
}

TEST(MultiIndexHashTest, RadiusAtOrAboveSliceCount) {
    auto codes = near_codes(2000, 23);
    MultiIndexHash mih(64, 4);
    for (uint32_t i = 0; i < codes.size(); ++i) mih.add(i, codes[i]);

    for (uint32_t radius : {4u, 7u, 9u}) {
        for (size_t i = 0; i < codes.size(); i += 53) {
            EXPECT_EQ(mih.query(codes[i], radius), linear(codes, codes[i], radius)) << "radius " << radius;
        }
    }
}

TEST(MultiIndexHashTest, LargeRadiusFallsBackToScan) {
    auto codes = near_codes(100, 31);
    MultiIndexHash mih(64, 2);
    for (uint32_t i = 0; i < codes.size(); ++i) mih.add(i, codes[i]);

    EXPECT_GE(mih.probe_count(40), static_cast<double>(mih.size()));
    EXPECT_EQ(mih.query(codes[0], 40), linear(codes, codes[0], 40));
}

TEST(MultiIndexHashTest, ClearAndWidthCheck) {
    MultiIndexHash mih(64, 4);
    mih.add(1, Fingerprint::from_u64(3));
    EXPECT_EQ(mih.size(), 1u);
    EXPECT_THROW(mih.add(2, Fingerprint(32)), std::invalid_argument);
    EXPECT_THROW(mih.query(Fingerprint(32), 1), std::invalid_argument);

    mih.clear();
    EXPECT_EQ(mih.size(), 0u);
    EXPECT_TRUE(mih.query(Fingerprint::from_u64(3), 0).empty());
}

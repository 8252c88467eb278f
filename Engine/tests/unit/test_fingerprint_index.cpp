/**
 * @file test_fingerprint_index.cpp
 * @brief BK-tree range queries checked against a linear scan
 */

#include <gtest/gtest.h>
#include <index/fingerprint_index.hpp>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using namespace Lookalike;

namespace {

std::vector<Item> random_items(size_t count, size_t bits, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<Item> items;
    for (size_t i = 0; i < count; ++i) {
        Fingerprint fp(bits);
        for (size_t b = 0; b < bits; ++b) {
            if (rng() & 1) fp.set_bit(b);
        }
        items.push_back(Item{static_cast<ItemId>(i + 1), fp, ""});
    }
    return items;
}

// Few centres with small perturbations: many hits at low radii, plus exact repeats
std::vector<Item> clustered_items(size_t centres, size_t per_centre, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<Item> items;
    ItemId next = 1;
    for (size_t c = 0; c < centres; ++c) {
        uint64_t centre = rng();
        for (size_t i = 0; i < per_centre; ++i) {
            uint64_t code = centre;
            size_t flips = rng() % 6;
            for (size_t f = 0; f < flips; ++f) code ^= uint64_t(1) << (rng() % 64);
            items.push_back(Item{next++, Fingerprint::from_u64(code), ""});
        }
    }
    return items;
}

} // namespace

TEST(FingerprintIndexTest, SampleCodes) {
    std::vector<Item> items{
        {1, Fingerprint::from_u64(0), "/a/1.jpg"},
        {2, Fingerprint::from_u64(0x7), "/a/2.jpg"},
        {3, Fingerprint::from_u64(0x3FFFFFFFFFCull), "/a/3.jpg"},
    };
    FingerprintIndex index;
    index.build(items);

    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.query(items[0].fingerprint, 5), (std::vector<IndexMatch>{{1, 0}, {2, 3}}));
    EXPECT_EQ(index.query(items[2].fingerprint, 5), (std::vector<IndexMatch>{{3, 0}}));
    EXPECT_EQ(index.query(items[0].fingerprint, 40),
              (std::vector<IndexMatch>{{1, 0}, {2, 3}, {3, 40}}));
}

TEST(FingerprintIndexTest, MatchesBruteForceOnRandomCodes) {
    auto items = random_items(600, 64, 42);
    FingerprintIndex index;
    index.build(items);

    std::mt19937_64 rng(7);
    for (int q = 0; q < 40; ++q) {
        const auto& probe = items[rng() % items.size()].fingerprint;
        for (uint32_t radius : {0u, 8u, 20u, 28u, 64u, 65u, std::numeric_limits<uint32_t>::max()}) {
            EXPECT_EQ(index.query(probe, radius), FingerprintIndex::brute_force(items, probe, radius))
                << "radius " << radius;
        }
    }
}

TEST(FingerprintIndexTest, MatchesBruteForceOnClusteredCodes) {
    auto items = clustered_items(25, 20, 99);
    // Exact repeats under new ids
    for (ItemId id = 1; id <= 30; ++id) {
        items.push_back(Item{1000 + id, items[static_cast<size_t>(id - 1)].fingerprint, ""});
    }
    FingerprintIndex index;
    index.build(items);
    EXPECT_LT(index.group_count(), items.size());

    for (const auto& item : items) {
        for (uint32_t radius : {0u, 3u, 10u}) {
            ASSERT_EQ(index.query(item.fingerprint, radius),
                      FingerprintIndex::brute_force(items, item.fingerprint, radius));
        }
    }
}

TEST(FingerprintIndexTest, WideCodes) {
    auto items = random_items(200, 256, 5);
    FingerprintIndex index(256);
    index.build(items);
    for (size_t i = 0; i < 20; ++i) {
        EXPECT_EQ(index.query(items[i].fingerprint, 120),
                  FingerprintIndex::brute_force(items, items[i].fingerprint, 120));
    }
}

TEST(FingerprintIndexTest, ExactBuckets) {
    auto fp = Fingerprint::from_u64(0xABCDEF);
    FingerprintIndex index;
    index.build({{5, fp, ""}, {2, fp, ""}, {9, Fingerprint::from_u64(1), ""}});

    EXPECT_EQ(index.exact(fp), (std::vector<ItemId>{2, 5}));
    EXPECT_TRUE(index.exact(Fingerprint::from_u64(2)).empty());
    EXPECT_EQ(index.group_count(), 2u);
}

TEST(FingerprintIndexTest, ExcludedIdsAreNeverReturned) {
    auto items = clustered_items(5, 10, 3);
    FingerprintIndex index;
    index.build(items);

    ASSERT_TRUE(index.exclude(4));
    EXPECT_FALSE(index.exclude(4));
    EXPECT_FALSE(index.contains(4));
    EXPECT_EQ(index.excluded_count(), 1u);

    for (const auto& item : items) {
        for (const auto& m : index.query(item.fingerprint, 64)) EXPECT_NE(m.id, 4);
    }
    for (const auto& m : index.exact(items[3].fingerprint)) EXPECT_NE(m, 4);

    ASSERT_TRUE(index.restore(4));
    EXPECT_FALSE(index.restore(4));
    EXPECT_TRUE(index.contains(4));
    EXPECT_EQ(index.query(items[3].fingerprint, 0).front().distance, 0u);

    index.exclude(4);
    index.build(items);
    EXPECT_EQ(index.excluded_count(), 0u);
    EXPECT_TRUE(index.contains(4));
}

TEST(FingerprintIndexTest, IncrementalInsertMatchesBuild) {
    auto items = random_items(300, 64, 11);
    std::vector<Item> first(items.begin(), items.begin() + 150);

    FingerprintIndex index;
    index.build(first);
    for (size_t i = 150; i < items.size(); ++i) index.insert(items[i]);

    EXPECT_EQ(index.size(), items.size());
    for (size_t i = 0; i < items.size(); i += 7) {
        EXPECT_EQ(index.query(items[i].fingerprint, 24),
                  FingerprintIndex::brute_force(items, items[i].fingerprint, 24));
    }
}

TEST(FingerprintIndexTest, ReinsertMovesChangedFingerprint) {
    FingerprintIndex index;
    index.build({{1, Fingerprint::from_u64(0), ""}, {2, Fingerprint::from_u64(0xFF), ""}});

    index.insert({1, Fingerprint::from_u64(0xFF), ""});
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.exact(Fingerprint::from_u64(0xFF)), (std::vector<ItemId>{1, 2}));
    EXPECT_TRUE(index.exact(Fingerprint::from_u64(0)).empty());
    EXPECT_TRUE(index.query(Fingerprint::from_u64(0), 0).empty());
}

TEST(FingerprintIndexTest, RejectsWrongWidth) {
    FingerprintIndex index(64);
    EXPECT_THROW(index.build({{1, Fingerprint(32), ""}}), std::invalid_argument);
    EXPECT_THROW(index.query(Fingerprint(128), 3), std::invalid_argument);
    EXPECT_THROW(FingerprintIndex(0), std::invalid_argument);
}

TEST(FingerprintIndexTest, EmptyIndex) {
    FingerprintIndex index;
    index.build({});
    EXPECT_TRUE(index.query(Fingerprint::from_u64(1), 64).empty());
    EXPECT_EQ(index.group_count(), 0u);
}

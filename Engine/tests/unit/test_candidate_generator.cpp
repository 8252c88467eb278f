/**
 * @file test_candidate_generator.cpp
 * @brief Exact and fuzzy pair discovery against an all-pairs oracle
 */

#include <gtest/gtest.h>
#include <dedup/candidate_generator.hpp>
#include <storage/memory_relation_store.hpp>
#include <limits>
#include <random>
#include <set>
#include <vector>

using namespace Lookalike;

namespace {

std::vector<Item> sample_items() {
    return {
        {1, Fingerprint::from_u64(0), "/photos/a/1.jpg"},
        {2, Fingerprint::from_u64(0x7), "/photos/a/2.jpg"},
        {3, Fingerprint::from_u64(0x3FFFFFFFFFCull), "/photos/b/3.jpg"},
    };
}

std::vector<Item> clustered_items(size_t count, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::vector<Item> items;
    uint64_t centre = rng();
    for (size_t i = 0; i < count; ++i) {
        if (i % 12 == 0) centre = rng();
        uint64_t code = centre;
        size_t flips = rng() % 8;
        for (size_t f = 0; f < flips; ++f) code ^= uint64_t(1) << (rng() % 64);
        items.push_back(Item{static_cast<ItemId>(i + 1), Fingerprint::from_u64(code), ""});
    }
    return items;
}

std::set<std::pair<ItemId, ItemId>> all_pairs_within(const std::vector<Item>& items, uint32_t threshold) {
    std::set<std::pair<ItemId, ItemId>> out;
    for (size_t i = 0; i < items.size(); ++i) {
        for (size_t j = i + 1; j < items.size(); ++j) {
            if (Fingerprint::hamming(items[i].fingerprint, items[j].fingerprint) <= threshold) {
                auto pair = PairKey::make(items[i].id, items[j].id);
                out.emplace(pair.a, pair.b);
            }
        }
    }
    return out;
}

std::set<std::pair<ItemId, ItemId>> as_set(const CandidateSet& result) {
    std::set<std::pair<ItemId, ItemId>> out;
    for (const auto& c : result.candidates) out.emplace(c.pair.a, c.pair.b);
    return out;
}

} // namespace

class CandidateGeneratorTest : public ::testing::Test {
protected:
    CandidateSet run(const std::vector<Item>& items, uint32_t threshold, size_t mih_slices = 0, int threads = 0) {
        FingerprintIndex index;
        index.build(items);
        GeneratorOptions options;
        options.threshold = threshold;
        options.mih_slices = mih_slices;
        options.worker_threads = threads;
        return generator.generate(index, options);
    }

    MemoryRelationStore store;
    CandidateGenerator generator{store};
};

TEST_F(CandidateGeneratorTest, SampleThresholds) {
    auto items = sample_items();

    auto at5 = run(items, 5);
    ASSERT_EQ(at5.candidates.size(), 1u);
    EXPECT_EQ(at5.candidates[0].pair, PairKey::make(1, 2));
    EXPECT_EQ(at5.candidates[0].distance, 3u);
    EXPECT_EQ(at5.candidates[0].kind, RelationKind::NewMatch);

    auto at40 = run(items, 40);
    EXPECT_EQ(as_set(at40), (std::set<std::pair<ItemId, ItemId>>{{1, 2}, {1, 3}}));

    auto at41 = run(items, 41);
    EXPECT_EQ(at41.candidates.size(), 3u);
    EXPECT_FALSE(at41.cancelled);
}

TEST_F(CandidateGeneratorTest, ExactDuplicatesAtThresholdZero) {
    auto fp = Fingerprint::from_u64(0xDEADBEEF);
    std::vector<Item> items{{7, fp, ""}, {3, fp, ""}, {5, fp, ""}, {9, Fingerprint::from_u64(1), ""}};

    auto result = run(items, 0);
    EXPECT_EQ(result.stats.exact_pairs, 3u);
    EXPECT_EQ(result.stats.fuzzy_pairs, 0u);
    EXPECT_EQ(result.stats.items, 4u);
    EXPECT_EQ(result.stats.fingerprints, 2u);
    EXPECT_EQ(as_set(result), (std::set<std::pair<ItemId, ItemId>>{{3, 5}, {3, 7}, {5, 7}}));
    for (const auto& c : result.candidates) EXPECT_EQ(c.distance, 0u);
}

TEST_F(CandidateGeneratorTest, MatchesAllPairsOracle) {
    auto items = clustered_items(400, 1234);
    // A few exact repeats
    for (ItemId id = 1; id <= 10; ++id) {
        items.push_back(Item{500 + id, items[static_cast<size_t>(id * 3)].fingerprint, ""});
    }

    for (uint32_t threshold : {0u, 4u, 10u}) {
        auto expected = all_pairs_within(items, threshold);
        EXPECT_EQ(as_set(run(items, threshold, 0, 1)), expected) << "tree, 1 thread, t=" << threshold;
        EXPECT_EQ(as_set(run(items, threshold, 0, 4)), expected) << "tree, 4 threads, t=" << threshold;
        EXPECT_EQ(as_set(run(items, threshold, 4, 4)), expected) << "mih, t=" << threshold;
    }
}

TEST_F(CandidateGeneratorTest, RadiusBeyondWidthPairsEverything) {
    auto items = clustered_items(64, 2024);
    const size_t n = items.size();
    for (uint32_t threshold : {64u, 1000u, std::numeric_limits<uint32_t>::max()}) {
        EXPECT_EQ(run(items, threshold, 0, 2).candidates.size(), n * (n - 1) / 2) << "tree, t=" << threshold;
        EXPECT_EQ(run(items, threshold, 4, 2).candidates.size(), n * (n - 1) / 2) << "mih, t=" << threshold;
    }
}

TEST_F(CandidateGeneratorTest, OutputIsSortedUniqueAndStable) {
    auto items = clustered_items(300, 77);
    auto first = run(items, 8, 0, 4);
    auto second = run(items, 8, 0, 2);

    ASSERT_EQ(first.candidates.size(), second.candidates.size());
    for (size_t i = 0; i < first.candidates.size(); ++i) {
        EXPECT_EQ(first.candidates[i].pair, second.candidates[i].pair);
        EXPECT_EQ(first.candidates[i].distance, second.candidates[i].distance);
        EXPECT_LT(first.candidates[i].pair.a, first.candidates[i].pair.b);
        if (i > 0) EXPECT_LT(first.candidates[i - 1].pair, first.candidates[i].pair);
    }
}

TEST_F(CandidateGeneratorTest, ExcludedItemsProduceNoPairs) {
    auto items = sample_items();
    FingerprintIndex index;
    index.build(items);
    index.exclude(2);

    GeneratorOptions options;
    options.threshold = 64;
    auto result = generator.generate(index, options);
    EXPECT_EQ(as_set(result), (std::set<std::pair<ItemId, ItemId>>{{1, 3}}));
}

TEST_F(CandidateGeneratorTest, CancelledBeforeStart) {
    auto items = clustered_items(200, 5);
    FingerprintIndex index;
    index.build(items);

    CancellationToken token;
    token.cancel();
    GeneratorOptions options;
    options.threshold = 6;
    options.cancel = &token;

    auto result = generator.generate(index, options);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.stats.fuzzy_pairs, 0u);
}

TEST_F(CandidateGeneratorTest, CancelledExactOnlyScan) {
    auto fp = Fingerprint::from_u64(0xABCDEF);
    std::vector<Item> items;
    for (ItemId id = 1; id <= 50; ++id) items.push_back(Item{id, fp, ""});
    FingerprintIndex index;
    index.build(items);

    CancellationToken token;
    token.cancel();
    GeneratorOptions options;
    options.threshold = 0;
    options.cancel = &token;

    auto result = generator.generate(index, options);
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.candidates.empty());
}

TEST_F(CandidateGeneratorTest, ProgressReachesTotal) {
    auto items = clustered_items(150, 9);
    FingerprintIndex index;
    index.build(items);

    size_t last_done = 0;
    size_t last_total = 0;
    GeneratorOptions options;
    options.threshold = 5;
    options.progress = [&](size_t done, size_t total) {
        last_done = done;
        last_total = total;
    };
    generator.generate(index, options);

    EXPECT_GT(last_total, 0u);
    EXPECT_EQ(last_done, last_total);
}

TEST_F(CandidateGeneratorTest, LoadRespectsScope) {
    store.upsert_items(sample_items());
    FingerprintIndex index;

    EXPECT_EQ(generator.load(index, SourceScope({"/photos/a"})), 2u);
    EXPECT_FALSE(index.contains(3));

    EXPECT_EQ(generator.load(index), 3u);
    EXPECT_TRUE(index.contains(3));
}

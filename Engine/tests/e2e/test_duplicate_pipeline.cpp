/**
 * @file test_duplicate_pipeline.cpp
 * @brief Register, scan, annotate, rescan and delete through the engine facade
 */

#include <gtest/gtest.h>
#include <dedup/duplicate_engine.hpp>
#include <storage/memory_relation_store.hpp>
#include <utils/logger.hpp>
#include <atomic>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace Lookalike;

namespace fs = std::filesystem;

namespace {

EngineConfig memory_config() {
    EngineConfig config;
    config.backend = "memory";
    return config;
}

std::vector<Item> sample_items() {
    return {
        {1, Fingerprint::from_hex("0000000000000000"), "/photos/a/1.jpg"},
        {2, Fingerprint::from_hex("0000000000000007"), "/photos/a/2.jpg"},
        {3, Fingerprint::from_hex("000003fffffffffc"), "/photos/b/3.jpg"},
    };
}

} // namespace

class DuplicatePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto result = engine.register_items(sample_items());
        ASSERT_EQ(result.written, 3u);
        ASSERT_TRUE(result.failures.empty());
    }

    MemoryRelationStore store;
    DuplicateEngine engine{store, memory_config()};
};

TEST_F(DuplicatePipelineTest, AnnotatedPairLeavesDefaultView) {
    auto first = engine.find_duplicates(5, SourceScope(), false);
    ASSERT_EQ(first.relations.size(), 1u);
    EXPECT_EQ(first.relations[0].pair, PairKey::make(1, 2));
    EXPECT_EQ(first.relations[0].kind, RelationKind::NewMatch);
    EXPECT_EQ(first.relations[0].distance, 3u);
    EXPECT_EQ(first.inserted, 1u);
    EXPECT_EQ(first.orphans_swept, 0u);

    engine.annotate(PairKey::make(2, 1), RelationKind::Similar);

    auto hidden = engine.find_duplicates(5, SourceScope(), false);
    EXPECT_TRUE(hidden.relations.empty());
    EXPECT_EQ(hidden.existing, 1u);

    auto all = engine.find_duplicates(5, SourceScope(), true);
    ASSERT_EQ(all.relations.size(), 1u);
    EXPECT_EQ(all.relations[0].kind, RelationKind::Similar);
    EXPECT_EQ(all.relations[0].distance, 3u);
}

TEST_F(DuplicatePipelineTest, DeletionCascades) {
    engine.find_duplicates(5, SourceScope(), false);
    ASSERT_EQ(store.relation_count(), 1u);

    EXPECT_EQ(engine.item_deleted(2), 1u);
    EXPECT_FALSE(store.get_kind(PairKey::make(1, 2)).has_value());
    EXPECT_EQ(engine.integrity_check(), 0u);

    // The deleted id never comes back from a scan
    auto report = engine.find_duplicates(64, SourceScope(), true);
    for (const auto& rel : report.relations) EXPECT_FALSE(rel.pair.contains(2));
    EXPECT_EQ(report.relations.size(), 1u);
}

TEST_F(DuplicatePipelineTest, DeletingUnknownItemKeepsIndex) {
    engine.find_duplicates(5, SourceScope(), false);
    try {
        engine.item_deleted(42);
        FAIL() << "expected NotFound";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_EQ(engine.find_duplicates(5, SourceScope(), false).relations.size(), 1u);
}

TEST_F(DuplicatePipelineTest, NotDuplicateSurvivesRediscovery) {
    engine.find_duplicates(5, SourceScope(), false);
    engine.annotate(PairKey::make(1, 2), RelationKind::NotDuplicate);

    for (uint32_t threshold : {3u, 5u, 10u, 40u, 64u, 3u}) {
        auto report = engine.find_duplicates(threshold, SourceScope(), false);
        for (const auto& rel : report.relations) EXPECT_NE(rel.pair, PairKey::make(1, 2));
        EXPECT_EQ(store.get_kind(PairKey::make(1, 2)), RelationKind::NotDuplicate);
        EXPECT_EQ(store.get_relation(PairKey::make(1, 2))->distance, 3u);
    }
}

TEST_F(DuplicatePipelineTest, RepeatedScanIsIdempotent) {
    auto first = engine.find_duplicates(41, SourceScope(), false);
    auto second = engine.find_duplicates(41, SourceScope(), false);

    ASSERT_EQ(first.relations.size(), 3u);
    ASSERT_EQ(second.relations.size(), 3u);
    EXPECT_EQ(second.inserted, 0u);
    for (size_t i = 0; i < first.relations.size(); ++i) {
        EXPECT_EQ(first.relations[i].pair, second.relations[i].pair);
        EXPECT_EQ(first.relations[i].distance, second.relations[i].distance);
    }
}

TEST_F(DuplicatePipelineTest, ScopeRestrictsPairs) {
    auto report = engine.find_duplicates(64, SourceScope({"/photos/a"}), false);
    ASSERT_EQ(report.relations.size(), 1u);
    EXPECT_EQ(report.relations[0].pair, PairKey::make(1, 2));
    EXPECT_EQ(report.stats.items, 2u);

    // Widening the scope rebuilds the index
    EXPECT_EQ(engine.find_duplicates(64, SourceScope(), false).relations.size(), 3u);
}

TEST_F(DuplicatePipelineTest, RegisteredItemsJoinLiveIndex) {
    engine.find_duplicates(5, SourceScope(), false);

    auto result = engine.register_items({{4, Fingerprint::from_hex("000003fffffffffd"), "/photos/b/4.jpg"}});
    EXPECT_EQ(result.written, 1u);

    auto report = engine.find_duplicates(5, SourceScope(), false);
    ASSERT_EQ(report.relations.size(), 2u);
    EXPECT_EQ(report.relations[1].pair, PairKey::make(3, 4));
    EXPECT_EQ(report.relations[1].distance, 1u);
}

TEST_F(DuplicatePipelineTest, RegistrationRejectsBadItems) {
    auto result = engine.register_items({{7, Fingerprint::from_u64(1, 32), "/x"}});
    EXPECT_EQ(result.written, 0u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ErrorKind::ConstraintViolation);

    engine.item_deleted(3);
    result = engine.register_items({{3, Fingerprint::from_u64(0), "/x"}});
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ErrorKind::ConstraintViolation);
    EXPECT_FALSE(store.is_live(3));
}

TEST_F(DuplicatePipelineTest, ResetIsGatedByPolicy) {
    engine.find_duplicates(5, SourceScope(), false);
    engine.annotate(PairKey::make(1, 2), RelationKind::SameSet);

    try {
        engine.annotate(PairKey::make(1, 2), RelationKind::NewMatch);
        FAIL() << "expected InvalidTransition";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidTransition);
    }
    EXPECT_EQ(store.get_kind(PairKey::make(1, 2)), RelationKind::SameSet);

    auto config = memory_config();
    config.allow_annotation_reset = true;
    DuplicateEngine permissive(store, config);
    permissive.reset_annotation(PairKey::make(1, 2));
    EXPECT_EQ(store.get_kind(PairKey::make(1, 2)), RelationKind::NewMatch);
    EXPECT_EQ(permissive.find_duplicates(5, SourceScope(), false).relations.size(), 1u);
}

TEST_F(DuplicatePipelineTest, AnnotatingUnknownPairFails) {
    try {
        engine.annotate(PairKey::make(1, 3), RelationKind::Similar);
        FAIL() << "expected NotFound";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(DuplicatePipelineTest, CancelledScanWritesNothing) {
    CancellationToken token;
    token.cancel();
    ScanRequest request;
    request.threshold = 64;
    request.cancel = &token;

    auto report = engine.find_duplicates(request);
    EXPECT_TRUE(report.cancelled);
    EXPECT_TRUE(report.relations.empty());
    EXPECT_EQ(store.relation_count(), 0u);
}

TEST_F(DuplicatePipelineTest, ThresholdWiderThanCodeIsRejected) {
    EXPECT_THROW(engine.find_duplicates(65, SourceScope(), false), std::invalid_argument);
}

TEST_F(DuplicatePipelineTest, ClustersFromAnnotations) {
    engine.find_duplicates(5, SourceScope(), false);
    engine.annotate(PairKey::make(1, 2), RelationKind::NearDuplicate);

    ClusterOptions options;
    options.persist_new = true;
    auto projection = engine.project_clusters(options);
    ASSERT_EQ(projection.clusters.size(), 1u);
    EXPECT_EQ(projection.clusters[0].members, (std::vector<ItemId>{1, 2}));

    engine.item_deleted(1);
    projection = engine.project_clusters(options);
    ASSERT_EQ(projection.clusters.size(), 1u);
    EXPECT_EQ(projection.clusters[0].members, (std::vector<ItemId>{2}));
    EXPECT_EQ(engine.integrity_check(), 0u);
}

TEST(DuplicatePipelineVisibilityTest, DefaultViewOnlyHoldsNewMatches) {
    MemoryRelationStore store;
    auto config = memory_config();
    config.mih_slices = 4;
    DuplicateEngine engine(store, config);

    std::mt19937_64 rng(2024);
    std::vector<Item> items;
    uint64_t centre = rng();
    for (ItemId id = 1; id <= 300; ++id) {
        if (id % 10 == 1) centre = rng();
        uint64_t code = centre ^ (uint64_t(1) << (rng() % 64));
        items.push_back({id, Fingerprint::from_u64(code), "/bulk/" + std::to_string(id)});
    }
    engine.register_items(items);

    auto first = engine.find_duplicates(6, SourceScope(), false);
    ASSERT_GT(first.relations.size(), 20u);

    const RelationKind kinds[] = {RelationKind::NotDuplicate, RelationKind::NearDuplicate,
                                  RelationKind::Similar, RelationKind::SameSet};
    for (size_t i = 0; i < first.relations.size(); i += 3) {
        engine.annotate(first.relations[i].pair, kinds[i % 4]);
    }

    auto second = engine.find_duplicates(6, SourceScope(), false);
    for (const auto& rel : second.relations) {
        EXPECT_EQ(rel.kind, RelationKind::NewMatch);
        EXPECT_EQ(store.get_kind(rel.pair), RelationKind::NewMatch);
    }
    auto all = engine.find_duplicates(6, SourceScope(), true);
    EXPECT_EQ(all.relations.size(), first.relations.size());
    EXPECT_EQ(second.relations.size(), first.relations.size() - (first.relations.size() + 2) / 3);
}

TEST(DuplicatePipelineConcurrencyTest, ScopedScansRacingStayInScope) {
    MemoryRelationStore store;
    DuplicateEngine engine(store, memory_config());
    engine.register_items({
        {1, Fingerprint::from_hex("00000000000000ff"), "/a/1.jpg"},
        {2, Fingerprint::from_hex("00000000000000ff"), "/a/2.jpg"},
        {3, Fingerprint::from_hex("ff00000000000000"), "/b/3.jpg"},
        {4, Fingerprint::from_hex("ff00000000000000"), "/b/4.jpg"},
    });

    auto previous = Logger::level();
    Logger::set_level(Logger::Level::Error);

    std::atomic<int> out_of_scope{0};
    auto scan = [&](const std::string& root, ItemId lo, ItemId hi) {
        const SourceScope scope({root});
        for (int i = 0; i < 500; ++i) {
            auto report = engine.find_duplicates(5, scope, true);
            for (const auto& rel : report.relations) {
                if (rel.pair.a < lo || rel.pair.b > hi) ++out_of_scope;
            }
            if (report.relations.size() != 1) ++out_of_scope;
        }
    };
    std::thread a(scan, "/a", 1, 2);
    std::thread b(scan, "/b", 3, 4);
    a.join();
    b.join();
    Logger::set_level(previous);

    EXPECT_EQ(out_of_scope.load(), 0);
    EXPECT_EQ(store.relation_count(), 2u);
}

TEST(DuplicatePipelineSnapshotTest, StateSurvivesRestart) {
    auto path = (fs::temp_directory_path() / ("lookalike_e2e_" + std::to_string(::getpid()) + ".json")).string();
    fs::remove(path);

    auto config = memory_config();
    config.snapshot_path = path;
    {
        auto store = open_relation_store(config);
        store->initialize();
        DuplicateEngine engine(*store, config);
        engine.register_items(sample_items());
        engine.find_duplicates(5, SourceScope(), false);
        engine.annotate(PairKey::make(1, 2), RelationKind::NotDuplicate);
    }
    {
        auto store = open_relation_store(config);
        DuplicateEngine engine(*store, config);
        EXPECT_TRUE(engine.find_duplicates(5, SourceScope(), false).relations.empty());
        EXPECT_EQ(store->get_kind(PairKey::make(1, 2)), RelationKind::NotDuplicate);
    }
    fs::remove(path);
}

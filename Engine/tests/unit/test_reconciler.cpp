/**
 * @file test_reconciler.cpp
 * @brief Candidates are filtered only on the kind read back from storage
 */

#include <gtest/gtest.h>
#include <dedup/reconciler.hpp>
#include <storage/memory_relation_store.hpp>
#include <stdexcept>

using namespace Lookalike;

namespace {

// Loses one pair on the authoritative read, or fails the read outright
class FlakyReadStore : public MemoryRelationStore {
public:
    RelationMap get_relations(const std::vector<PairKey>& pairs) override {
        ++reads;
        if (fail_reads) throw StoreError(ErrorKind::TransientStorageError, "read timed out");
        auto out = MemoryRelationStore::get_relations(pairs);
        if (drop) out.erase(*drop);
        return out;
    }

    bool fail_reads = false;
    std::optional<PairKey> drop;
    int reads = 0;
};

} // namespace

class ReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<Item> items;
        for (ItemId id = 1; id <= 6; ++id) items.push_back({id, Fingerprint::from_u64(static_cast<uint64_t>(id)), ""});
        store.upsert_items(items);
    }

    static Candidate candidate(ItemId a, ItemId b, uint32_t distance,
                               RelationKind kind = RelationKind::NewMatch) {
        return Candidate{PairKey::make(a, b), distance, kind};
    }

    FlakyReadStore store;
};

TEST_F(ReconcilerTest, NewPairsBecomeNewMatch) {
    Reconciler reconciler(store);
    auto result = reconciler.reconcile({candidate(1, 2, 3), candidate(3, 4, 1)}, false);

    ASSERT_EQ(result.relations.size(), 2u);
    EXPECT_EQ(result.relations[0].pair, PairKey::make(1, 2));
    EXPECT_EQ(result.relations[0].kind, RelationKind::NewMatch);
    EXPECT_EQ(result.relations[0].distance, 3u);
    EXPECT_EQ(result.inserted, 2u);
    EXPECT_EQ(result.existing, 0u);
    EXPECT_TRUE(result.complete());
    EXPECT_EQ(store.relation_count(), 2u);
}

TEST_F(ReconcilerTest, AnnotatedPairsAreHiddenAndUntouched) {
    store.upsert_if_absent(PairKey::make(1, 2), 3);
    store.set_kind(PairKey::make(1, 2), RelationKind::NotDuplicate);

    Reconciler reconciler(store);
    // A candidate claiming new_match must not resurrect the pair
    auto result = reconciler.reconcile({candidate(1, 2, 2), candidate(2, 3, 4)}, false);

    ASSERT_EQ(result.relations.size(), 1u);
    EXPECT_EQ(result.relations[0].pair, PairKey::make(2, 3));
    EXPECT_EQ(result.existing, 1u);
    EXPECT_EQ(store.get_kind(PairKey::make(1, 2)), RelationKind::NotDuplicate);
    EXPECT_EQ(store.get_relation(PairKey::make(1, 2))->distance, 3u);

    auto all = reconciler.reconcile({candidate(1, 2, 2), candidate(2, 3, 4)}, true);
    ASSERT_EQ(all.relations.size(), 2u);
    EXPECT_EQ(all.relations[0].kind, RelationKind::NotDuplicate);
    EXPECT_EQ(all.relations[0].distance, 3u);
}

TEST_F(ReconcilerTest, CandidateKindNeverReachesStorage) {
    Reconciler reconciler(store);
    auto result = reconciler.reconcile({candidate(4, 5, 1, RelationKind::SameSet)}, false);

    ASSERT_EQ(result.relations.size(), 1u);
    EXPECT_EQ(result.relations[0].kind, RelationKind::NewMatch);
    EXPECT_EQ(store.get_kind(PairKey::make(4, 5)), RelationKind::NewMatch);
}

TEST_F(ReconcilerTest, RepeatedRunsAreIdempotent) {
    Reconciler reconciler(store);
    std::vector<Candidate> candidates{candidate(1, 2, 3), candidate(2, 5, 2), candidate(1, 6, 4)};

    auto first = reconciler.reconcile(candidates, false);
    auto second = reconciler.reconcile(candidates, false);

    EXPECT_EQ(second.inserted, 0u);
    EXPECT_EQ(second.existing, 3u);
    ASSERT_EQ(first.relations.size(), second.relations.size());
    for (size_t i = 0; i < first.relations.size(); ++i) {
        EXPECT_EQ(first.relations[i].pair, second.relations[i].pair);
        EXPECT_EQ(first.relations[i].created_at, second.relations[i].created_at);
    }
}

TEST_F(ReconcilerTest, DuplicateCandidatesCollapse) {
    Reconciler reconciler(store);
    auto result = reconciler.reconcile({candidate(1, 2, 3), candidate(2, 1, 3), candidate(1, 2, 3)}, false);
    EXPECT_EQ(result.relations.size(), 1u);
    EXPECT_EQ(result.inserted, 1u);
}

TEST_F(ReconcilerTest, ChunksCoverEveryCandidate) {
    Reconciler reconciler(store, 2);
    std::vector<Candidate> candidates;
    for (ItemId a = 1; a <= 6; ++a) {
        for (ItemId b = a + 1; b <= 6; ++b) candidates.push_back(candidate(b, a, 1));
    }

    auto result = reconciler.reconcile(candidates, false);
    EXPECT_EQ(result.relations.size(), 15u);
    EXPECT_EQ(store.reads, 8);
    for (size_t i = 1; i < result.relations.size(); ++i) {
        EXPECT_LT(result.relations[i - 1].pair, result.relations[i].pair);
    }
}

TEST_F(ReconcilerTest, MissingRowOnReadIsWarned) {
    store.drop = PairKey::make(1, 3);
    Reconciler reconciler(store);
    auto result = reconciler.reconcile({candidate(1, 2, 3), candidate(1, 3, 2)}, false);

    ASSERT_EQ(result.relations.size(), 1u);
    EXPECT_EQ(result.relations[0].pair, PairKey::make(1, 2));
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].pair, PairKey::make(1, 3));
    EXPECT_EQ(result.warnings[0].kind, ErrorKind::NotFound);
    EXPECT_FALSE(result.complete());
}

TEST_F(ReconcilerTest, FailedReadExcludesEveryPair) {
    store.fail_reads = true;
    Reconciler reconciler(store);
    auto result = reconciler.reconcile({candidate(1, 2, 3), candidate(3, 4, 1)}, true);

    EXPECT_TRUE(result.relations.empty());
    ASSERT_EQ(result.warnings.size(), 2u);
    EXPECT_EQ(result.warnings[0].kind, ErrorKind::TransientStorageError);
    // The writes themselves went through
    EXPECT_EQ(store.relation_count(), 2u);
}

TEST_F(ReconcilerTest, DeletedEndpointIsRejected) {
    store.delete_item(6);
    Reconciler reconciler(store);
    auto result = reconciler.reconcile({candidate(1, 6, 2), candidate(1, 2, 3)}, false);

    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ErrorKind::ConstraintViolation);
    ASSERT_EQ(result.relations.size(), 1u);
    EXPECT_EQ(result.relations[0].pair, PairKey::make(1, 2));
    EXPECT_EQ(store.sweep_orphans(), 0u);
}

TEST_F(ReconcilerTest, ZeroBatchSizeIsRejected) {
    EXPECT_THROW(Reconciler(store, 0), std::invalid_argument);
}

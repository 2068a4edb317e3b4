#include <gtest/gtest.h>
#include "fire_structures.h"
#include "fire_ledger.h"
#include "errors.h"

using namespace cortexlib;

class FireCandidateListTest : public ::testing::Test {
protected:
    void SetUp() override {
        fcl.reserve_ids(32);
    }

    FireCandidateList fcl{4};
};

TEST_F(FireCandidateListTest, Accumulate_SumsRepeatedContributions) {
    fcl.accumulate(5, 0.5f);
    fcl.accumulate(5, 0.25f);
    fcl.accumulate(6, -1.0f);

    EXPECT_EQ(fcl.size(), 2u);
    EXPECT_FLOAT_EQ(fcl.get(5), 0.75f);
    EXPECT_FLOAT_EQ(fcl.get(6), -1.0f);
    EXPECT_FLOAT_EQ(fcl.get(7), 0.0f);
    EXPECT_FALSE(fcl.contains(7));
}

TEST_F(FireCandidateListTest, Accumulate_RoutesByIdModuloShards) {
    fcl.accumulate(1, 1.0f);
    fcl.accumulate(5, 1.0f);
    fcl.accumulate(2, 1.0f);

    EXPECT_EQ(fcl.shard_candidates(1), (std::vector<NeuronId>{1, 5}));
    EXPECT_EQ(fcl.shard_candidates(2), (std::vector<NeuronId>{2}));
    EXPECT_TRUE(fcl.shard_candidates(0).empty());
}

TEST_F(FireCandidateListTest, Accumulate_BeyondReservedThrows) {
    EXPECT_THROW(fcl.accumulate(32, 1.0f), std::out_of_range);
}

TEST_F(FireCandidateListTest, IdLimit_PreallocatesAndCapsReservation) {
    FireCandidateList bounded(2, 8);
    EXPECT_EQ(bounded.id_limit(), 8u);
    const NeuronId* even_slots = bounded.shard_candidates(0).data();

    EXPECT_NO_THROW(bounded.reserve_ids(8));
    EXPECT_THROW(bounded.reserve_ids(9), StorageExhausted);
    for (NeuronId id = 0; id < 8; ++id) {
        bounded.accumulate(id, 1.0f);
    }
    EXPECT_EQ(bounded.size(), 8u);
    EXPECT_EQ(bounded.shard_candidates(0).data(), even_slots);
    EXPECT_THROW(bounded.accumulate(8, 1.0f), std::out_of_range);
}

TEST_F(FireCandidateListTest, Clear_LeavesNoCandidates) {
    fcl.accumulate(3, 2.0f);
    fcl.accumulate(9, 2.0f);
    fcl.clear();

    EXPECT_TRUE(fcl.empty());
    EXPECT_FALSE(fcl.contains(3));
    EXPECT_FLOAT_EQ(fcl.get(9), 0.0f);

    fcl.accumulate(3, 0.5f);
    EXPECT_FLOAT_EQ(fcl.get(3), 0.5f);
}

TEST_F(FireCandidateListTest, SortedEntries_AscendingById) {
    fcl.accumulate(10, 1.0f);
    fcl.accumulate(3, 2.0f);
    fcl.accumulate(7, 3.0f);

    auto entries = fcl.sorted_entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, 3u);
    EXPECT_EQ(entries[1].first, 7u);
    EXPECT_EQ(entries[2].first, 10u);
}

TEST_F(FireCandidateListTest, Reshard_RequiresEmptyList) {
    fcl.accumulate(1, 1.0f);
    EXPECT_THROW(fcl.set_shard_count(2), std::logic_error);
    fcl.clear();
    fcl.set_shard_count(2);
    EXPECT_EQ(fcl.shard_count(), 2u);
    EXPECT_THROW(fcl.set_shard_count(0), std::invalid_argument);
}

TEST(FireQueueTest, Finalize_SortsById) {
    FireQueue queue;
    queue.reset(4);
    queue.append({FiredNeuron(9, 0, 1.0f, Position()), FiredNeuron(2, 0, 1.5f, Position(1, 0, 0))});
    queue.append({FiredNeuron(5, 1, 2.0f, Position())});
    queue.finalize();

    EXPECT_EQ(queue.burst(), 4u);
    EXPECT_EQ(queue.ids(), (std::vector<NeuronId>{2, 5, 9}));
    ASSERT_NE(queue.find(2), nullptr);
    EXPECT_FLOAT_EQ(queue.find(2)->membrane_potential, 1.5f);
    EXPECT_FALSE(queue.contains(3));

    EXPECT_EQ(queue.erase({5, 11}), 1u);
    EXPECT_EQ(queue.ids(), (std::vector<NeuronId>{2, 9}));

    queue.reset(5);
    EXPECT_TRUE(queue.empty());
}

class FireLedgerTest : public ::testing::Test {
protected:
    FireLedger ledger{4};
};

TEST_F(FireLedgerTest, Record_EvictsOldestBeyondCapacity) {
    for (uint64_t burst = 0; burst < 9; ++burst) {
        ledger.record(burst, std::vector<NeuronId>{static_cast<NeuronId>(burst)});
    }

    EXPECT_EQ(ledger.size(), 4u);
    EXPECT_EQ(ledger.oldest_burst(), 5u);
    EXPECT_EQ(ledger.latest_burst(), 8u);
    EXPECT_EQ(ledger.find(4), nullptr);
    EXPECT_TRUE(ledger.fired_at(6, 6));
    EXPECT_FALSE(ledger.fired_at(6, 5));
}

TEST_F(FireLedgerTest, Record_RejectsNonIncreasingBurst) {
    ledger.record(3, std::vector<NeuronId>{1});
    EXPECT_THROW(ledger.record(3, std::vector<NeuronId>{2}), std::invalid_argument);
    EXPECT_THROW(ledger.record(1, std::vector<NeuronId>{2}), std::invalid_argument);
    EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(FireLedgerTest, Record_SortsAndDeduplicates) {
    ledger.record(0, std::vector<NeuronId>{7, 3, 7, 1});
    EXPECT_EQ(ledger.find(0)->ids(), (std::vector<NeuronId>{1, 3, 7}));
}

TEST_F(FireLedgerTest, Record_StoresWholeAreaBurst) {
    std::vector<NeuronId> everyone(100000);
    for (NeuronId id = 0; id < everyone.size(); ++id) {
        everyone[id] = id;
    }
    ledger.record(0, everyone);

    const LedgerEntry* entry = ledger.find(0);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->count(), everyone.size());
    EXPECT_TRUE(entry->contains(99999));
    EXPECT_FALSE(entry->contains(100000));
    EXPECT_EQ(ledger.fire_counts(0, 0).size(), everyone.size());
}

TEST_F(FireLedgerTest, Record_AcceptsFireQueue) {
    FireQueue queue;
    queue.reset(2);
    queue.append({FiredNeuron(8, 0, 1.0f, Position()), FiredNeuron(4, 0, 1.0f, Position())});
    queue.finalize();
    ledger.record(2, queue);

    EXPECT_EQ(ledger.find(2)->ids(), (std::vector<NeuronId>{4, 8}));
}

TEST_F(FireLedgerTest, Window_ReturnsOldestFirst) {
    ledger.record(1, std::vector<NeuronId>{1});
    ledger.record(2, std::vector<NeuronId>{2});
    ledger.record(5, std::vector<NeuronId>{5});

    auto window = ledger.window(2);
    ASSERT_EQ(window.size(), 2u);
    EXPECT_EQ(window[0].burst, 2u);
    EXPECT_EQ(window[1].burst, 5u);
    EXPECT_EQ(ledger.window(10).size(), 3u);
}

TEST_F(FireLedgerTest, Queries_RespectInclusiveRange) {
    ledger.record(1, std::vector<NeuronId>{1, 2});
    ledger.record(2, std::vector<NeuronId>{2});
    ledger.record(3, std::vector<NeuronId>{1, 3});

    auto latest = ledger.latest_fires(1, 2);
    EXPECT_EQ(latest.at(1), 1u);
    EXPECT_EQ(latest.at(2), 2u);
    EXPECT_EQ(latest.count(3), 0u);

    auto counts = ledger.fire_counts(1, 3);
    EXPECT_EQ(counts.at(1), 2u);
    EXPECT_EQ(counts.at(2), 2u);
    EXPECT_EQ(counts.at(3), 1u);
}

TEST_F(FireLedgerTest, Empty_BoundsThrow) {
    EXPECT_TRUE(ledger.empty());
    EXPECT_THROW(ledger.latest_burst(), std::out_of_range);
    EXPECT_THROW(FireLedger(0), std::invalid_argument);
}

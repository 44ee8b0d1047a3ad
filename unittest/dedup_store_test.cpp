// ============================================================================
// DEDUP STORE TEST SUITE
// ============================================================================
// Tests for the persisted set of delivered identities
// - Load / persist round trip and legacy migration
// - High-water mark tracking
// - Pending identities vs confirmed deliveries
// - Persist-time and in-memory compaction
// ============================================================================

#include <gtest/gtest.h>
#include <printrelay/core/storage/dedup_store.hpp>
#include <printrelay/core/events/event_identity.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace PrintRelay;
using json = nlohmann::json;

// ============================================================================
// TEST CLASS
// ============================================================================
class DedupStoreTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    std::string statePath;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("printrelay_dedup_") + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        statePath = (dir / "processed_events.json").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(statePath, std::ios::trunc);
        out << content;
    }

    json readFile() {
        std::ifstream in(statePath);
        return json::parse(in);
    }
};

// ============================================================================
// LOAD TESTS
// ============================================================================

TEST_F(DedupStoreTest, MissingFileStartsEmpty) {
    DedupStore store(statePath, "PC1");
    auto summary = store.load();

    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.highestSequence(), 0u);
}

TEST_F(DedupStoreTest, CorruptFileStartsEmpty) {
    writeFile("{ this is not json");

    DedupStore store(statePath, "PC1");
    auto summary = store.load();

    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(DedupStoreTest, LegacyIntegerIdsAreMigrated) {
    writeFile(R"({"processed_ids": [10, "11", "PC2_5", "PC1_12"]})");

    DedupStore store(statePath, "PC1");
    auto summary = store.load();

    EXPECT_EQ(summary.total, 4u);
    EXPECT_EQ(summary.migrated, 2u);
    EXPECT_EQ(summary.local, 3u);
    EXPECT_EQ(summary.highest_sequence, 12u);
    EXPECT_TRUE(store.contains("PC1_10"));
    EXPECT_TRUE(store.contains("PC1_11"));
    EXPECT_TRUE(store.contains("PC2_5"));
    EXPECT_FALSE(store.contains("10"));
}

TEST_F(DedupStoreTest, HighWaterMarkIgnoresOtherHosts) {
    writeFile(R"({"processed_ids": ["PC2_900", "PC1_40"]})");

    DedupStore store(statePath, "PC1");
    store.load();

    EXPECT_EQ(store.highestSequence(), 40u);
}

// ============================================================================
// PERSIST TESTS
// ============================================================================

TEST_F(DedupStoreTest, PersistAndReloadRoundTrip) {
    {
        DedupStore store(statePath, "PC1");
        store.load();
        store.markDelivered("PC1_1");
        store.markDelivered("PC1_2");
        store.markDelivered("PC2_7");
        ASSERT_TRUE(store.persist());
        EXPECT_FALSE(store.lastUpdate().empty());
    }

    DedupStore reloaded(statePath, "PC1");
    auto summary = reloaded.load();
    EXPECT_EQ(summary.total, 3u);
    EXPECT_EQ(reloaded.highestSequence(), 2u);
    EXPECT_TRUE(reloaded.contains("PC2_7"));
    EXPECT_FALSE(std::filesystem::exists(statePath + ".tmp"));
}

TEST_F(DedupStoreTest, PersistedFileHasExpectedFields) {
    DedupStore store(statePath, "PC1");
    store.markDelivered("PC1_3");
    store.markDelivered("PC2_8");
    ASSERT_TRUE(store.persist());

    json data = readFile();
    ASSERT_TRUE(data["processed_ids"].is_array());
    EXPECT_EQ(data["processed_ids"].size(), 2u);
    EXPECT_EQ(data["highest_id_this_machine"].get<uint64_t>(), 3u);
    EXPECT_EQ(data["total_processed"].get<size_t>(), 2u);
    EXPECT_EQ(data["stats_by_machine"]["PC1"].get<size_t>(), 1u);
    EXPECT_EQ(data["stats_by_machine"]["PC2"].get<size_t>(), 1u);
    EXPECT_TRUE(data["last_update"].is_string());
}

TEST_F(DedupStoreTest, PersistFailsForUnwritablePath) {
    DedupStore store((dir / "missing_dir" / "state.json").string(), "PC1");
    store.markDelivered("PC1_1");

    EXPECT_FALSE(store.persist());
    EXPECT_TRUE(store.contains("PC1_1"));
}

TEST_F(DedupStoreTest, PendingIdentitiesAreNotPersisted) {
    DedupStore store(statePath, "PC1");
    store.markPending("PC1_50");
    ASSERT_TRUE(store.persist());

    json data = readFile();
    EXPECT_TRUE(data["processed_ids"].empty());
    EXPECT_TRUE(store.isPending("PC1_50"));
}

// ============================================================================
// PENDING / DELIVERED TESTS
// ============================================================================

TEST_F(DedupStoreTest, MarkDeliveredClearsPending) {
    DedupStore store(statePath, "PC1");
    store.markPending("PC1_5");
    EXPECT_TRUE(store.isKnown("PC1_5"));
    EXPECT_FALSE(store.contains("PC1_5"));

    store.markDelivered("PC1_5");
    EXPECT_TRUE(store.contains("PC1_5"));
    EXPECT_FALSE(store.isPending("PC1_5"));
    EXPECT_EQ(store.highestSequence(), 5u);
}

TEST_F(DedupStoreTest, HighWaterMarkNeverDecreases) {
    DedupStore store(statePath, "PC1");
    store.markDelivered("PC1_20");
    store.markDelivered("PC1_10");

    EXPECT_EQ(store.highestSequence(), 20u);
}

TEST_F(DedupStoreTest, ForgetPendingLeavesDeliveredUntouched) {
    DedupStore store(statePath, "PC1");
    store.markPending("PC1_3");
    store.markDelivered("PC1_2");

    store.forgetPending("PC1_3");
    EXPECT_FALSE(store.isKnown("PC1_3"));
    EXPECT_EQ(store.pendingCount(), 0u);
    EXPECT_EQ(store.highestSequence(), 2u);
}

// ============================================================================
// COMPACTION TESTS
// ============================================================================

TEST_F(DedupStoreTest, PersistCompactionKeepsNewestPerHost) {
    DedupStore store(statePath, "H1");
    for (uint64_t seq = 1; seq <= 20000; ++seq) {
        store.markDelivered(makeIdentity("H1", seq));
        store.markDelivered(makeIdentity("H2", seq));
        store.markDelivered(makeIdentity("H3", seq));
    }
    ASSERT_EQ(store.size(), 60000u);

    ASSERT_TRUE(store.persist());

    auto stats = store.statsByHost();
    EXPECT_EQ(store.size(), 30000u);
    EXPECT_EQ(stats["H1"], 10000u);
    EXPECT_EQ(stats["H2"], 10000u);
    EXPECT_EQ(stats["H3"], 10000u);
    EXPECT_TRUE(store.contains("H2_20000"));
    EXPECT_TRUE(store.contains("H2_10001"));
    EXPECT_FALSE(store.contains("H2_10000"));
    EXPECT_EQ(store.highestSequence(), 20000u);

    DedupStore reloaded(statePath, "H1");
    EXPECT_EQ(reloaded.load().total, 30000u);
}

TEST_F(DedupStoreTest, PersistCompactionSkippedBelowThreshold) {
    DedupStore store(statePath, "H1");
    for (uint64_t seq = 1; seq <= 100; ++seq) {
        store.markDelivered(makeIdentity("H1", seq));
    }

    EXPECT_EQ(store.compactForPersist(), 0u);
    EXPECT_EQ(store.size(), 100u);
}

TEST_F(DedupStoreTest, MemoryCompactionDropsOldLocalIdentities) {
    DedupStore store(statePath, "PC1");
    for (uint64_t seq = 1; seq <= 12000; ++seq) {
        store.markDelivered(makeIdentity("PC1", seq));
    }
    store.markDelivered("PC9_1");
    ASSERT_TRUE(store.needsMemoryCompaction());

    size_t removed = store.compactInMemory();

    // floor = 12000 - 5000 = 7000, sequences 1..6999 dropped
    EXPECT_EQ(removed, 6999u);
    EXPECT_FALSE(store.contains("PC1_6999"));
    EXPECT_TRUE(store.contains("PC1_7000"));
    EXPECT_TRUE(store.contains("PC1_12000"));
    EXPECT_TRUE(store.contains("PC9_1"));
    EXPECT_EQ(store.highestSequence(), 12000u);
}

TEST_F(DedupStoreTest, MemoryCompactionNeverTouchesPending) {
    DedupStore store(statePath, "PC1");
    for (uint64_t seq = 1; seq <= 12000; ++seq) {
        store.markDelivered(makeIdentity("PC1", seq));
    }
    store.markPending("PC1_12001");

    store.compactInMemory();

    EXPECT_TRUE(store.isPending("PC1_12001"));
    EXPECT_EQ(store.pendingCount(), 1u);
}

TEST_F(DedupStoreTest, ForeignIdentitiesDoNotTriggerMemoryCompaction) {
    DedupStore store(statePath, "PC1");
    for (uint64_t seq = 1; seq <= 12000; ++seq) {
        store.markDelivered(makeIdentity("PC2", seq));
    }
    store.markDelivered("PC1_1");

    EXPECT_FALSE(store.needsMemoryCompaction());
    EXPECT_EQ(store.compactInMemory(), 0u);
    EXPECT_EQ(store.size(), 12001u);
}

TEST_F(DedupStoreTest, LocalCountSurvivesReload) {
    {
        DedupStore store(statePath, "PC1");
        for (uint64_t seq = 1; seq <= 10001; ++seq) {
            store.markDelivered(makeIdentity("PC1", seq));
        }
        ASSERT_TRUE(store.persist());
    }

    DedupStore reloaded(statePath, "PC1");
    reloaded.load();
    EXPECT_TRUE(reloaded.needsMemoryCompaction());
    EXPECT_EQ(reloaded.compactInMemory(), 5000u);
    EXPECT_FALSE(reloaded.needsMemoryCompaction());
}

TEST_F(DedupStoreTest, MemoryCompactionSkippedBelowThreshold) {
    DedupStore store(statePath, "PC1");
    for (uint64_t seq = 1; seq <= 100; ++seq) {
        store.markDelivered(makeIdentity("PC1", seq));
    }

    EXPECT_FALSE(store.needsMemoryCompaction());
    EXPECT_EQ(store.compactInMemory(), 0u);
}

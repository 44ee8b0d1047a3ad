// ============================================================================
// BATCHER & WIRE FORMAT UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <printrelay/core/delivery/batcher.hpp>
#include <printrelay/core/delivery/wire_format.hpp>
#include <nlohmann/json.hpp>

using namespace PrintRelay;

// ============================================================================
// CHUNKING
// ============================================================================

TEST(Batcher, SplitsIntoFixedSizeChunks) {
    std::vector<int> records(120);
    for (int i = 0; i < 120; ++i) records[i] = i;

    auto batches = chunk(records, 50);
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].size(), 50u);
    EXPECT_EQ(batches[1].size(), 50u);
    EXPECT_EQ(batches[2].size(), 20u);
    EXPECT_EQ(batches[0].front(), 0);
    EXPECT_EQ(batches[1].front(), 50);
    EXPECT_EQ(batches[2].back(), 119);
}

TEST(Batcher, ExactMultipleHasNoShortChunk) {
    std::vector<int> records(100, 1);
    auto batches = chunk(records, 50);
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[1].size(), 50u);
}

TEST(Batcher, EmptyInputGivesNoChunks) {
    EXPECT_TRUE(chunk(std::vector<int>{}, 50).empty());
}

TEST(Batcher, ZeroSizeThrows) {
    EXPECT_THROW(chunk(std::vector<int>{1, 2}, 0), std::invalid_argument);
}

// ============================================================================
// WIRE FORMAT
// ============================================================================

TEST(WireFormat, EncodesCollectorFieldsOnly) {
    Batch batch;
    batch.emplace_back("PC1_42", 42, "2024-05-01 10:00:00", "alice", "PC1",
                       "HP-LaserJet", "report.docx", 7);

    auto body = nlohmann::json::parse(encodeBatch(batch));
    ASSERT_TRUE(body["events"].is_array());
    ASSERT_EQ(body["events"].size(), 1u);

    const auto& event = body["events"][0];
    EXPECT_EQ(event["date"], "2024-05-01 10:00:00");
    EXPECT_EQ(event["user"], "alice");
    EXPECT_EQ(event["machine"], "PC1");
    EXPECT_EQ(event["pages"], 7);
    EXPECT_EQ(event["document"], "report.docx");
    EXPECT_EQ(event["printer"], "HP-LaserJet");
    EXPECT_FALSE(event.contains("identity"));
    EXPECT_EQ(event.size(), 6u);
}

TEST(WireFormat, InvalidUtf8IsReplacedNotThrown) {
    Batch batch;
    batch.emplace_back("PC1_1", 1, "2024-05-01 10:00:00", "bob", "PC1",
                       "P", std::string("rel\xE9torio.pdf"), 1);

    EXPECT_NO_THROW(encodeBatch(batch));
}

TEST(WireFormat, DecodesReplyMessage) {
    EXPECT_EQ(decodeReplyMessage(R"({"message":"3 events saved"})"), "3 events saved");
    EXPECT_FALSE(decodeReplyMessage("OK").has_value());
    EXPECT_FALSE(decodeReplyMessage(R"({"status":1})").has_value());
}

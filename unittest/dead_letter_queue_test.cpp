// ============================================================================
// DEAD LETTER QUEUE UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <printrelay/core/events/dead_letter_queue.hpp>

using namespace PrintRelay;

namespace {

std::vector<CanonicalEvent> makeEvents(uint64_t first, size_t count) {
    std::vector<CanonicalEvent> events;
    for (uint64_t seq = first; seq < first + count; ++seq) {
        events.emplace_back("PC1_" + std::to_string(seq), seq, "2024-05-01 10:00:00",
                            "alice", "PC1", "P", "doc", 1);
    }
    return events;
}

} // namespace

TEST(DeadLetterQueue, CountsDroppedEvents) {
    DeadLetterQueue dlq;
    dlq.pushBatch(makeEvents(1, 3), "buffer_overflow");
    dlq.pushBatch(makeEvents(4, 2), "buffer_overflow");

    EXPECT_EQ(dlq.totalDropped(), 5u);
    EXPECT_EQ(dlq.size(), 5u);
    EXPECT_EQ(dlq.lastReason(), "buffer_overflow");
}

TEST(DeadLetterQueue, EmptyBatchIsIgnored) {
    DeadLetterQueue dlq;
    dlq.pushBatch({}, "buffer_overflow");
    EXPECT_EQ(dlq.totalDropped(), 0u);
    EXPECT_TRUE(dlq.lastReason().empty());
}

TEST(DeadLetterQueue, RecentEventsNewestFirst) {
    DeadLetterQueue dlq;
    dlq.pushBatch(makeEvents(1, 10), "buffer_overflow");

    auto recent = dlq.getRecentEvents(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].identity(), "PC1_10");
    EXPECT_EQ(recent[2].identity(), "PC1_8");
}

TEST(DeadLetterQueue, StorageIsBoundedButCountIsNot) {
    DeadLetterQueue dlq;
    dlq.pushBatch(makeEvents(1, DeadLetterQueue::MAX_STORED_EVENTS + 200), "buffer_overflow");

    EXPECT_EQ(dlq.size(), DeadLetterQueue::MAX_STORED_EVENTS);
    EXPECT_EQ(dlq.totalDropped(), DeadLetterQueue::MAX_STORED_EVENTS + 200);

    dlq.clear();
    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_EQ(dlq.totalDropped(), DeadLetterQueue::MAX_STORED_EVENTS + 200);
}

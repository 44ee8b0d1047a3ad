// ============================================================================
// DEDUP STORE
// ============================================================================
// Persisted set of identities already delivered to the collector, plus the
// local host's high-water mark.
//
// Two sets are kept apart:
// - delivered_: confirmed deliveries, written by persist(), subject to compaction
// - pending_:   buffered but unconfirmed, never compacted
//
// State file (JSON):
//   processed_ids, last_update, highest_id_this_machine,
//   total_processed, stats_by_machine
// Legacy files listing bare integer ids are migrated on load.
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_set>

namespace PrintRelay {

class DedupStore {
public:
    static constexpr size_t PERSIST_COMPACT_THRESHOLD = 50000;
    static constexpr size_t PERSIST_KEEP_PER_HOST = 10000;
    static constexpr size_t MEMORY_COMPACT_THRESHOLD = 10000;
    static constexpr uint64_t MEMORY_KEEP_WINDOW = 5000;

    struct LoadSummary {
        size_t total = 0;              // identities loaded, all hosts
        size_t local = 0;              // identities belonging to local host
        size_t migrated = 0;           // legacy bare-integer entries rewritten
        uint64_t highest_sequence = 0; // recomputed local high-water mark
    };

    DedupStore(std::string path, std::string local_host);

    /**
     * @brief Replace in-memory state with the file contents.
     * A missing or unreadable file yields an empty store.
     */
    LoadSummary load();

    bool contains(const std::string& identity) const {
        return delivered_.count(identity) != 0;
    }
    bool isPending(const std::string& identity) const {
        return pending_.count(identity) != 0;
    }
    bool isKnown(const std::string& identity) const {
        return contains(identity) || isPending(identity);
    }

    void markPending(const std::string& identity);

    // Pending identity abandoned without delivery
    void forgetPending(const std::string& identity);

    /**
     * @brief Record a confirmed delivery in memory (does not persist).
     * Clears the pending entry and advances the local high-water mark.
     */
    void markDelivered(const std::string& identity);

    /**
     * @brief Atomically write the delivered set (temp file + rename).
     * Applies compactForPersist() first.
     * @return false if the write failed; in-memory state is unchanged
     */
    bool persist();

    /**
     * @brief Above PERSIST_COMPACT_THRESHOLD, keep the PERSIST_KEEP_PER_HOST
     * highest sequences of every host.
     * @return number of identities removed
     */
    size_t compactForPersist();

    // Only local identities count: compactInMemory() never removes others
    bool needsMemoryCompaction() const {
        return local_count_ > MEMORY_COMPACT_THRESHOLD;
    }

    /**
     * @brief Above MEMORY_COMPACT_THRESHOLD, drop local identities more than
     * MEMORY_KEEP_WINDOW below the high-water mark.
     * @return number of identities removed
     */
    size_t compactInMemory();

    uint64_t highestSequence() const { return highest_sequence_; }
    size_t size() const { return delivered_.size(); }
    size_t pendingCount() const { return pending_.size(); }
    std::map<std::string, size_t> statsByHost() const;
    const std::string& lastUpdate() const { return last_update_; }

private:
    bool isLocal(const std::string& identity, uint64_t& sequence) const;
    size_t countLocal() const;

    std::string path_;
    std::string local_host_;
    std::unordered_set<std::string> delivered_;
    std::unordered_set<std::string> pending_;
    uint64_t highest_sequence_ = 0;
    size_t local_count_ = 0;
    std::string last_update_;
};

} // namespace PrintRelay

#include <printrelay/core/storage/dedup_store.hpp>
#include <printrelay/core/events/event_identity.hpp>
#include <printrelay/core/utils/clock.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

namespace PrintRelay {

using json = nlohmann::json;

DedupStore::DedupStore(std::string path, std::string local_host)
    : path_(std::move(path)), local_host_(std::move(local_host)) {}

bool DedupStore::isLocal(const std::string& identity, uint64_t& sequence) const {
    auto parts = parseIdentity(identity, local_host_);
    if (!parts || parts->host != local_host_) {
        return false;
    }
    sequence = parts->sequence;
    return true;
}

size_t DedupStore::countLocal() const {
    size_t count = 0;
    uint64_t seq = 0;
    for (const auto& id : delivered_) {
        if (isLocal(id, seq)) {
            ++count;
        }
    }
    return count;
}

DedupStore::LoadSummary DedupStore::load() {
    delivered_.clear();
    highest_sequence_ = 0;
    local_count_ = 0;
    last_update_.clear();

    LoadSummary summary;
    if (!std::filesystem::exists(path_)) {
        spdlog::info("[DedupStore] No state file at {}, starting empty", path_);
        return summary;
    }

    try {
        std::ifstream in(path_);
        if (!in.is_open()) {
            spdlog::error("[DedupStore] Failed to open state file {}", path_);
            return summary;
        }
        json data = json::parse(in);

        if (data.contains("last_update") && data["last_update"].is_string()) {
            last_update_ = data["last_update"].get<std::string>();
        }

        const json ids = data.value("processed_ids", json::array());
        for (const auto& entry : ids) {
            if (entry.is_number_unsigned()) {
                // Pre-composite format: bare record ids of this machine
                delivered_.insert(makeIdentity(local_host_, entry.get<uint64_t>()));
                summary.migrated++;
            } else if (entry.is_string()) {
                const auto text = entry.get<std::string>();
                auto parts = parseIdentity(text, local_host_);
                if (parts && parts->legacy) {
                    delivered_.insert(makeIdentity(parts->host, parts->sequence));
                    summary.migrated++;
                } else {
                    delivered_.insert(text);
                }
            } else {
                spdlog::warn("[DedupStore] Skipping unsupported id entry: {}", entry.dump());
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("[DedupStore] Failed to load {}: {}", path_, e.what());
        delivered_.clear();
        last_update_.clear();
        return LoadSummary{};
    }

    for (const auto& id : delivered_) {
        uint64_t seq = 0;
        if (isLocal(id, seq)) {
            summary.local++;
            highest_sequence_ = std::max(highest_sequence_, seq);
        }
    }
    summary.total = delivered_.size();
    summary.highest_sequence = highest_sequence_;
    local_count_ = summary.local;

    spdlog::info("[DedupStore] Loaded {} identities ({} local, {} migrated), high-water mark {}",
                 summary.total, summary.local, summary.migrated, highest_sequence_);
    return summary;
}

void DedupStore::markPending(const std::string& identity) {
    pending_.insert(identity);
}

void DedupStore::forgetPending(const std::string& identity) {
    pending_.erase(identity);
}

void DedupStore::markDelivered(const std::string& identity) {
    const bool inserted = delivered_.insert(identity).second;
    pending_.erase(identity);

    uint64_t seq = 0;
    if (!isLocal(identity, seq)) {
        return;
    }
    if (inserted) {
        ++local_count_;
    }
    if (seq > highest_sequence_) {
        highest_sequence_ = seq;
    }
}

size_t DedupStore::compactForPersist() {
    if (delivered_.size() <= PERSIST_COMPACT_THRESHOLD) {
        return 0;
    }

    std::map<std::string, std::vector<std::pair<uint64_t, std::string>>> by_host;
    for (const auto& id : delivered_) {
        auto parts = parseIdentity(id, local_host_);
        if (parts) {
            by_host[parts->host].emplace_back(parts->sequence, id);
        }
    }

    std::unordered_set<std::string> kept;
    for (auto& [host, entries] : by_host) {
        std::sort(entries.begin(), entries.end());
        size_t start = entries.size() > PERSIST_KEEP_PER_HOST
            ? entries.size() - PERSIST_KEEP_PER_HOST
            : 0;
        for (size_t i = start; i < entries.size(); ++i) {
            kept.insert(std::move(entries[i].second));
        }
    }

    size_t removed = delivered_.size() - kept.size();
    delivered_ = std::move(kept);
    local_count_ = countLocal();
    spdlog::info("[DedupStore] State compacted: removed {}, kept {} identities across {} hosts",
                 removed, delivered_.size(), by_host.size());
    return removed;
}

size_t DedupStore::compactInMemory() {
    if (!needsMemoryCompaction()) {
        return 0;
    }

    // Identities carry the host as a prefix; compare the numeric sequence part
    const uint64_t floor = highest_sequence_ > MEMORY_KEEP_WINDOW
        ? highest_sequence_ - MEMORY_KEEP_WINDOW
        : 0;

    size_t removed = 0;
    for (auto it = delivered_.begin(); it != delivered_.end();) {
        uint64_t seq = 0;
        if (isLocal(*it, seq) && seq < floor) {
            it = delivered_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    local_count_ -= removed;
    if (removed > 0) {
        spdlog::info("[DedupStore] In-memory compaction removed {} identities below {}, {} remain",
                     removed, floor, delivered_.size());
    } else {
        spdlog::debug("[DedupStore] In-memory compaction found nothing below {}", floor);
    }
    return removed;
}

std::map<std::string, size_t> DedupStore::statsByHost() const {
    std::map<std::string, size_t> stats;
    for (const auto& id : delivered_) {
        auto parts = parseIdentity(id, local_host_);
        if (parts) {
            stats[parts->host]++;
        }
    }
    return stats;
}

bool DedupStore::persist() {
    compactForPersist();

    std::vector<std::string> ids(delivered_.begin(), delivered_.end());
    std::sort(ids.begin(), ids.end());

    const std::string now = Clock::localTimestamp("%Y-%m-%dT%H:%M:%S");

    json data;
    data["processed_ids"] = ids;
    data["last_update"] = now;
    data["highest_id_this_machine"] = highest_sequence_;
    data["total_processed"] = delivered_.size();
    data["stats_by_machine"] = statsByHost();

    const std::string tmp_path = path_ + ".tmp";
    try {
        {
            std::ofstream out(tmp_path, std::ios::trunc);
            if (!out.is_open()) {
                spdlog::error("[DedupStore] Failed to open {} for writing", tmp_path);
                return false;
            }
            out << data.dump(2, ' ', false, json::error_handler_t::replace);
            out.flush();
            if (!out.good()) {
                spdlog::error("[DedupStore] Failed to write state to {}", tmp_path);
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path_, ec);
        if (ec) {
            spdlog::error("[DedupStore] Failed to replace {}: {}", path_, ec.message());
            std::filesystem::remove(tmp_path, ec);
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("[DedupStore] Failed to persist state: {}", e.what());
        return false;
    }

    last_update_ = now;
    spdlog::debug("[DedupStore] Saved {} identities to {}", delivered_.size(), path_);
    return true;
}

} // namespace PrintRelay

#pragma once

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "log_entry.hpp"
#include "top_ranker.hpp"

// Frequency maps for one key kind (hosts, clients or reasons), sharded to reduce contention.
class ShardedCounts {
    size_t shard_count;
    mutable std::vector<std::shared_mutex> shard_mus;
    std::vector<FrequencyMap> shards;
public:
    explicit ShardedCounts(size_t shards_count);

    void add(const std::string &key, uint64_t n = 1);
    FrequencyMap snapshot() const noexcept;   // merged
    void clear();
    size_t shards_in_use() const noexcept { return shard_count; }
};

class QueryCounter {
    std::atomic<uint64_t> total_entries{0}, decode_errors{0};

    ShardedCounts hosts;
    ShardedCounts clients;
    ShardedCounts reasons;

public:
    explicit QueryCounter(size_t shards_count = 16);

    // extract host/client/reason from a decoded entry; empty fields are skipped
    void add_entry(const LogValue &entry);
    void add_decode_error();

    uint64_t get_total() const noexcept;
    uint64_t get_errors() const noexcept;

    FrequencyMap snapshot_hosts() const noexcept;
    FrequencyMap snapshot_clients() const noexcept;
    FrequencyMap snapshot_reasons() const noexcept;

    RankedMap top_hosts(int n) const;
    RankedMap top_clients(int n) const;
    RankedMap top_reasons(int n) const;

    void reset();
};

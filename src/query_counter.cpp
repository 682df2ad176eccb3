#include "query_counter.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <functional>
#include <mutex>

static const size_t MAX_SHARDS = 256;
static const size_t WARN_MERGED_ENTRIES = 100'000;

static inline size_t shard_index_for_key(const std::string &key, size_t shard_count) {
    return (shard_count == 0) ? 0 : (std::hash<std::string>{}(key) % shard_count);
}

ShardedCounts::ShardedCounts(size_t shards_count)
    : shard_count(shards_count ? std::min(shards_count, MAX_SHARDS) : 1),
      shard_mus(shard_count),
      shards(shard_count)
{
}

void ShardedCounts::add(const std::string &key, uint64_t n) {
    size_t idx = shard_index_for_key(key, shard_count);
    std::unique_lock<std::shared_mutex> lk(shard_mus[idx]);
    shards[idx][key] += n;
}

FrequencyMap ShardedCounts::snapshot() const noexcept {
    FrequencyMap merged;
    try {
        size_t total_entries = 0;
        for (size_t s = 0; s < shard_count; ++s) {
            std::shared_lock<std::shared_mutex> lk(shard_mus[s]);
            for (const auto &p : shards[s]) {
                merged[p.first] += p.second;
                ++total_entries;
            }
        }
        if (total_entries > WARN_MERGED_ENTRIES) {
            safe_log(std::string("ShardedCounts::snapshot: merged total entries=") + std::to_string(total_entries));
        }
    } catch (const std::exception &e) {
        safe_log(std::string("ShardedCounts::snapshot: exception: ") + e.what());
    }
    return merged;
}

void ShardedCounts::clear() {
    for (size_t s = 0; s < shard_count; ++s) {
        std::unique_lock<std::shared_mutex> lk(shard_mus[s]);
        shards[s].clear();
    }
}

QueryCounter::QueryCounter(size_t shards_count)
    : hosts(shards_count), clients(shards_count), reasons(shards_count)
{
    safe_log(std::string("QueryCounter ctor: shards_req=") + std::to_string(shards_count)
             + " shards=" + std::to_string(hosts.shards_in_use()));
}

void QueryCounter::add_entry(const LogValue &entry) {
    total_entries.fetch_add(1, std::memory_order_relaxed);

    std::string host = get_host(entry);
    if (!host.empty()) hosts.add(host);

    std::string client = get_client(entry);
    if (!client.empty()) clients.add(client);

    std::string reason = get_reason(entry);
    if (!reason.empty()) reasons.add(reason);
}

void QueryCounter::add_decode_error() { decode_errors.fetch_add(1); }
uint64_t QueryCounter::get_total() const noexcept { return total_entries.load(); }
uint64_t QueryCounter::get_errors() const noexcept { return decode_errors.load(); }

FrequencyMap QueryCounter::snapshot_hosts() const noexcept { return hosts.snapshot(); }
FrequencyMap QueryCounter::snapshot_clients() const noexcept { return clients.snapshot(); }
FrequencyMap QueryCounter::snapshot_reasons() const noexcept { return reasons.snapshot(); }

RankedMap QueryCounter::top_hosts(int n) const { return produce_top(hosts.snapshot(), n); }
RankedMap QueryCounter::top_clients(int n) const { return produce_top(clients.snapshot(), n); }
RankedMap QueryCounter::top_reasons(int n) const { return produce_top(reasons.snapshot(), n); }

void QueryCounter::reset() {
    hosts.clear();
    clients.clear();
    reasons.clear();
    total_entries.store(0);
    decode_errors.store(0);
}

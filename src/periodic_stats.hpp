#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>

#include "log_entry.hpp"
#include "rate.hpp"

// "Since start" totals.
struct StatsSnapshot {
    double total_requests = 0;
    double filtered_lists = 0;
    double filtered_safebrowsing = 0;
    double filtered_safesearch = 0;
    double filtered_parental = 0;
    double processing_time_sum = 0;   // seconds
    double processing_time_count = 0;
};

// Read-only copy of the bucketed series. Index 0 is the current bucket;
// each slot holds the cumulative totals as of that bucket.
struct PeriodicStatsView {
    int history_elements = 0;
    Series total_requests;
    Series filtered_lists;
    Series filtered_safebrowsing;
    Series filtered_safesearch;
    Series filtered_parental;
    Series processing_time_sum;
    Series processing_time_count;
};

class PeriodicStats {
    size_t history_elements_;

    mutable std::shared_mutex mu_;
    PeriodicStatsView series_;
    StatsSnapshot totals_;

public:
    static constexpr size_t DEFAULT_HISTORY = 60;
    static constexpr size_t MIN_HISTORY = 2;
    static constexpr size_t MAX_HISTORY = 86400;

    explicit PeriodicStats(size_t history_elements = DEFAULT_HISTORY);

    // ingest one query into the current bucket and the running totals
    void record(FilterCategory category, std::optional<double> elapsed_seconds);

    // start a new bucket carrying the cumulative values forward; the oldest slot drops off
    void rotate();

    void reset();

    size_t history_elements() const noexcept { return history_elements_; }
    PeriodicStatsView view() const;
    StatsSnapshot snapshot() const;
};

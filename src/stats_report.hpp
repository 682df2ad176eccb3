#pragma once
#include <string>

#include "periodic_stats.hpp"
#include "rate.hpp"
#include "top_ranker.hpp"

struct SnapshotSummary {
    double dns_queries = 0;
    double blocked_filtering = 0;
    double replaced_safebrowsing = 0;
    double replaced_safesearch = 0;
    double replaced_parental = 0;
    double avg_processing_time = 0;
};

// Per-bucket deltas over a window; every series has the same length.
struct WindowedReport {
    Series dns_queries;
    Series blocked_filtering;
    Series replaced_safebrowsing;
    Series replaced_safesearch;
    Series replaced_parental;
    Series avg_processing_time;   // milliseconds
};

// Instantaneous totals; avg_processing_time is sum/count, 0 when count is 0.
SnapshotSummary summarize_snapshot(const StatsSnapshot &snap);

// Clamp [start, end) to the store's domain and difference every metric over it.
// Empty or inverted windows give all-empty series.
WindowedReport build_windowed_report(const PeriodicStatsView &stats, int start, int end);

std::string to_json(const SnapshotSummary &s);
std::string to_json(const WindowedReport &r);
std::string to_json(const RankedMap &top);

// tests/test_stats_report.cpp
#include <cmath>
#include <iostream>
#include <string>
#include "../src/stats_report.hpp"

static PeriodicStatsView make_view(int n) {
    PeriodicStatsView v;
    v.history_elements = n;
    for (Series *s : { &v.total_requests, &v.filtered_lists, &v.filtered_safebrowsing,
                       &v.filtered_safesearch, &v.filtered_parental,
                       &v.processing_time_sum, &v.processing_time_count }) {
        s->assign(static_cast<size_t>(n), 0.0);
    }
    return v;
}

static bool all_sizes(const WindowedReport &r, size_t n) {
    return r.dns_queries.size() == n && r.blocked_filtering.size() == n
        && r.replaced_safebrowsing.size() == n && r.replaced_safesearch.size() == n
        && r.replaced_parental.size() == n && r.avg_processing_time.size() == n;
}

int main() {
    PeriodicStatsView v = make_view(4);
    v.total_requests = {0, 5, 12, 20};

    WindowedReport r = build_windowed_report(v, 0, 4);
    if (r.dns_queries != Series{-5, -7, -8}) {
        std::cerr << "report: dns_queries expected [-5,-7,-8]\n";
        return 1;
    }
    if (!all_sizes(r, 3)) {
        std::cerr << "report: series misaligned\n";
        return 2;
    }

    // inverted and empty windows
    if (!all_sizes(build_windowed_report(v, 3, 1), 0) || !all_sizes(build_windowed_report(v, 2, 2), 0)) {
        std::cerr << "report: inverted window should give empty series\n";
        return 3;
    }
    if (!all_sizes(build_windowed_report(v, 10, -10), 0)) {
        std::cerr << "report: out-of-range inverted window should give empty series\n";
        return 4;
    }
    // one bucket -> no adjacent pair
    if (!all_sizes(build_windowed_report(v, 1, 2), 0)) {
        std::cerr << "report: single-bucket window should give empty series\n";
        return 5;
    }
    // clamped to the domain
    if (!all_sizes(build_windowed_report(v, -3, 99), 3)) {
        std::cerr << "report: clamped window length wrong\n";
        return 6;
    }

    // average latency per bucket, zero where no queries were timed
    v.processing_time_sum = {0.5, 0.5, 0.2, 0.0};
    v.processing_time_count = {30, 30, 10, 0};
    r = build_windowed_report(v, 0, 4);
    if (r.avg_processing_time.size() != 3 || r.avg_processing_time[0] != 0) {
        std::cerr << "report: zero count delta must give zero average\n";
        return 7;
    }
    if (std::fabs(r.avg_processing_time[1] - 15.0) > 1e-9 || std::fabs(r.avg_processing_time[2] - 20.0) > 1e-9) {
        std::cerr << "report: avg ms wrong: " << r.avg_processing_time[1] << " " << r.avg_processing_time[2] << "\n";
        return 8;
    }

    // snapshot
    StatsSnapshot snap;
    snap.total_requests = 100;
    snap.filtered_lists = 7;
    snap.filtered_parental = 2;
    snap.processing_time_sum = 3;
    SnapshotSummary sum = summarize_snapshot(snap);
    if (sum.avg_processing_time != 0 || sum.dns_queries != 100 || sum.blocked_filtering != 7 || sum.replaced_parental != 2) {
        std::cerr << "summary: zero count must give zero average\n";
        return 9;
    }
    snap.processing_time_count = 4;
    if (summarize_snapshot(snap).avg_processing_time != 0.75) {
        std::cerr << "summary: expected avg 0.75\n";
        return 10;
    }

    std::string js = to_json(r);
    for (const char *field : { "\"dns_queries\"", "\"blocked_filtering\"", "\"replaced_safebrowsing\"",
                               "\"replaced_safesearch\"", "\"replaced_parental\"", "\"avg_processing_time\"" }) {
        if (js.find(field) == std::string::npos || to_json(sum).find(field) == std::string::npos) {
            std::cerr << "json: missing field " << field << "\n";
            return 11;
        }
    }
    if (to_json(RankedMap{{"a\"b", 3}, {"c", 1}}) != "{\"a\\\"b\":3, \"c\":1}\n") {
        std::cerr << "json: ranked map rendering wrong\n";
        return 12;
    }

    std::cout << "test_stats_report: OK\n";
    return 0;
}

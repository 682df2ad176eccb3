#include "periodic_stats.hpp"
#include "util_log.hpp"

#include <algorithm>
#include <mutex>

static void shift_older(Series &s) {
    if (s.size() < 2) return;
    std::copy_backward(s.begin(), s.end() - 1, s.end());
}

static void fill_zero(PeriodicStatsView &v, size_t n) {
    for (Series *s : { &v.total_requests, &v.filtered_lists, &v.filtered_safebrowsing,
                       &v.filtered_safesearch, &v.filtered_parental,
                       &v.processing_time_sum, &v.processing_time_count }) {
        s->assign(n, 0.0);
    }
}

PeriodicStats::PeriodicStats(size_t history_elements) {
    size_t use = history_elements ? history_elements : DEFAULT_HISTORY;
    use = std::min(std::max(use, MIN_HISTORY), MAX_HISTORY);
    if (use != history_elements) {
        safe_log(std::string("PeriodicStats: history_elements=") + std::to_string(history_elements)
                 + " out of range; using " + std::to_string(use));
    }
    history_elements_ = use;
    series_.history_elements = static_cast<int>(use);
    fill_zero(series_, use);
}

void PeriodicStats::record(FilterCategory category, std::optional<double> elapsed_seconds) {
    std::unique_lock<std::shared_mutex> lk(mu_);

    series_.total_requests[0] += 1;
    totals_.total_requests += 1;

    switch (category) {
    case FilterCategory::Lists:
        series_.filtered_lists[0] += 1;
        totals_.filtered_lists += 1;
        break;
    case FilterCategory::SafeBrowsing:
        series_.filtered_safebrowsing[0] += 1;
        totals_.filtered_safebrowsing += 1;
        break;
    case FilterCategory::SafeSearch:
        series_.filtered_safesearch[0] += 1;
        totals_.filtered_safesearch += 1;
        break;
    case FilterCategory::Parental:
        series_.filtered_parental[0] += 1;
        totals_.filtered_parental += 1;
        break;
    case FilterCategory::None:
        break;
    }

    if (elapsed_seconds) {
        series_.processing_time_sum[0] += *elapsed_seconds;
        series_.processing_time_count[0] += 1;
        totals_.processing_time_sum += *elapsed_seconds;
        totals_.processing_time_count += 1;
    }
}

void PeriodicStats::rotate() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    shift_older(series_.total_requests);
    shift_older(series_.filtered_lists);
    shift_older(series_.filtered_safebrowsing);
    shift_older(series_.filtered_safesearch);
    shift_older(series_.filtered_parental);
    shift_older(series_.processing_time_sum);
    shift_older(series_.processing_time_count);
}

void PeriodicStats::reset() {
    std::unique_lock<std::shared_mutex> lk(mu_);
    fill_zero(series_, history_elements_);
    totals_ = StatsSnapshot{};
}

PeriodicStatsView PeriodicStats::view() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return series_;
}

StatsSnapshot PeriodicStats::snapshot() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return totals_;
}

#include "stats_report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

SnapshotSummary summarize_snapshot(const StatsSnapshot &snap) {
    SnapshotSummary out;
    out.dns_queries = snap.total_requests;
    out.blocked_filtering = snap.filtered_lists;
    out.replaced_safebrowsing = snap.filtered_safebrowsing;
    out.replaced_safesearch = snap.filtered_safesearch;
    out.replaced_parental = snap.filtered_parental;
    if (snap.processing_time_count > 0) {
        out.avg_processing_time = snap.processing_time_sum / snap.processing_time_count;
    }
    return out;
}

WindowedReport build_windowed_report(const PeriodicStatsView &stats, int start, int end) {
    std::pair<int,int> window = clamp_window(start, end, stats.history_elements);
    int from = window.first;
    int to = window.second;

    // never read past the shortest series, so all outputs stay aligned
    size_t limit = static_cast<size_t>(std::max(stats.history_elements, 0));
    for (const Series *s : { &stats.total_requests, &stats.filtered_lists, &stats.filtered_safebrowsing,
                             &stats.filtered_safesearch, &stats.filtered_parental,
                             &stats.processing_time_sum, &stats.processing_time_count }) {
        limit = std::min(limit, s->size());
    }
    to = std::min(to, static_cast<int>(limit));

    WindowedReport r;
    if (from >= to) return r;

    auto rate = [from, to](const Series &s) {
        return compute_rate(s.cbegin() + from, s.cbegin() + to);
    };

    r.dns_queries = rate(stats.total_requests);
    r.blocked_filtering = rate(stats.filtered_lists);
    r.replaced_safebrowsing = rate(stats.filtered_safebrowsing);
    r.replaced_safesearch = rate(stats.filtered_safesearch);
    r.replaced_parental = rate(stats.filtered_parental);

    Series sum = rate(stats.processing_time_sum);
    Series count = rate(stats.processing_time_count);
    r.avg_processing_time.reserve(count.size());
    for (size_t i = 0; i < count.size(); ++i) {
        double avg = 0;
        if (count[i] != 0) {
            avg = sum[i] / count[i];
            avg *= 1000;
        }
        r.avg_processing_time.push_back(avg);
    }
    return r;
}

// ---------- JSON rendering ----------

static std::string json_escape(const std::string &s) {
    std::ostringstream os;
    for (char c : s) {
        switch (c) {
        case '"': os << "\\\""; break;
        case '\\': os << "\\\\"; break;
        case '\n': os << "\\n"; break;
        case '\r': os << "\\r"; break;
        case '\t': os << "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                os << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                   << std::dec << std::setfill(' ');
            } else {
                os << c;
            }
        }
    }
    return os.str();
}

static void write_series(std::ostringstream &out, const char *name, const Series &s, bool last = false) {
    out << "  \"" << name << "\": [";
    for (size_t i = 0; i < s.size(); ++i) {
        if (i) out << ", ";
        out << s[i];
    }
    out << "]" << (last ? "\n" : ",\n");
}

std::string to_json(const SnapshotSummary &s) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << "{\n";
    out << "  \"dns_queries\": " << s.dns_queries << ",\n";
    out << "  \"blocked_filtering\": " << s.blocked_filtering << ",\n";
    out << "  \"replaced_safebrowsing\": " << s.replaced_safebrowsing << ",\n";
    out << "  \"replaced_safesearch\": " << s.replaced_safesearch << ",\n";
    out << "  \"replaced_parental\": " << s.replaced_parental << ",\n";
    out << "  \"avg_processing_time\": " << s.avg_processing_time << "\n";
    out << "}\n";
    return out.str();
}

std::string to_json(const WindowedReport &r) {
    std::ostringstream out;
    out << std::setprecision(15);
    out << "{\n";
    write_series(out, "dns_queries", r.dns_queries);
    write_series(out, "blocked_filtering", r.blocked_filtering);
    write_series(out, "replaced_safebrowsing", r.replaced_safebrowsing);
    write_series(out, "replaced_safesearch", r.replaced_safesearch);
    write_series(out, "replaced_parental", r.replaced_parental);
    write_series(out, "avg_processing_time", r.avg_processing_time, true);
    out << "}\n";
    return out.str();
}

std::string to_json(const RankedMap &top) {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto &p : top) {
        if (!first) out << ", ";
        out << "\"" << json_escape(p.first) << "\":" << p.second;
        first = false;
    }
    out << "}\n";
    return out.str();
}

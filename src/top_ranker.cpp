#include "top_ranker.hpp"
#include <algorithm>

static bool ranks_before(const std::pair<std::string,uint64_t> &a,
                         const std::pair<std::string,uint64_t> &b) {
    if (a.second != b.second) return a.second > b.second;
    return a.first < b.first;
}

static RankedMap ranked_entries(const FrequencyMap &m, size_t K) {
    RankedMap vec;
    vec.reserve(m.size());
    for (const auto &p : m) vec.emplace_back(p.first, p.second);

    if (vec.size() <= K) {
        std::sort(vec.begin(), vec.end(), ranks_before);
        return vec;
    }
    std::nth_element(vec.begin(), vec.begin() + K, vec.end(), ranks_before);
    vec.resize(K);
    std::sort(vec.begin(), vec.end(), ranks_before);
    return vec;
}

std::vector<std::string> sort_by_value(const FrequencyMap &m) {
    std::vector<std::string> sorted;
    sorted.reserve(m.size());
    for (auto &p : ranked_entries(m, m.size())) sorted.push_back(std::move(p.first));
    return sorted;
}

RankedMap produce_top(const FrequencyMap &m, int top) {
    if (top <= 0 || m.empty()) return {};
    return ranked_entries(m, static_cast<size_t>(top));
}

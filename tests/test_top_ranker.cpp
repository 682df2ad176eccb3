// tests/test_top_ranker.cpp
#include <iostream>
#include <set>
#include <string>
#include "../src/top_ranker.hpp"

int main() {
    FrequencyMap m{{"a", 3}, {"b", 10}, {"c", 10}, {"d", 1}};
    const FrequencyMap original = m;

    // ties: only the value set and key set are checked
    RankedMap top2 = produce_top(m, 2);
    if (top2.size() != 2) {
        std::cerr << "top: expected 2 entries got " << top2.size() << "\n";
        return 1;
    }
    std::set<std::string> keys;
    for (auto &p : top2) {
        if (p.second != 10) {
            std::cerr << "top: expected count 10 for " << p.first << "\n";
            return 2;
        }
        keys.insert(p.first);
    }
    if (keys != std::set<std::string>{"b", "c"}) {
        std::cerr << "top: expected keys {b,c}\n";
        return 3;
    }

    if (!produce_top(m, 0).empty() || !produce_top(m, -4).empty()) {
        std::cerr << "top: non-positive N must give empty result\n";
        return 4;
    }

    RankedMap all = produce_top(m, 100);
    if (all.size() != m.size()) {
        std::cerr << "top: N >= size must return every key\n";
        return 5;
    }
    for (auto &p : all) {
        auto it = m.find(p.first);
        if (it == m.end() || it->second != p.second) {
            std::cerr << "top: entry " << p.first << " does not match input\n";
            return 6;
        }
    }
    for (size_t i = 1; i < all.size(); ++i) {
        if (all[i-1].second < all[i].second) {
            std::cerr << "top: output not in descending order\n";
            return 7;
        }
    }

    // equal counts are ordered by ascending key
    if (all[0].first != "b" || all[1].first != "c" || all[2].first != "a" || all[3].first != "d") {
        std::cerr << "top: tie-break should order keys ascending\n";
        return 8;
    }
    auto order = sort_by_value(m);
    if (order != std::vector<std::string>{"b", "c", "a", "d"}) {
        std::cerr << "sort_by_value: unexpected order\n";
        return 9;
    }

    if (m != original) {
        std::cerr << "top: input map was mutated\n";
        return 10;
    }
    if (!produce_top(FrequencyMap{}, 5).empty()) {
        std::cerr << "top: empty map should give empty result\n";
        return 11;
    }

    // partial selection on a larger map
    FrequencyMap big;
    for (int i = 0; i < 500; ++i) big["host" + std::to_string(i)] = static_cast<uint64_t>(i % 50);
    RankedMap top3 = produce_top(big, 3);
    if (top3.size() != 3 || top3[0].second != 49 || top3[2].second != 49 || top3[0].first != "host149") {
        std::cerr << "top: partial selection wrong\n";
        return 12;
    }

    std::cout << "test_top_ranker: OK\n";
    return 0;
}

#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using FrequencyMap = std::unordered_map<std::string, uint64_t>;
using RankedMap = std::vector<std::pair<std::string, uint64_t>>;

// Keys ordered by descending count; equal counts ordered by ascending key.
std::vector<std::string> sort_by_value(const FrequencyMap &m);

// First min(top, m.size()) entries of the ranking; empty when top <= 0.
RankedMap produce_top(const FrequencyMap &m, int top);

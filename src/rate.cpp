#include "rate.hpp"
#include <iterator>

Series compute_rate(Series::const_iterator first, Series::const_iterator last) {
    Series out;
    if (last - first < 2) return out;
    out.reserve(static_cast<size_t>(last - first - 1));
    for (auto it = first; std::next(it) != last; ++it) {
        out.push_back(*it - *std::next(it));
    }
    return out;
}

Series compute_rate(const Series &input) {
    return compute_rate(input.cbegin(), input.cend());
}

int clamp_int(int value, int low, int high) {
    if (value < low) return low;
    if (value > high) return high;
    return value;
}

std::pair<int,int> clamp_window(int start, int end, int history_elements) {
    if (history_elements < 0) history_elements = 0;
    return { clamp_int(start, 0, history_elements), clamp_int(end, 0, history_elements) };
}

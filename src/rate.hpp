#pragma once
#include <vector>
#include <utility>
#include <cstddef>

using Series = std::vector<double>;

// Adjacent differencing over [first, last): out[k] = in[k] - in[k+1].
// Lower indices are the more recent buckets. Fewer than two inputs -> empty.
Series compute_rate(Series::const_iterator first, Series::const_iterator last);
Series compute_rate(const Series &input);

int clamp_int(int value, int low, int high);

// Clamp both window ends into [0, history_elements] independently.
// The result may be inverted (first > second); callers treat that as empty.
std::pair<int,int> clamp_window(int start, int end, int history_elements);

// tests/test_rate.cpp
#include <iostream>
#include <vector>
#include "../src/rate.hpp"

int main() {
    if (!compute_rate(Series{}).empty()) {
        std::cerr << "rate: empty input should give empty output\n";
        return 1;
    }
    if (!compute_rate(Series{42.0}).empty()) {
        std::cerr << "rate: single element should give empty output\n";
        return 2;
    }

    Series in{10, 7, 7, 2, 3};
    Series out = compute_rate(in);
    if (out.size() != in.size() - 1) {
        std::cerr << "rate: expected length " << in.size() - 1 << " got " << out.size() << "\n";
        return 3;
    }
    for (size_t k = 0; k < out.size(); ++k) {
        if (out[k] != in[k] - in[k+1]) {
            std::cerr << "rate: mismatch at " << k << "\n";
            return 4;
        }
    }
    if (in != Series{10, 7, 7, 2, 3}) {
        std::cerr << "rate: input was mutated\n";
        return 5;
    }

    // cumulative totals written newest-first
    Series ex = compute_rate(Series{0, 5, 12, 20});
    if (ex != Series{-5, -7, -8}) {
        std::cerr << "rate: [0,5,12,20] should give [-5,-7,-8]\n";
        return 6;
    }

    // sub-range form
    Series sub = compute_rate(in.cbegin() + 1, in.cbegin() + 4);
    if (sub != Series{0, 5}) {
        std::cerr << "rate: sub-range differencing wrong\n";
        return 7;
    }

    auto w = clamp_window(-5, 1000, 100);
    if (w.first != 0 || w.second != 100) {
        std::cerr << "clamp_window(-5,1000,100) expected (0,100) got (" << w.first << "," << w.second << ")\n";
        return 8;
    }
    w = clamp_window(70, 30, 50);
    if (w.first != 50 || w.second != 30) {
        std::cerr << "clamp_window must clamp each end independently\n";
        return 9;
    }
    for (int s = -200; s <= 200; s += 37) {
        for (int e = -200; e <= 200; e += 41) {
            auto c = clamp_window(s, e, 60);
            if (c.first < 0 || c.first > 60 || c.second < 0 || c.second > 60) {
                std::cerr << "clamp_window out of domain for " << s << "," << e << "\n";
                return 10;
            }
        }
    }

    std::cout << "test_rate: OK\n";
    return 0;
}

// tests/test_body_params.cpp
// Body line parser plus the config layer built on it.

#include <iostream>
#include <sstream>
#include <string>
#include "../src/body_params.hpp"
#include "../src/config.hpp"

int main() {
    std::istringstream ok(" a = 1 \n\nb=2=3\r\n  spaced key  =  v  \n");
    auto p = parse_parameters_from_body(ok);
    if (!p) {
        std::cerr << "body_params: valid body rejected\n";
        return 1;
    }
    if (p->size() != 3 || p->at("a") != "1" || p->at("b") != "2=3" || p->at("spaced key") != "v") {
        std::cerr << "body_params: unexpected parse result\n";
        return 2;
    }

    std::istringstream broken("a=1\nbroken\nc=3\n");
    if (parse_parameters_from_body(broken)) {
        std::cerr << "body_params: line without '=' must reject the body\n";
        return 3;
    }

    std::istringstream empty("\n\n");
    auto e = parse_parameters_from_body(empty);
    if (!e || !e->empty()) {
        std::cerr << "body_params: blank body should give empty map\n";
        return 4;
    }

    ServiceConfig cfg;
    size_t n = apply_parameters(cfg, {
        {"history_elements", "120"},
        {"bucket_seconds", "10"},
        {"follow", "yes"},
        {"top_default", "25"},
        {"workers", "-3"},
        {"nonsense", "1"},
    });
    if (n != 4) {
        std::cerr << "config: expected 4 applied keys got " << n << "\n";
        return 5;
    }
    if (cfg.history_elements != 120 || cfg.bucket_seconds != 10 || !cfg.follow || cfg.top_default != 25 || cfg.workers != 0) {
        std::cerr << "config: values not applied as expected\n";
        return 6;
    }

    if (load_config_file(cfg, "definitely/not/here.conf")) {
        std::cerr << "config: missing file should fail\n";
        return 7;
    }

    std::cout << "test_body_params: OK\n";
    return 0;
}

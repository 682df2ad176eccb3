#include "config.hpp"
#include "body_params.hpp"
#include "util_log.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>

static std::optional<unsigned long> parse_ulong(const std::string &v) {
    if (v.empty() || v[0] == '-') return std::nullopt;
    try {
        size_t used = 0;
        unsigned long n = std::stoul(v, &used);
        if (used != v.size()) return std::nullopt;
        return n;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

static std::optional<bool> parse_bool(const std::string &v) {
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return std::nullopt;
}

size_t apply_parameters(ServiceConfig &cfg, const std::map<std::string,std::string> &params) {
    size_t applied = 0;
    for (const auto &kv : params) {
        const std::string &k = kv.first;
        const std::string &v = kv.second;
        bool ok = true;

        if (k == "file") cfg.file = v;
        else if (k == "log_file") cfg.log_file = v;
        else if (k == "follow") {
            auto b = parse_bool(v);
            if (b) cfg.follow = *b; else ok = false;
        } else if (k == "top_default") {
            auto n = parse_ulong(v);
            if (n && *n <= 10000) cfg.top_default = static_cast<int>(*n); else ok = false;
        } else if (k == "workers" || k == "qcap" || k == "history_elements" || k == "bucket_seconds" || k == "shards") {
            auto n = parse_ulong(v);
            if (!n) ok = false;
            else if (k == "workers") cfg.workers = *n;
            else if (k == "qcap") cfg.qcap = *n ? *n : 1;
            else if (k == "history_elements") cfg.history_elements = *n;
            else if (k == "bucket_seconds") cfg.bucket_seconds = static_cast<unsigned>(*n);
            else cfg.shards = *n;
        } else {
            safe_log("config: unknown key '" + k + "' ignored");
            continue;
        }

        if (ok) ++applied;
        else safe_log("config: bad value for '" + k + "': " + v);
    }
    return applied;
}

bool load_config_file(ServiceConfig &cfg, const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        safe_log("config: cannot open " + path);
        return false;
    }
    auto params = parse_parameters_from_body(in);
    if (!params) {
        safe_log("config: malformed " + path);
        return false;
    }
    apply_parameters(cfg, *params);
    return true;
}

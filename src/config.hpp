#pragma once
#include <cstddef>
#include <map>
#include <string>

struct ServiceConfig {
    std::string file;               // empty -> stdin
    bool follow = false;
    size_t workers = 0;             // 0 -> hardware_concurrency
    size_t qcap = 1 << 16;
    size_t history_elements = 60;
    unsigned bucket_seconds = 0;    // 0 disables the rotation ticker
    size_t shards = 16;
    int top_default = 10;
    std::string log_file = "statpulse.err.log";
};

// Apply known keys; unknown keys and bad numbers are logged and skipped.
// Returns the number of keys applied.
size_t apply_parameters(ServiceConfig &cfg, const std::map<std::string,std::string> &params);

// Load key=value lines from path into cfg. False if the file cannot be read or is malformed.
bool load_config_file(ServiceConfig &cfg, const std::string &path);

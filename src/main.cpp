// src/main.cpp
// StatPulse startup: config, producer, worker pool, bucket ticker, CLI.

#include "bounded_queue.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "global_ctl.hpp"
#include "periodic_stats.hpp"
#include "query_counter.hpp"
#include "stats_report.hpp"
#include "util_log.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace fs = std::filesystem;

std::atomic<bool> g_terminate{false};

void handle_sigint(int) {
    g_terminate.store(true);
}

// Producer for file with --follow support (tail -f style).
static void producer_read_file_loop(const std::string &path, bool follow, BoundedQueue<std::string> &bq) {
    try {
        std::error_code ec;
        while (!g_terminate.load() && !fs::exists(path, ec)) {
            if (!follow) {
                safe_log(std::string("producer: Failed to open ") + path);
                bq.close();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        std::ifstream in;
        auto open_file = [&]() -> bool {
            if (in.is_open()) in.close();
            in.clear();
            in.open(path, std::ios::in);
            return static_cast<bool>(in);
        };

        if (g_terminate.load() || !open_file()) {
            if (!g_terminate.load()) safe_log(std::string("producer: Failed to open ") + path);
            bq.close();
            return;
        }

        uintmax_t last_size = fs::file_size(path, ec);
        if (ec) last_size = 0;

        std::string line;
        while (!g_terminate.load() && std::getline(in, line)) {
            bq.push(std::move(line));
        }

        while (follow && !g_terminate.load()) {
            in.clear();
            bool any = false;
            while (!g_terminate.load() && std::getline(in, line)) {
                any = true;
                bq.push(std::move(line));
            }
            if (any) continue;

            std::error_code ec2;
            uintmax_t cur_size = fs::exists(path, ec2) ? fs::file_size(path, ec2) : 0;
            if (ec2) cur_size = 0;

            if (cur_size < last_size) {
                // rotated or truncated
                safe_log(std::string("producer: ") + path + " truncated or rotated; reopening");
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                if (!open_file()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(500));
                    continue;
                }
            }
            last_size = cur_size;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        bq.close();
    } catch (const std::exception &ex) {
        safe_log(std::string("producer_read_file_loop: exception: ") + ex.what());
        g_terminate.store(true);
        bq.close();
    }
}

static void producer_read_stdin_loop(BoundedQueue<std::string> &bq) {
    try {
        std::string line;
        while (!g_terminate.load() && std::getline(std::cin, line)) {
            bq.push(std::move(line));
        }
        bq.close();
    } catch (const std::exception &ex) {
        safe_log(std::string("producer_read_stdin_loop: exception: ") + ex.what());
        g_terminate.store(true);
        bq.close();
    }
}

// Starts a new bucket every `seconds`; sleeps in short steps so shutdown stays prompt.
static void bucket_ticker_loop(unsigned seconds, PeriodicStats &stats) {
    auto next = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_terminate.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (std::chrono::steady_clock::now() < next) continue;
        stats.rotate();
        next += std::chrono::seconds(seconds);
    }
}

static void usage(const char *argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>] [--file <querylog.json>] [--follow]"
              << " [--workers N] [--qcap N] [--history N] [--bucket-seconds N] [--shards N]"
              << " [--top N] [--log-file <path>]\n";
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);

    ServiceConfig cfg;
    std::map<std::string,std::string> overrides;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--config" && i+1 < argc) {
                if (!load_config_file(cfg, argv[++i])) return 1;
            }
            else if (a == "--file" && i+1 < argc) overrides["file"] = argv[++i];
            else if (a == "--follow") overrides["follow"] = "true";
            else if (a == "--workers" && i+1 < argc) overrides["workers"] = argv[++i];
            else if (a == "--qcap" && i+1 < argc) overrides["qcap"] = argv[++i];
            else if (a == "--history" && i+1 < argc) overrides["history_elements"] = argv[++i];
            else if (a == "--bucket-seconds" && i+1 < argc) overrides["bucket_seconds"] = argv[++i];
            else if (a == "--shards" && i+1 < argc) overrides["shards"] = argv[++i];
            else if (a == "--top" && i+1 < argc) overrides["top_default"] = argv[++i];
            else if (a == "--log-file" && i+1 < argc) overrides["log_file"] = argv[++i];
            else if (a == "--help" || a == "-h") { usage(argv[0]); return 0; }
            else { usage(argv[0]); return 1; }
        }
    } catch (const std::exception &e) {
        std::cerr << "argument error: " << e.what() << "\n";
        return 1;
    }
    // command-line flags win over the config file
    apply_parameters(cfg, overrides);

    set_log_file(cfg.log_file);
    if (cfg.workers == 0) cfg.workers = std::thread::hardware_concurrency();
    if (cfg.workers == 0) cfg.workers = 4;

    {
        std::ostringstream os;
        os << "Starting StatPulse; file=" << (cfg.file.empty() ? "<stdin>" : cfg.file)
           << " follow=" << (cfg.follow ? "true" : "false")
           << " workers=" << cfg.workers
           << " qcap=" << cfg.qcap
           << " history_elements=" << cfg.history_elements
           << " bucket_seconds=" << cfg.bucket_seconds;
        safe_log(os.str());
    }

    BoundedQueue<std::string> bq(cfg.qcap);
    std::unique_ptr<QueryCounter> counter;
    std::unique_ptr<PeriodicStats> stats;
    try {
        counter = std::make_unique<QueryCounter>(cfg.shards);
        stats = std::make_unique<PeriodicStats>(cfg.history_elements);
    } catch (const std::exception &e) {
        safe_log(std::string("StatPulse construction exception: ") + e.what());
        return 1;
    }

    std::thread prod;
    std::thread ticker;
    std::unique_ptr<WorkerPool> wp;
    try {
        if (cfg.file.empty()) {
            prod = std::thread([&bq]{ producer_read_stdin_loop(bq); });
        } else {
            prod = std::thread([&]{ producer_read_file_loop(cfg.file, cfg.follow, bq); });
        }
        wp = std::make_unique<WorkerPool>(cfg.workers, bq, *counter, *stats);
        if (cfg.bucket_seconds > 0) {
            ticker = std::thread([&]{ bucket_ticker_loop(cfg.bucket_seconds, *stats); });
        }
    } catch (const std::exception &e) {
        safe_log(std::string("StatPulse startup exception: ") + e.what());
        g_terminate.store(true);
    }

    // the CLI needs stdin, so it only runs when the query log comes from a file
    try {
        if (!cfg.file.empty() && !g_terminate.load()) {
            run_cli(*counter, *stats, cfg, g_terminate, std::cin, std::cout);
        } else {
            while (!g_terminate.load() && !bq.wait_drained(std::chrono::milliseconds(200))) {
            }
            if (!g_terminate.load()) {
                if (wp) wp->join();
                std::cout << to_json(summarize_snapshot(stats->snapshot()));
                std::cout << to_json(counter->top_hosts(cfg.top_default));
            } else if (cfg.file.empty() && prod.joinable()) {
                // stdin reader may be blocked in getline; it dies with the process
                prod.detach();
            }
        }
    } catch (const std::exception &e) {
        safe_log(std::string("CLI exception: ") + e.what());
    }

    safe_log("Shutdown: setting terminate flag");
    g_terminate.store(true);
    bq.close();

    if (prod.joinable()) prod.join();
    if (ticker.joinable()) ticker.join();
    wp.reset();
    safe_log("Line queue high-water mark: " + std::to_string(bq.high_water()) +
             " of " + std::to_string(cfg.qcap));

    safe_log("StatPulse shutting down normally.");
    return 0;
}

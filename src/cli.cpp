#include "cli.hpp"
#include "body_params.hpp"
#include "stats_report.hpp"

#include <iostream>
#include <sstream>
#include <string>

static const char *HELP =
    "Commands: STATS | HISTORY <start> <end> | TOP hosts|clients|reasons [N] | COUNTERS | ROTATE | "
    "SET (key=value lines, blank line ends) | QUIT\n";

// Collect key=value lines up to the first blank line and apply the runtime-mutable ones.
static void handle_set(ServiceConfig &cfg, std::istream &in, std::ostream &out) {
    std::ostringstream body;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") break;
        body << line << "\n";
    }

    std::istringstream bs(body.str());
    auto params = parse_parameters_from_body(bs);
    if (!params) {
        out << "SET rejected: every line must be key=value\n";
        return;
    }

    for (const auto &kv : *params) {
        if (kv.first != "top_default") {
            out << "SET: '" << kv.first << "' cannot be changed at runtime\n";
            continue;
        }
        ServiceConfig scratch = cfg;
        if (apply_parameters(scratch, { kv }) == 1) {
            cfg.top_default = scratch.top_default;
            out << "top_default = " << cfg.top_default << "\n";
        } else {
            out << "SET: bad value for top_default: " << kv.second << "\n";
        }
    }
}

void run_cli(QueryCounter &counter, PeriodicStats &stats, ServiceConfig &cfg,
             std::atomic<bool> &terminate_flag, std::istream &in, std::ostream &out) {
    std::string cmd;
    out << "StatPulse CLI ready. " << HELP << "> " << std::flush;

    while (!terminate_flag.load() && std::getline(in, cmd)) {
        if (!cmd.empty() && cmd.back() == '\r') cmd.pop_back();
        if (cmd.empty()) {
            out << "> " << std::flush;
            continue;
        }

        std::stringstream ss(cmd);
        std::string tok;
        ss >> tok;

        if (tok == "STATS") {
            out << to_json(summarize_snapshot(stats.snapshot()));
        }
        else if (tok == "HISTORY") {
            int start = 0, end = 0;
            if (ss >> start >> end) {
                out << to_json(build_windowed_report(stats.view(), start, end));
            } else {
                out << "Usage: HISTORY <start> <end>\n";
            }
        }
        else if (tok == "TOP") {
            std::string what;
            ss >> what;
            int n = cfg.top_default;
            if (!(ss >> n)) n = cfg.top_default;
            if (what == "hosts") out << to_json(counter.top_hosts(n));
            else if (what == "clients") out << to_json(counter.top_clients(n));
            else if (what == "reasons") out << to_json(counter.top_reasons(n));
            else out << "Unknown TOP target. Supported: hosts, clients, reasons\n";
        }
        else if (tok == "COUNTERS") {
            out << "entries: " << counter.get_total()
                << "  decode_errors: " << counter.get_errors() << "\n";
        }
        else if (tok == "ROTATE") {
            stats.rotate();
            out << "new bucket started\n";
        }
        else if (tok == "SET") {
            handle_set(cfg, in, out);
        }
        else if (tok == "HELP") {
            out << HELP;
        }
        else if (tok == "QUIT" || tok == "EXIT") {
            terminate_flag.store(true);
            break;
        }
        else {
            out << "Unknown command\n";
        }

        out << "> " << std::flush;
    }

    terminate_flag.store(true);
}

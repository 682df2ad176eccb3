#pragma once
#include <atomic>
#include <iosfwd>

#include "config.hpp"
#include "periodic_stats.hpp"
#include "query_counter.hpp"

// Interactive command loop; returns when QUIT is read, input ends or terminate_flag is raised.
void run_cli(QueryCounter &counter, PeriodicStats &stats, ServiceConfig &cfg,
             std::atomic<bool> &terminate_flag, std::istream &in, std::ostream &out);

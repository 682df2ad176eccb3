#pragma once
#include "bounded_queue.hpp"
#include "periodic_stats.hpp"
#include "query_counter.hpp"
#include <string>
#include <thread>
#include <vector>

// Decodes query-log lines and feeds both the frequency maps and the periodic store.
class WorkerPool {
    std::vector<std::thread> workers;
    BoundedQueue<std::string> &queue;
    QueryCounter &counter;
    PeriodicStats &stats;

    void ingest(const std::string &line, size_t &logged_errors);
public:
    WorkerPool(size_t n, BoundedQueue<std::string> &q, QueryCounter &qc, PeriodicStats &ps);
    ~WorkerPool();

    // Wait for the workers to drain a closed queue.
    void join();
};

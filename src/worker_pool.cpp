// Worker threads pop lines, decode them into LogValue entries and update the
// counters. Thread bodies report failures via safe_log() and raise g_terminate.

#include "worker_pool.hpp"
#include "util_log.hpp"
#include "global_ctl.hpp"
#include "log_entry.hpp"
#include <exception>
#include <system_error>

static const size_t MAX_LOGGED_DECODE_ERRORS = 5;   // per worker

WorkerPool::WorkerPool(size_t num_workers, BoundedQueue<std::string> &queue_,
                       QueryCounter &counter_, PeriodicStats &stats_)
    : queue(queue_), counter(counter_), stats(stats_)
{
    size_t n = (num_workers == 0) ? 1 : num_workers;
    workers.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        workers.emplace_back([this]() {
            try {
                size_t logged_errors = 0;
                std::string line;
                // pop() only fails once the queue is closed and drained
                while (!g_terminate.load() && queue.pop(line)) {
                    ingest(line, logged_errors);
                }
            } catch (const std::exception &ex) {
                safe_log(std::string("Unhandled exception in worker thread: ") + ex.what());
                g_terminate.store(true);
            }
        });
    }
}

void WorkerPool::ingest(const std::string &line, size_t &logged_errors) {
    if (line.empty()) return;
    auto entry = decode_log_entry(line);
    if (!entry) {
        counter.add_decode_error();
        if (logged_errors < MAX_LOGGED_DECODE_ERRORS) {
            ++logged_errors;
            safe_log("worker: cannot decode query-log line: " + line.substr(0, 200));
        }
        return;
    }
    counter.add_entry(*entry);
    stats.record(classify_reason(get_reason(*entry)), get_elapsed_seconds(*entry));
}

void WorkerPool::join() {
    for (auto &t : workers) {
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error &ex) {
                safe_log(std::string("Exception joining worker thread: ") + ex.what());
            }
        }
    }
}

WorkerPool::~WorkerPool() {
    queue.close();
    join();
}

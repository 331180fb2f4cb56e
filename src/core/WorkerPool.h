#pragma once
#include "Logging.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace lan_scan {

// Runs fn(i) for i in [0, count) on at most max_workers threads and joins
// before returning. fn writes into caller-owned, index-addressed storage, so
// no result needs locking. An exception escaping fn is logged and the index
// is abandoned; the other indices still run. When the system refuses new
// threads the pool shrinks to what started, down to running fn on the caller.
template <typename Fn>
void parallel_for(size_t count, size_t max_workers, Fn&& fn) {
    if(count == 0) return;
    size_t workers = std::max<size_t>(1, std::min(max_workers, count));
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for(size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
            try {
                fn(i);
            } catch(const std::exception& ex) {
                Logger::instance().error(std::string("worker task failed: ") + ex.what());
            }
        }
    };
    if(workers == 1) { worker(); return; }
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for(size_t t = 0; t < workers; ++t) {
        try {
            threads.emplace_back(worker);
        } catch(const std::system_error& ex) {
            Logger::instance().warn("started " + std::to_string(threads.size()) + " of " + std::to_string(workers) +
                                    " worker threads: " + ex.what());
            break;
        }
    }
    if(threads.empty()) worker();
    for(auto& th : threads) th.join();
}

}

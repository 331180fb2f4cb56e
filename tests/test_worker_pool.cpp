#include <gtest/gtest.h>
#include "../src/core/WorkerPool.h"
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <sys/resource.h>
#include <vector>

namespace lan_scan {

namespace {
// VmSize of this process in bytes, 0 if /proc is unreadable.
rlim_t current_vm_bytes() {
    std::ifstream status("/proc/self/status");
    std::string key;
    while(status >> key) {
        if(key == "VmSize:") {
            rlim_t kb = 0;
            status >> kb;
            return kb * 1024;
        }
        std::string rest;
        std::getline(status, rest);
    }
    return 0;
}
}

TEST(ParallelForTest, EveryIndexRunsOnce) {
    std::vector<int> hits(300, 0);
    parallel_for(hits.size(), 16, [&](size_t i){ hits[i] += 1; });
    for(int h : hits) EXPECT_EQ(h, 1);
}

TEST(ParallelForTest, ZeroCountAndSingleWorker) {
    int calls = 0;
    parallel_for(0, 8, [&](size_t){ ++calls; });
    EXPECT_EQ(calls, 0);
    parallel_for(5, 0, [&](size_t){ ++calls; });
    EXPECT_EQ(calls, 5);
}

TEST(ParallelForTest, ThrowingTaskDoesNotStopOthers) {
    std::atomic<int> done{0};
    parallel_for(20, 4, [&](size_t i){
        if(i == 7) throw std::runtime_error("boom");
        done.fetch_add(1);
    });
    EXPECT_EQ(done.load(), 19);
}

// Address space is capped in a child so only a few thread stacks fit;
// the pool must finish the work on the threads it got.
TEST(ParallelForDeathTest, FinishesWhenThreadsCannotBeCreated) {
    EXPECT_EXIT({
        rlim_t vm = current_vm_bytes();
        if(vm == 0) std::exit(0);
        rlimit lim{};
        lim.rlim_cur = lim.rlim_max = vm + (64u << 20);
        if(setrlimit(RLIMIT_AS, &lim) != 0) std::exit(0);
        std::atomic<size_t> done{0};
        parallel_for(254, 128, [&](size_t){ done.fetch_add(1); });
        std::exit(done.load() == 254 ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

}

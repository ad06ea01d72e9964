#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>


namespace reckon::core {

// ============================================================================
// Index-parallel loop
// ============================================================================
//
// Runs fn(i) for every i in [0, count). Workers claim indices through a shared
// atomic cursor, so each index is visited exactly once. With workers <= 1 (or
// a single index) the loop runs on the calling thread.
//
// fn must only write state owned by index i; results are collected by the
// caller in index order, which keeps output independent of scheduling.
//
template <typename Fn>
void parallel_for(std::size_t count, unsigned workers, Fn&& fn) {
    const std::size_t threads = std::min<std::size_t>(workers, count);
    if (threads <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> cursor{0};
    auto worker = [&]() {
        for (;;) {
            const std::size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= count) {
                break;
            }
            fn(i);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(threads - 1);
    for (std::size_t t = 1; t < threads; ++t) {
        pool.emplace_back(worker);
    }
    worker(); // calling thread takes a share too

    for (auto& th : pool) {
        if (th.joinable()) {
            th.join();
        }
    }
}

} // namespace reckon::core

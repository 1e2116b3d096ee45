#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace pivot::internal {

    // Runs fn(i) for i in [0, count) on at most `jobs` threads. Items are claimed in index
    // order; completion order is unspecified. The first exception thrown by fn stops new
    // claims and is rethrown on the calling thread once every worker has joined.
    template <typename Fn>
    void parallel_for(size_t count, unsigned jobs, Fn&& fn) {
        if (count == 0U) {
            return;
        }

        auto workers = std::min<size_t>(std::max(jobs, 1U), count);
        if (workers == 1U) {
            for (size_t i = 0U; i < count; ++i) {
                fn(i);
            }
            return;
        }

        std::atomic<size_t> next{0U};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error{};
        std::mutex error_mutex{};

        auto worker_loop = [&]() {
            for (;;) {
                if (failed.load(std::memory_order_relaxed)) {
                    return;
                }
                auto index = next.fetch_add(1U, std::memory_order_relaxed);
                if (index >= count) {
                    return;
                }
                try {
                    fn(index);
                } catch (...) {
                    std::lock_guard lock{error_mutex};
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                    failed.store(true, std::memory_order_relaxed);
                }
            }
        };

        {
            std::vector<std::jthread> threads{};
            threads.reserve(workers);
            for (size_t i = 0U; i < workers; ++i) {
                threads.emplace_back(worker_loop);
            }
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

}  // namespace pivot::internal

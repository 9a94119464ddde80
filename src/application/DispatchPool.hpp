/**
 * @file DispatchPool.hpp
 * @brief Bounded parallel execution of one tick's work list.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <iostream>
#include <thread>
#include <vector>

namespace distill::application {

/**
 * @class DispatchPool
 * @brief Runs a task per work item on at most N threads and joins them.
 *
 * Items are started in list order, so with one worker the order is strictly
 * sequential. Work inside a single item is never split across threads.
 */
class DispatchPool {
public:
    explicit DispatchPool(int maxParallel) : m_maxParallel(std::max(1, maxParallel)) {}

    /** @brief Calls task(i) for every i in [0, count). Returns when all finished. */
    void run(std::size_t count, const std::function<void(std::size_t)>& task) {
        if (count == 0) return;

        std::atomic<std::size_t> next{0};
        auto worker = [&]() {
            for (std::size_t i = next++; i < count; i = next++) {
                try {
                    task(i);
                } catch (const std::exception& e) {
                    std::cerr << "[DispatchPool] Task " << i << " aborted: " << e.what() << std::endl;
                }
            }
        };

        std::size_t threads = std::min(count, static_cast<std::size_t>(m_maxParallel));
        if (threads == 1) {
            worker();
            return;
        }

        std::vector<std::thread> pool;
        pool.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            pool.emplace_back(worker);
        }
        for (auto& th : pool) {
            th.join();
        }
    }

    int maxParallel() const { return m_maxParallel; }

private:
    int m_maxParallel;
};

} // namespace distill::application

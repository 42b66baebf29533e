/**
 * Fan-out helpers for embarrassingly parallel loops.
 *
 * parallel_for() hands indices [0, count) to worker threads through an
 * atomic cursor. Callers write results into per-index slots, so output
 * order never depends on scheduling. Exceptions thrown by a task are
 * captured and the one from the lowest index is rethrown on the caller
 * after every worker has joined.
 */

#ifndef RXNET_CORE_WORK_POOL_HPP
#define RXNET_CORE_WORK_POOL_HPP

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace rxnet {

/** Cooperative cancellation flag shared between a caller and a batch. */
class CancelToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/** Resolve a requested thread count: <= 0 means hardware concurrency. */
inline int resolve_thread_count(int requested, size_t work_items) {
    int n = requested;
    if (n <= 0) {
        n = static_cast<int>(std::thread::hardware_concurrency());
        if (n <= 0) n = 1;
    }
    if (work_items < static_cast<size_t>(n)) n = static_cast<int>(work_items);
    return n < 1 ? 1 : n;
}

/**
 * Run task(i) for every i in [0, count) on up to num_threads threads.
 * When cancel is set, workers stop taking new indices; indices already
 * started run to completion.
 * @return number of tasks that ran
 */
inline size_t parallel_for(size_t count, int num_threads,
                           const std::function<void(size_t)>& task,
                           const CancelToken* cancel = nullptr) {
    std::atomic<size_t> cursor{0};
    std::atomic<size_t> ran{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;
    size_t first_error_index = count;

    auto worker = [&]() {
        for (;;) {
            if (cancel && cancel->cancelled()) return;
            size_t i = cursor.fetch_add(1);
            if (i >= count) return;
            try {
                task(i);
                ran.fetch_add(1);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (i < first_error_index) {
                    first_error_index = i;
                    first_error = std::current_exception();
                }
            }
        }
    };

    int threads = resolve_thread_count(num_threads, count);
    if (threads <= 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(threads));
        for (int t = 0; t < threads; t++) {
            pool.emplace_back(worker);
        }
        for (auto& th : pool) {
            th.join();
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return ran.load();
}

} // namespace rxnet

#endif // RXNET_CORE_WORK_POOL_HPP

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace quire::engine {

    template <typename T>
    class JobQueue {
    public:
        void push(T item) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push(std::move(item));
            }
            m_cv.notify_one();
        }

        bool pop(T& item) {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return !m_queue.empty() || m_stop; });

            if (m_stop && m_queue.empty()) return false;

            item = std::move(m_queue.front());
            m_queue.pop();
            return true;
        }

        /**
         * @brief Wakes all consumers. Items already queued are still handed out.
         */
        void stop() {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stop = true;
            }
            m_cv.notify_all();
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }

    private:
        std::queue<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_stop = false;
    };

    inline size_t resolve_worker_count(size_t requested, size_t jobs) {
        size_t n = requested;
        if (n == 0) n = std::max(1u, std::thread::hardware_concurrency());
        return std::max<size_t>(1, std::min(n, jobs));
    }

    /**
     * @brief Runs job(i) for i in [0, count) on a bounded set of worker threads.
     * @return One slot per job: null on success, the captured exception otherwise.
     *         A failing job never stops the others.
     */
    template <typename Job>
    std::vector<std::exception_ptr> run_parallel(size_t count, size_t workers, Job job) {
        std::vector<std::exception_ptr> failures(count);
        if (count == 0) return failures;

        JobQueue<size_t> queue;
        for (size_t i = 0; i < count; ++i) queue.push(i);
        queue.stop();

        std::vector<std::thread> threads;
        size_t n = resolve_worker_count(workers, count);
        threads.reserve(n);
        for (size_t t = 0; t < n; ++t) {
            threads.emplace_back([&]() {
                size_t index;
                while (queue.pop(index)) {
                    try {
                        job(index);
                    } catch (...) {
                        failures[index] = std::current_exception();
                    }
                }
            });
        }
        for (auto& thread : threads) thread.join();
        return failures;
    }

}

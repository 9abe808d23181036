//
// Created by gregorian-rayne on 2/15/26.
//

#ifndef BFA_PARALLEL_HPP
#define BFA_PARALLEL_HPP

/**
 * @file parallel.hpp
 * @brief Thread pool used for per-file git queries.
 */

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace bfa::parallel {

    /**
     * Returns the number of hardware threads available, or 1 if detection
     * fails.
     */
    inline unsigned int hardware_concurrency() noexcept {
        const unsigned int n = std::thread::hardware_concurrency();
        return n > 0 ? n : 1;
    }

    class ThreadPool {
    public:
        /**
         * @param num_threads Number of worker threads (0 = auto-detect).
         */
        explicit ThreadPool(unsigned int num_threads = 0)
            : stop_(false) {
            if (num_threads == 0) {
                num_threads = hardware_concurrency();
            }

            workers_.reserve(num_threads);
            for (unsigned int i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] {
                    worker_loop();
                });
            }
        }

        ~ThreadPool() {
            {
                std::unique_lock lock(queue_mutex_);
                stop_ = true;
            }
            condition_.notify_all();

            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * Submits a task. Exceptions thrown by the task surface from the
         * returned future.
         */
        template<typename F>
        auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> result = task->get_future();

            {
                std::unique_lock lock(queue_mutex_);
                if (stop_) {
                    throw std::runtime_error("Cannot submit to stopped thread pool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }

            condition_.notify_one();
            return result;
        }

        [[nodiscard]] std::size_t size() const noexcept {
            return workers_.size();
        }

    private:
        void worker_loop() {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_;
        bool stop_;
    };

    /**
     * Starts f on every item and returns the futures in input order, so
     * the caller can consume results as they complete while keeping order.
     */
    template<typename T, typename F>
    auto submit_all(const std::vector<T>& items, F f, ThreadPool& pool)
        -> std::vector<std::future<std::invoke_result_t<F&, const T&>>> {
        using ResultType = std::invoke_result_t<F&, const T&>;

        std::vector<std::future<ResultType>> futures;
        futures.reserve(items.size());

        for (const auto& item : items) {
            futures.push_back(pool.submit([f, &item]() mutable {
                return f(item);
            }));
        }

        return futures;
    }

}  // namespace bfa::parallel

#endif //BFA_PARALLEL_HPP

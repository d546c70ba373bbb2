/**
 * @file thread_pool.hpp
 * @brief A header-only worker pool for the assistant round-trips.
 * Network calls run here so that neither the PTY reader nor the keyboard loop
 * ever waits on the assistant. A fixed worker count bounds concurrent requests.
 */

#pragma once

#include "core/log.hpp"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace shfix::core::utils {

    class ThreadPool {
    public:
        using Job = std::function<void()>;

        explicit ThreadPool(size_t threads = 2) {
            if (threads == 0) threads = 1;
            workers_.reserve(threads);
            for (size_t i = 0; i < threads; ++i) {
                workers_.emplace_back([this] { worker_loop(); });
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Fire-and-forget submission. Nobody waits on the result, so an
         * escaping exception is logged here instead of being lost.
         * @throws std::runtime_error once the pool is shutting down.
         */
        void post(Job job) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (stopping_)
                    throw std::runtime_error("post on stopped ThreadPool");
                jobs_.push(std::move(job));
            }
            wake_.notify_one();
        }

        size_t worker_count() const { return workers_.size(); }

        // Queued jobs still run before the workers are joined
        ~ThreadPool() {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                stopping_ = true;
            }
            wake_.notify_all();
            for (std::thread& worker : workers_)
                worker.join();
        }

    private:
        void worker_loop() {
            while (true) {
                Job job;
                {
                    std::unique_lock<std::mutex> lock(queue_mutex_);
                    wake_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                    if (stopping_ && jobs_.empty())
                        return;
                    job = std::move(jobs_.front());
                    jobs_.pop();
                }

                try {
                    job();
                } catch (const std::exception& e) {
                    log::error(std::string("Background task failed: ") + e.what());
                }
            }
        }

        std::vector<std::thread> workers_;
        std::queue<Job> jobs_;

        std::mutex queue_mutex_;
        std::condition_variable wake_;
        bool stopping_ = false;
    };
}

/**
 * @file test_thread_pool.cpp
 * @brief Tests for the background worker pool, including a real-threaded
 *        orchestrator run.
 */

#include "test_harness.hpp"
#include "core/session_orchestrator.hpp"
#include "core/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace shfix::core;

TEST(test_jobs_drain_before_destruction) {
    std::atomic<int> done{0};
    {
        utils::ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.post([&done] {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                ++done;
            });
        }
    }
    ASSERT_EQ(done.load(), 50, "every queued job ran");
    PASS("Destructor drains the queue");
}

TEST(test_throwing_job_keeps_worker_alive) {
    std::atomic<int> done{0};
    {
        utils::ThreadPool pool(1);
        pool.post([] { throw std::runtime_error("boom"); });
        pool.post([&done] { ++done; });
    }
    ASSERT_EQ(done.load(), 1, "job after the failing one still ran");
    PASS("Exceptions are contained per job");
}

TEST(test_zero_threads_means_one) {
    utils::ThreadPool pool(0);
    ASSERT_EQ(pool.worker_count(), 1u, "at least one worker");
    PASS("Worker count never drops to zero");
}

namespace {
    class WaitingSink : public SuggestionSink {
    public:
        void on_failure_detected(const std::string&) override {}
        void on_suggestions_ready(const std::string&, const std::string&, const SuggestionBatch& batch) override {
            std::lock_guard<std::mutex> lock(mutex);
            delivered = batch;
            ready = true;
            cv.notify_all();
        }

        bool wait(std::chrono::milliseconds timeout) {
            std::unique_lock<std::mutex> lock(mutex);
            return cv.wait_for(lock, timeout, [this] { return ready; });
        }

        std::mutex mutex;
        std::condition_variable cv;
        bool ready = false;
        SuggestionBatch delivered;
    };

    class FixedReplyClient : public AssistantClient {
    public:
        std::string complete(const AssistantRequest&) override {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return "1. git status \xE2\x86\x92 Show the working tree";
        }
    };
}

TEST(test_orchestrator_on_worker_threads) {
    WaitingSink sink;
    FetcherSettings fs;
    fs.api_key = "sk-test";
    auto fetcher = std::make_shared<const SuggestionFetcher>(std::make_shared<FixedReplyClient>(), fs);

    utils::ThreadPool pool(2);
    SessionOrchestrator orch(fetcher, &sink, [&pool](std::function<void()> job) { pool.post(std::move(job)); });

    orch.on_input("gti status\r");
    orch.on_output("zsh: command not found: gti\r\n");

    // Output keeps streaming while the request is in flight
    for (int i = 0; i < 20; ++i) orch.on_output("still typing...\r\n");

    ASSERT_TRUE(sink.wait(std::chrono::seconds(5)), "suggestions delivered from a worker");
    ASSERT_EQ(sink.delivered.size(), 1u, "one suggestion");
    ASSERT_EQ(sink.delivered[0].command, std::string("git status"), "parsed on the worker");

    orch.end();
    PASS("Pipeline runs off the calling thread");
}

int main() {
    print_banner("shfix Thread Pool Tests");

    std::cout << "\n[Pool Tests]" << std::endl;
    test_jobs_drain_before_destruction();
    test_throwing_job_keeps_worker_alive();
    test_zero_threads_means_one();

    std::cout << "\n[Integration Tests]" << std::endl;
    test_orchestrator_on_worker_threads();

    return print_summary();
}

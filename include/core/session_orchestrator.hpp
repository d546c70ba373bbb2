/**
 * @file session_orchestrator.hpp
 * @brief Per-session glue: input -> tracker, output -> classifier -> dedup -> fetch -> parse -> sink.
 *
 * One instance exists per active shell session. Input and output arrive on
 * independent threads; every piece of session state sits behind one mutex,
 * so each channel is processed in arrival order. The assistant round-trip
 * runs on a dispatcher (the engine's worker pool) and reports back through a
 * weak reference, so a session that ends mid-flight simply drops the result.
 */

#pragma once
#include "core/command_tracker.hpp"
#include "core/config.hpp"
#include "core/dedup_cache.hpp"
#include "core/output_classifier.hpp"
#include "core/suggestion.hpp"
#include "core/suggestion_fetcher.hpp"
#include "core/suggestion_parser.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shfix::core {

    /**
     * @class SuggestionSink
     * @brief The UI boundary. Calls arrive from the PTY reader thread or from a
     * pool worker, always serialized by the session lock.
     */
    class SuggestionSink {
    public:
        virtual ~SuggestionSink() = default;

        /** @brief "Error after: <cmd>\n→ <line>", or the bare line when no command is known. */
        virtual void on_failure_detected(const std::string& formatted_message) = 0;

        /** @brief Fired once per processed failure. An empty batch means "no suggestions". */
        virtual void on_suggestions_ready(const std::string& command,
                                          const std::string& error_line,
                                          const SuggestionBatch& batch) = 0;

        /** @brief Status lines ("Getting command suggestions...", configuration problems). */
        virtual void on_notice(const std::string& text) { (void)text; }
    };

    /** @brief Single-flight latch. Chunks arriving while Processing are not classified. */
    enum class FlightState { Idle, Processing };

    struct OrchestratorSettings {
        using Clock = std::function<DedupCache::TimePoint()>;

        std::chrono::milliseconds grace_delay{300};
        std::chrono::seconds dedup_window{DedupCache::kDefaultWindow};
        size_t dedup_max_keys = DedupCache::kDefaultMaxKeys;
        size_t history_capacity = kDefaultHistoryCapacity;
        bool show_notices = true;
        std::vector<std::string> extra_error_patterns;
        Clock clock = [] { return std::chrono::system_clock::now(); };

        static OrchestratorSettings from_config(const Config& config);
    };

    /** @brief Runs a job somewhere else. The engine backs this with its ThreadPool. */
    using Dispatcher = std::function<void(std::function<void()>)>;

    constexpr auto kFetchingNotice = "Getting command suggestions...";

    class SessionOrchestrator {
    public:
        /**
         * @param fetcher  Shared with in-flight jobs; must not be null.
         * @param sink     Must stay valid until end() returns.
         * @param dispatch Executes the fetch+parse job off the calling thread.
         */
        SessionOrchestrator(std::shared_ptr<const SuggestionFetcher> fetcher,
                            SuggestionSink* sink,
                            Dispatcher dispatch,
                            OrchestratorSettings settings = {});
        ~SessionOrchestrator();

        SessionOrchestrator(const SessionOrchestrator&) = delete;
        SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

        /** @brief Raw bytes the operator sent toward the shell. */
        void on_input(std::string_view data);

        /** @brief Raw bytes the shell produced (already displayed by the caller). */
        void on_output(std::string_view chunk);

        /**
         * @brief Session teardown. After this returns the sink is never called
         * again and in-flight results are discarded.
         */
        void end();

        bool active() const;
        FlightState flight_state() const;
        std::string last_command() const;
        std::string input_buffer() const;
        std::deque<std::string> history() const;
        size_t dedup_size() const;

        // --- Correlation & fallback rules (stateless, exposed for tests) ---

        /**
         * @brief Missing program named by a command-not-found line.
         * Handles "zsh: command not found: mk" and "mk: command not found".
         * @return Empty when no name can be extracted.
         */
        static std::string extract_missing_program(const std::string& error_line);

        /**
         * @brief Decides which command a failure belongs to. The shell may name
         * a different program than the last submission (typed-ahead input,
         * scripts), so the evidence line takes precedence where it is explicit.
         */
        static std::string correlate_command(const Evidence& evidence,
                                             const std::string& last_command,
                                             const RecentCommands& history);

        /** @brief Cheap local corrections offered when the assistant is unreachable. */
        static SuggestionBatch fallback_suggestions(const std::string& command, const std::string& error_line);

    private:
        struct State;

        void announce_submission(State& state, const SubmittedCommand& submitted);
        static void run_pipeline(std::weak_ptr<State> weak_state,
                                 std::shared_ptr<const SuggestionFetcher> fetcher,
                                 std::string command,
                                 std::string error_line);

        std::shared_ptr<State> state_;
        std::shared_ptr<const SuggestionFetcher> fetcher_;
        Dispatcher dispatch_;
    };

}

/**
 * @file session_orchestrator.cpp
 * @brief Implementation of the per-session failure pipeline.
 *
 * Lock order: session mutex first, then whatever the sink takes (the
 * engine's terminal mutex). The dispatcher is never invoked with the session
 * mutex held, so an inline dispatcher cannot deadlock.
 */

#include "core/session_orchestrator.hpp"
#include "core/command_handlers.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/text_utils.hpp"
#include <format>
#include <regex>
#include <stdexcept>
#include <utility>

namespace shfix::core {

    // ==================================================================================
    // SESSION STATE
    // ==================================================================================

    struct SessionOrchestrator::State {
        explicit State(OrchestratorSettings s)
            : settings(std::move(s)),
              tracker(settings.history_capacity),
              dedup(settings.dedup_window, settings.dedup_max_keys) {}

        mutable std::mutex mutex;
        OrchestratorSettings settings;
        CommandTracker tracker;
        OutputClassifier classifier;
        DedupCache dedup;
        SuggestionParser parser;

        std::string last_error;
        FlightState flight = FlightState::Idle;
        std::optional<DedupCache::TimePoint> release_at;  ///< Set once the in-flight job finished
        bool fetch_disabled = false;                      ///< ConfigError seen; reported once
        bool active = true;
        SuggestionSink* sink = nullptr;

        void notice(const std::string& text) {
            if (settings.show_notices && sink) sink->on_notice(text);
        }

        /** @brief Lazy latch release: Processing ends once the grace deadline has passed. */
        bool busy(DedupCache::TimePoint now) {
            if (flight == FlightState::Idle) return false;
            if (release_at && now >= *release_at) {
                flight = FlightState::Idle;
                release_at.reset();
                return false;
            }
            return true;
        }
    };

    namespace {
        const std::regex& node_version_flag() {
            static const std::regex re(R"(node\s+--?ver\b)");
            return re;
        }

        const std::regex& python_version_flag() {
            static const std::regex re(R"(python3?\s+(--v|-ver)\b)");
            return re;
        }

        const std::regex& node_path_bad_option() {
            static const std::regex re(R"(/.*node:.*bad option)", std::regex::icase);
            return re;
        }

        bool contains(const std::string& haystack, std::string_view needle) {
            return haystack.find(needle) != std::string::npos;
        }
    }

    // ==================================================================================
    // SETTINGS
    // ==================================================================================

    OrchestratorSettings OrchestratorSettings::from_config(const Config& config) {
        OrchestratorSettings settings;
        if (config.grace_delay_ms >= 0) settings.grace_delay = std::chrono::milliseconds(config.grace_delay_ms);
        if (config.dedup_window_seconds > 0) settings.dedup_window = std::chrono::seconds(config.dedup_window_seconds);
        if (config.dedup_max_keys > 0) settings.dedup_max_keys = static_cast<size_t>(config.dedup_max_keys);
        if (config.history_capacity > 0) settings.history_capacity = static_cast<size_t>(config.history_capacity);
        settings.show_notices = config.show_notices;
        settings.extra_error_patterns = config.extra_error_patterns;
        return settings;
    }

    // ==================================================================================
    // LIFECYCLE
    // ==================================================================================

    SessionOrchestrator::SessionOrchestrator(std::shared_ptr<const SuggestionFetcher> fetcher,
                                             SuggestionSink* sink,
                                             Dispatcher dispatch,
                                             OrchestratorSettings settings)
        : state_(std::make_shared<State>(std::move(settings))),
          fetcher_(std::move(fetcher)),
          dispatch_(std::move(dispatch)) {
        if (!fetcher_) throw std::invalid_argument("SessionOrchestrator requires a fetcher");
        if (!dispatch_) throw std::invalid_argument("SessionOrchestrator requires a dispatcher");
        if (!state_->settings.clock) state_->settings.clock = [] { return std::chrono::system_clock::now(); };
        state_->sink = sink;

        for (const auto& expr : state_->settings.extra_error_patterns) {
            try {
                state_->classifier.add_pattern(expr);
            } catch (const std::regex_error& e) {
                log::warn(std::format("Ignoring invalid error pattern '{}': {}", expr, e.what()));
            }
        }
        log::debug(std::format("Session started ({} failure patterns)", state_->classifier.pattern_count()));
    }

    SessionOrchestrator::~SessionOrchestrator() {
        end();
    }

    void SessionOrchestrator::end() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->active) return;
        state_->active = false;
        state_->sink = nullptr;
        log::debug("Session ended; pending suggestions will be discarded");
    }

    // ==================================================================================
    // INPUT CHANNEL
    // ==================================================================================

    void SessionOrchestrator::on_input(std::string_view data) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->active) return;

        for (const auto& submitted : state_->tracker.feed(data)) {
            announce_submission(*state_, submitted);
        }
    }

    void SessionOrchestrator::announce_submission(State& state, const SubmittedCommand& submitted) {
        if (submitted.changed) {
            size_t purged = state.dedup.purge_command(submitted.previous);
            state.last_error.clear();
            if (purged > 0) log::debug(std::format("Purged {} dedup keys of '{}'", purged, submitted.previous));
        }

        if (std::regex_search(submitted.command, node_version_flag())) {
            state.notice("Note: The command you entered might be using an incorrect version flag. Watching for errors...");
        }
        if (std::regex_search(submitted.command, python_version_flag())) {
            state.dedup.purge_command(submitted.command);
            state.notice("Note: Python uses -V (capital V) or --version for checking version. Watching for errors...");
        }
    }

    // ==================================================================================
    // OUTPUT CHANNEL
    // ==================================================================================

    void SessionOrchestrator::on_output(std::string_view chunk) {
        std::string command;
        std::string error_line;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            State& state = *state_;
            if (!state.active) return;

            auto now = state.settings.clock();
            if (state.busy(now)) return;

            auto evidence = state.classifier.classify(chunk);
            if (!evidence) return;

            if (evidence->line == state.last_error) {
                log::debug("Repeated error line suppressed");
                return;
            }
            state.last_error = evidence->line;
            log::debug(std::format("Failure detected ({}): {}", to_string(evidence->kind), evidence->line));

            command = correlate_command(*evidence, state.tracker.last_command(), state.tracker.history());
            state.tracker.set_last_command(command);

            if (evidence->kind == FailureKind::CommandNotFound && !command.empty()) {
                state.dedup.purge_command(command);
            }

            if (state.sink) state.sink->on_failure_detected(handlers::format_failure_message(command, evidence->line));

            if (command.empty() || state.fetch_disabled) return;

            if (!state.dedup.should_process(command, evidence->line, now)) {
                log::debug(std::format("Already handled in this window: '{}'", command));
                return;
            }
            state.tracker.history().remember(command);

            state.flight = FlightState::Processing;
            state.release_at.reset();
            state.notice(kFetchingNotice);
            error_line = evidence->line;
        }

        try {
            dispatch_([weak = std::weak_ptr<State>(state_), fetcher = fetcher_,
                       command = std::move(command), error_line = std::move(error_line)]() mutable {
                run_pipeline(std::move(weak), std::move(fetcher), std::move(command), std::move(error_line));
            });
        } catch (const std::exception& e) {
            log::error(std::format("Could not schedule suggestion request: {}", e.what()));
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->flight = FlightState::Idle;
            state_->release_at.reset();
        }
    }

    // ==================================================================================
    // PIPELINE (runs on the dispatcher, no session lock held during the fetch)
    // ==================================================================================

    void SessionOrchestrator::run_pipeline(std::weak_ptr<State> weak_state,
                                           std::shared_ptr<const SuggestionFetcher> fetcher,
                                           std::string command,
                                           std::string error_line) {
        SuggestionBatch batch;
        bool deliver = true;
        bool disable_fetch = false;
        std::string notice;

        try {
            std::string reply = fetcher->fetch(command, error_line);
            batch = SuggestionParser{}.parse(reply);
            if (batch.empty()) {
                log::debug("Reply could not be parsed; using placeholder");
                batch.push_back({kUnparsedCommand, kUnparsedDescription});
            }
            log::debug(std::format("Parsed {} suggestion(s) for '{}'", batch.size(), command));
        } catch (const ConfigError& e) {
            deliver = false;
            disable_fetch = true;
            notice = e.what();
        } catch (const InputError& e) {
            deliver = false;
            notice = e.what();
        } catch (const UpstreamError& e) {
            log::debug(std::format("Assistant unavailable: {}", e.what()));
            batch = fallback_suggestions(command, error_line);
            notice = batch.empty() ? "Suggestion service unavailable" : "Suggestion service unavailable; showing local fixes";
        } catch (const std::exception& e) {
            log::error(std::format("Suggestion pipeline failed: {}", e.what()));
            batch.clear();
        }

        auto state = weak_state.lock();
        if (!state) return;

        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->active) return;

        if (disable_fetch) {
            state->fetch_disabled = true;
            // Configuration problems are shown even with notices turned off
            if (state->sink) state->sink->on_notice(notice);
        } else if (!notice.empty()) {
            state->notice(notice);
        }
        if (deliver && state->sink) state->sink->on_suggestions_ready(command, error_line, batch);

        state->release_at = state->settings.clock() + state->settings.grace_delay;
    }

    // ==================================================================================
    // CORRELATION & FALLBACK
    // ==================================================================================

    std::string SessionOrchestrator::extract_missing_program(const std::string& error_line) {
        static const std::regex shell_form(R"(\w+:\s+command not found:\s+(\w+))", std::regex::icase);
        static const std::regex basic_form(R"(([^\s:]+):\s+command not found)");

        std::smatch m;
        if (std::regex_search(error_line, m, shell_form)) return m[1].str();
        if (std::regex_search(error_line, m, basic_form)) return m[1].str();
        return "";
    }

    std::string SessionOrchestrator::correlate_command(const Evidence& evidence,
                                                       const std::string& last_command,
                                                       const RecentCommands& history) {
        const std::string& line = evidence.line;
        const std::string lower = text::to_lower(line);
        std::string command = last_command;

        if (evidence.kind == FailureKind::CommandNotFound || contains(lower, "command not found")) {
            std::string name = extract_missing_program(line);
            if (name.empty()) return command;

            if (auto recent = history.find_program(name)) {
                command = *recent;
            } else if (command != name && !command.starts_with(name + " ")) {
                command = name;
            }
            return command;
        }

        bool node_bad_option = (contains(lower, "bad option") && contains(line, "-ver")) ||
                               std::regex_search(line, node_path_bad_option());
        if (node_bad_option && !contains(command, "node")) {
            return "node -ver";
        }

        bool python_error = (contains(lower, "python") || lower == "unknown option --v") &&
                            (contains(lower, "unknown option") || contains(lower, "invalid option"));
        if (python_error && !contains(command, "python") &&
            (contains(line, "--v") || contains(line, "-ver"))) {
            return "python --v";
        }

        return command;
    }

    SuggestionBatch SessionOrchestrator::fallback_suggestions(const std::string& command, const std::string& error_line) {
        SuggestionBatch batch;
        if (auto pos = command.find("-ver"); pos != std::string::npos) {
            std::string fixed = command;
            fixed.replace(pos, 4, "-v");
            batch.push_back({fixed, "Use -v instead of -ver for version flag"});
        } else if (contains(command, "node") && text::contains_icase(error_line, "bad option")) {
            batch.push_back({"node -v", "Show Node.js version"});
            batch.push_back({"node -h", "Show Node.js help"});
        }
        return batch;
    }

    // ==================================================================================
    // ACCESSORS
    // ==================================================================================

    bool SessionOrchestrator::active() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->active;
    }

    FlightState SessionOrchestrator::flight_state() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->flight == FlightState::Processing && state_->release_at &&
            state_->settings.clock() >= *state_->release_at) {
            return FlightState::Idle;
        }
        return state_->flight;
    }

    std::string SessionOrchestrator::last_command() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->tracker.last_command();
    }

    std::string SessionOrchestrator::input_buffer() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->tracker.buffer();
    }

    std::deque<std::string> SessionOrchestrator::history() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->tracker.history().entries();
    }

    size_t SessionOrchestrator::dedup_size() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->dedup.size();
    }

}

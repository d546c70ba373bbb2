/**
 * @file terminal_renderer.hpp
 * @brief SuggestionSink that draws failures and suggestions inline in the terminal.
 */

#pragma once
#include "core/session_orchestrator.hpp"
#include "core/suggestion.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace shfix::core {

    /**
     * @class TerminalRenderer
     * @brief Prints themed blocks and remembers the latest batch for :fix.
     *
     * Shares the engine's terminal mutex so its output never interleaves with
     * shell output mid-line.
     */
    class TerminalRenderer : public SuggestionSink {
    public:
        explicit TerminalRenderer(std::mutex& terminal_mutex) : terminal_mutex_(terminal_mutex) {}

        void on_failure_detected(const std::string& formatted_message) override;
        void on_suggestions_ready(const std::string& command, const std::string& error_line,
                                  const SuggestionBatch& batch) override;
        void on_notice(const std::string& text) override;

        /** @brief Re-renders the latest batch (":suggestions", bare ":fix"). */
        void render_last();

        /** @brief 1-based lookup into the latest batch. */
        std::optional<Suggestion> suggestion_at(size_t index) const;

    private:
        void write(const std::string& text);

        std::mutex& terminal_mutex_;

        mutable std::mutex batch_mutex_;
        bool has_batch_ = false;
        std::string last_command_;
        std::string last_error_;
        SuggestionBatch last_batch_;
    };

}

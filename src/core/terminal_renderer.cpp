/**
 * @file terminal_renderer.cpp
 * @brief Implementation of the inline suggestion UI.
 */

#include "core/terminal_renderer.hpp"
#include "core/command_handlers.hpp"
#include <iostream>

namespace shfix::core {

    void TerminalRenderer::write(const std::string& text) {
        std::lock_guard<std::mutex> lock(terminal_mutex_);
        std::cout << text << std::flush;
    }

    void TerminalRenderer::on_failure_detected(const std::string& formatted_message) {
        write(handlers::render_failure(formatted_message));
    }

    void TerminalRenderer::on_suggestions_ready(const std::string& command, const std::string& error_line,
                                                const SuggestionBatch& batch) {
        {
            std::lock_guard<std::mutex> lock(batch_mutex_);
            has_batch_ = true;
            last_command_ = command;
            last_error_ = error_line;
            last_batch_ = batch;
        }
        write(handlers::render_suggestions(command, error_line, batch));
    }

    void TerminalRenderer::on_notice(const std::string& text) {
        write("\r" + handlers::status_line(handlers::Theme::NOTICE, "-", text));
    }

    void TerminalRenderer::render_last() {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(batch_mutex_);
            if (!has_batch_) {
                text = handlers::status_line(handlers::Theme::NOTICE, "-", "No suggestions yet");
            } else {
                text = handlers::render_suggestions(last_command_, last_error_, last_batch_);
            }
        }
        write(text);
    }

    std::optional<Suggestion> TerminalRenderer::suggestion_at(size_t index) const {
        std::lock_guard<std::mutex> lock(batch_mutex_);
        if (index == 0 || index > last_batch_.size()) return std::nullopt;
        return last_batch_[index - 1];
    }

}

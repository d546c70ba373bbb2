/**
 * @file engine_commands.cpp
 * @brief Implementation of Engine's internal ':' commands.
 *
 * Internal commands are typed at an empty prompt and never reach the shell.
 * After each one a bare newline is sent to the shell so it redraws its prompt,
 * except for :fix, which submits the chosen suggestion instead.
 */

#include "core/engine.hpp"
#include "core/command_handlers.hpp"
#include "core/help_text.hpp"
#include "core/log.hpp"
#include "core/text_utils.hpp"
#include <charconv>
#include <csignal>
#include <format>
#include <iostream>

namespace shfix::core {

    void Engine::execute_internal_command(const std::string& line) {
        std::string clean = text::trim(line);
        if (clean.empty()) return;

        // 1. Exit
        if (clean == ":q" || clean == ":exit") {
            running_ = false;
            kill(pty_.get_child_pid(), SIGHUP);
            return;
        }

        // 2. Run a suggestion (submits its own line, no prompt redraw needed)
        if (clean.starts_with(":fix ")) {
            run_suggestion(clean.substr(5));
            return;
        }

        // 3. Everything else prints, then asks the shell for a fresh prompt
        if (clean == ":fix" || clean == ":suggestions") {
            renderer_->render_last();
        } else if (clean == ":history") {
            show_history();
        } else if (clean == ":help") {
            std::lock_guard<std::mutex> terminal_lock(terminal_mutex_);
            std::cout << get_help_text() << std::flush;
        } else {
            print_status(handlers::Theme::WARNING,
                         std::format("Unknown command '{}'. Type :help for the list.", clean));
        }

        redraw_prompt();
    }

    /**
     * @brief Types suggestion <n> into the shell and submits it.
     * Ctrl-U first clears anything the shell may still hold on its line.
     */
    void Engine::run_suggestion(const std::string& argument) {
        std::string arg = text::trim(argument);
        size_t index = 0;
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), index);

        if (arg.empty() || ec != std::errc{} || ptr != arg.data() + arg.size()) {
            print_status(handlers::Theme::WARNING, "Usage: :fix <n>");
            redraw_prompt();
            return;
        }

        auto suggestion = renderer_->suggestion_at(index);
        if (!suggestion) {
            print_status(handlers::Theme::WARNING, std::format("No suggestion #{}. Type :suggestions to list them.", index));
            redraw_prompt();
            return;
        }

        print_status(handlers::Theme::SUCCESS, std::format("Running: {}", suggestion->command));
        forward_to_shell(std::string(1, kCtrlU) + suggestion->command + "\r");
    }

    void Engine::redraw_prompt() {
        if (!pty_.write_input("\n")) {
            log::debug("Could not ask the shell for a fresh prompt");
        }
    }

    void Engine::show_history() {
        // Snapshot before taking the terminal lock (session lock is always taken first)
        std::string text = handlers::render_history(orchestrator_->history());
        std::lock_guard<std::mutex> terminal_lock(terminal_mutex_);
        std::cout << text << std::flush;
    }

}

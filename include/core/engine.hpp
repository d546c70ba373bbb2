/**
 * @file engine.hpp
 * @brief The shfix runtime: PTY pass-through plus the failure-suggestion pipeline.
 */

#pragma once

#include "core/config.hpp"
#include "core/session.hpp"
#include "core/session_orchestrator.hpp"
#include "core/terminal_renderer.hpp"
#include "core/thread_pool.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <pybind11/embed.h>

namespace py = pybind11;

namespace shfix::core {

    constexpr char kCtrlC = '\x03';
    constexpr char kCtrlU = '\x15';
    constexpr char kBackspace = '\x7f';

    class Engine {
    public:
        Engine();
        ~Engine();

        /** @brief Reads config.py from `path` (defaults stay on failure). */
        void load_configuration(const std::string& path);

        /** @brief Puts the Python helpers on sys.path and checks they import. */
        void load_extensions(const std::string& path);

        /** @brief Blocks until the shell exits or the user types :q. */
        void run();

        /** @brief Called from the SIGWINCH handler. */
        void resize_window(int rows, int cols);

    private:
        // python state (must outlive everything that touches Python)
        py::scoped_interpreter guard_{};

        Config config_;
        PTYSession pty_;
        std::atomic<bool> running_{false};
        std::atomic<bool> in_alt_screen_{false};
        std::atomic<bool> session_started_{false};
        bool helpers_loaded_ = false;

        // One lock for everything written to the operator's screen
        std::mutex terminal_mutex_;

        // --- Suggestion pipeline ---
        std::unique_ptr<utils::ThreadPool> pool_;
        std::unique_ptr<TerminalRenderer> renderer_;
        std::unique_ptr<SessionOrchestrator> orchestrator_;

        // --- Internal command line (":fix 2") ---
        bool internal_mode_ = false;
        bool internal_esc_ = false;   ///< Swallowing an escape sequence (arrow keys)
        std::string internal_buffer_;

        void start_session();
        void end_session();

        // The background thread that reads from Shell -> Screen
        void forward_shell_output();

        // The main loop that reads User Keyboard -> Shell
        void process_user_input();

        /** @brief Forwards bytes to the shell and to the command tracker. */
        void forward_to_shell(const std::string& data);

        /** @brief Handles one byte while an internal command is being typed. */
        void handle_internal_key(char c);

        // Internal commands (engine_commands.cpp)
        void execute_internal_command(const std::string& line);
        void run_suggestion(const std::string& argument);
        void show_history();
        void redraw_prompt();

        void print_status(const std::string& color, const std::string& message);
    };

}

/**
 * @file engine.cpp
 * @brief Core implementation of the shfix runtime engine.
 *
 * This file contains the main logic for:
 * 1. Managing the Pseudoterminal (PTY) session.
 * 2. Bi-directional I/O forwarding (User <-> Shell).
 * 3. Embedding the Python interpreter that hosts config.py and the HTTP helper.
 * 4. Feeding both streams into the per-session SessionOrchestrator.
 * 5. Intercepting ':' internal commands before they reach the shell.
 */

#include "core/engine.hpp"
#include "core/command_handlers.hpp"
#include "core/config_loader.hpp"
#include "core/log.hpp"
#include "core/python_assistant_client.hpp"
#include "core/suggestion_fetcher.hpp"
#include <array>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

// ==================================================================================
// EMBEDDED MODULE DEFINITION
// ==================================================================================
/**
 * @brief Defines the 'shfix' Python module available to helper scripts.
 * Lets Python write through the same diagnostics channel as the C++ core.
 */
PYBIND11_EMBEDDED_MODULE(shfix, m) {
    m.def("debug", [](std::string msg) { shfix::core::log::debug(msg); });
    m.def("notice", [](std::string msg) { shfix::core::log::notice(msg); });
}

namespace shfix::core {

    constexpr size_t BUFFER_SIZE = 4096;
    constexpr size_t kWorkerThreads = 2;

    namespace {
        /** @brief write(2) until everything is out; gives up on hard errors. */
        void write_all(int fd, const char* data, size_t size) {
            size_t written = 0;
            while (written < size) {
                ssize_t n = ::write(fd, data + written, size - written);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return;
                }
                written += static_cast<size_t>(n);
            }
        }
    }

    Engine::Engine() = default;

    // Ensure we kill the child shell if the engine is destroyed while running
    Engine::~Engine() {
        if (running_ && pty_.get_child_pid() > 0) kill(pty_.get_child_pid(), SIGTERM);
    }

    // ==================================================================================
    // EXTENSION & CONFIGURATION MANAGEMENT
    // ==================================================================================

    void Engine::load_configuration(const std::string& path) {
        ConfigLoader::load(config_, path);
    }

    /**
     * @brief Adds the helper directory to sys.path and imports the HTTP helper once,
     * so a broken install is reported at startup rather than on the first failure.
     */
    void Engine::load_extensions(const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        if (path.empty() || !fs::exists(p) || !fs::is_directory(p)) {
            log::warn(std::format("Helper path '{}' invalid. Suggestions will use local fallbacks only.", path));
            return;
        }

        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(fs::absolute(p).string());
            py::module_::import("assistant_client");
            helpers_loaded_ = true;
            log::debug("Loaded .py helper: assistant_client");
        } catch (const py::error_already_set& e) {
            log::error(std::format("Error, failed to load assistant_client.py: {}", e.what()));
        }
    }

    // ==================================================================================
    // SESSION LIFECYCLE
    // ==================================================================================

    void Engine::start_session() {
        pool_ = std::make_unique<utils::ThreadPool>(kWorkerThreads);
        renderer_ = std::make_unique<TerminalRenderer>(terminal_mutex_);

        FetcherSettings settings = FetcherSettings::from_config(config_);
        if (settings.api_key.empty()) {
            print_status(handlers::Theme::WARNING,
                         std::format("No API key in ${}. Errors will be detected but not corrected.", config_.api_key_env));
        }

        if (!helpers_loaded_) {
            log::debug("assistant_client.py is not loaded; every request will fall back to local fixes");
        }

        std::shared_ptr<AssistantClient> client = std::make_shared<PythonAssistantClient>();
        auto fetcher = std::make_shared<const SuggestionFetcher>(client, settings);

        utils::ThreadPool* pool = pool_.get();
        orchestrator_ = std::make_unique<SessionOrchestrator>(
            fetcher, renderer_.get(),
            [pool](std::function<void()> job) { pool->post(std::move(job)); },
            OrchestratorSettings::from_config(config_));

        session_started_ = true;
    }

    /**
     * @brief Tears the session down in dependency order: stop callbacks first,
     * then drain the workers, then drop the objects they referenced.
     */
    void Engine::end_session() {
        if (!session_started_) return;
        session_started_ = false;

        orchestrator_->end();
        pool_.reset();
        orchestrator_.reset();
        renderer_.reset();
    }

    // ==================================================================================
    // MAIN LOOP
    // ==================================================================================

    void Engine::run() {
        if (!pty_.start()) return;

        // We must sync the window size AFTER the PTY has started (so master_fd is valid),
        // but BEFORE we start forwarding output, otherwise text wraps weirdly.
        struct winsize w;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != -1) {
            pty_.resize(w.ws_row, w.ws_col);
        }

        running_ = true;

        std::cout << "\r["
                  << handlers::Theme::SUCCESS << "-"
                  << handlers::Theme::RESET << "]"
                  << " shfix has been started. Type ':help' for commands, ':q' or ':exit' to exit.\r\n" << std::flush;

        {
            // Workers need the GIL for the HTTP helper; the main thread only
            // waits on file descriptors from here on.
            py::gil_scoped_release release;

            start_session();

            // Spawn the output reader thread (Shell -> Screen)
            std::thread output_thread(&Engine::forward_shell_output, this);

            // Run the input processing loop (Keyboard -> Shell) in the main thread
            process_user_input();

            running_ = false;
            if (output_thread.joinable()) output_thread.join();

            end_session();
        }

        // Closing the master signals EOF/SIGHUP to the shell and restores the terminal
        pty_.stop();

        // Wait for child process to truly exit before finishing
        waitpid(pty_.get_child_pid(), nullptr, 0);

        std::cout << "\r["
                  << handlers::Theme::ERROR << "-"
                  << handlers::Theme::RESET << "]"
                  << " Session ended.\n" << std::flush;
    }

    void Engine::resize_window(int rows, int cols) {
        pty_.resize(rows, cols);
    }

    /**
     * @brief Reads output from the Shell (PTY Master) and writes to Stdout.
     * Every chunk is shown in full before the orchestrator sees it, so
     * classification can never hold back or alter what the user reads.
     */
    void Engine::forward_shell_output() {
        std::array<char, BUFFER_SIZE> buffer;
        struct pollfd pfd{};
        pfd.fd = pty_.get_master_fd();
        pfd.events = POLLIN;

        while (running_) {
            int ret = poll(&pfd, 1, 100);

            if (ret < 0) {
                if (errno == EINTR) continue; // Resize signal received, just continue
                break; // Real error, exit loop
            }

            // Poll timeout - no data available, continue polling
            if (ret == 0) continue;

            if (pfd.revents & POLLIN) {
                ssize_t bytes_read = read(pty_.get_master_fd(), buffer.data(), buffer.size());
                if (bytes_read <= 0) {
                    // PTY Closed (Shell Exited)
                    running_ = false;
                    break;
                }

                std::string_view chunk(buffer.data(), static_cast<size_t>(bytes_read));

                // --- ALT SCREEN DETECTION (VIM FIX) ---
                // Full-screen programs redraw constantly and own the ':' key.
                if (chunk.find("\x1b[?1049h") != std::string_view::npos || chunk.find("\x1b[?47h") != std::string_view::npos) {
                    in_alt_screen_ = true;
                }
                if (chunk.find("\x1b[?1049l") != std::string_view::npos || chunk.find("\x1b[?47l") != std::string_view::npos) {
                    in_alt_screen_ = false;
                }

                {
                    std::lock_guard<std::mutex> terminal_lock(terminal_mutex_);
                    write_all(STDOUT_FILENO, chunk.data(), chunk.size());
                }

                if (!in_alt_screen_ && orchestrator_) {
                    orchestrator_->on_output(chunk);
                }
            } else if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                running_ = false;
                break;
            }
        }
    }

    /**
     * @brief Reads User Input (Stdin) and forwards to Shell (PTY Master).
     * A ':' typed at an empty prompt switches to the internal command line;
     * those keystrokes are echoed locally and never reach the shell.
     */
    void Engine::process_user_input() {
        std::array<char, BUFFER_SIZE> buffer;
        struct pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;

        while (running_) {
            int ret = poll(&pfd, 1, 100);

            if (ret < 0) {
                if (errno == EINTR) continue; // Signal interrupted, keep going
                break;
            }
            if (ret == 0) continue;

            if (pfd.revents & POLLIN) {
                ssize_t n = read(STDIN_FILENO, buffer.data(), buffer.size());
                if (n <= 0) break;

                std::string pending;
                pending.reserve(static_cast<size_t>(n));

                for (ssize_t i = 0; i < n && running_; ++i) {
                    char c = buffer[i];

                    if (internal_mode_) {
                        handle_internal_key(c);
                        continue;
                    }

                    if (c == ':' && !in_alt_screen_) {
                        // Flush first so the tracker buffer reflects everything typed before ':'
                        forward_to_shell(pending);
                        pending.clear();

                        if (orchestrator_->input_buffer().empty() && pty_.is_shell_idle()) {
                            internal_mode_ = true;
                            internal_esc_ = false;
                            internal_buffer_ = ":";
                            std::lock_guard<std::mutex> terminal_lock(terminal_mutex_);
                            std::cout << ':' << std::flush;
                            continue;
                        }
                    }

                    pending += c;
                }

                forward_to_shell(pending);
            } else if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                break;
            }
        }
    }

    void Engine::forward_to_shell(const std::string& data) {
        if (data.empty()) return;
        if (!pty_.write_input(data)) {
            log::debug(std::format("Write to shell failed: {}", std::strerror(errno)));
            return;
        }
        if (orchestrator_) orchestrator_->on_input(data);
    }

    void Engine::handle_internal_key(char c) {
        auto echo = [this](std::string_view s) {
            std::lock_guard<std::mutex> terminal_lock(terminal_mutex_);
            std::cout << s << std::flush;
        };

        if (internal_esc_) {
            // Skip the '[' / 'O' introducer; CSI/SS3 sequences then end on a letter or '~'
            if (c == '[' || c == 'O') return;
            if (std::isalpha(static_cast<unsigned char>(c)) || c == '~') internal_esc_ = false;
            return;
        }

        if (c == '\r' || c == '\n') {
            std::string line = internal_buffer_;
            internal_mode_ = false;
            internal_buffer_.clear();
            echo("\r\n");
            execute_internal_command(line);
        } else if (c == kBackspace || c == '\b') {
            if (!internal_buffer_.empty()) {
                internal_buffer_.pop_back();
                echo("\b \b");
            }
            if (internal_buffer_.empty()) internal_mode_ = false;
        } else if (c == kCtrlC) {
            internal_mode_ = false;
            internal_buffer_.clear();
            echo("^C");
            // Let the shell draw a fresh prompt
            forward_to_shell(std::string(1, kCtrlC));
        } else if (c == '\x1b') {
            internal_esc_ = true;
        } else if (static_cast<unsigned char>(c) >= 0x20) {
            internal_buffer_ += c;
            echo(std::string_view(&c, 1));
        }
    }

    void Engine::print_status(const std::string& color, const std::string& message) {
        std::lock_guard<std::mutex> terminal_lock(terminal_mutex_);
        std::cout << "\r" << handlers::status_line(color, "-", message) << std::flush;
    }

}

/**
 * @file session.cpp
 * @brief forkpty-based shell hosting and terminal mode handling.
 */

#include "core/session.hpp"
#include "core/log.hpp"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <format>
#include <pty.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace shfix::core {

    PTYSession::~PTYSession() { stop(); }

    bool PTYSession::start() {
        // Inherit the operator's window size from the start
        struct winsize ws{};
        struct winsize* ws_ptr = nullptr;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) ws_ptr = &ws;

        pid_t pid = forkpty(&master_fd_, nullptr, nullptr, ws_ptr);
        if (pid < 0) {
            log::error(std::format("forkpty failed: {}", std::strerror(errno)));
            master_fd_ = -1;
            return false;
        }

        if (pid == 0) {
            // Child: become the shell
            const char* shell = std::getenv("SHELL");
            if (!shell || !*shell) shell = "/bin/sh";
            execlp(shell, shell, static_cast<char*>(nullptr));
            execl("/bin/sh", "sh", static_cast<char*>(nullptr));
            _exit(127);
        }

        child_pid_ = pid;
        enable_raw_mode();
        return true;
    }

    void PTYSession::stop() {
        if (master_fd_ >= 0) {
            close(master_fd_);
            master_fd_ = -1;
        }
        disable_raw_mode();
    }

    void PTYSession::resize(int rows, int cols) {
        if (master_fd_ < 0) return;
        struct winsize ws{};
        ws.ws_row = static_cast<unsigned short>(rows);
        ws.ws_col = static_cast<unsigned short>(cols);
        if (ioctl(master_fd_, TIOCSWINSZ, &ws) == -1) {
            log::debug(std::format("TIOCSWINSZ failed: {}", std::strerror(errno)));
            return;
        }
        if (child_pid_ > 0) kill(child_pid_, SIGWINCH);
    }

    bool PTYSession::write_input(std::string_view data) {
        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = write(master_fd_, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    bool PTYSession::is_shell_idle() const {
        if (master_fd_ < 0 || child_pid_ <= 0) return false;
        pid_t fg = tcgetpgrp(master_fd_);
        return fg == child_pid_;
    }

    void PTYSession::enable_raw_mode() {
        if (!isatty(STDIN_FILENO)) return;
        if (tcgetattr(STDIN_FILENO, &orig_termios_) == -1) return;

        struct termios raw = orig_termios_;
        cfmakeraw(&raw);
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0) raw_mode_ = true;
    }

    void PTYSession::disable_raw_mode() {
        if (!raw_mode_) return;
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &orig_termios_);
        raw_mode_ = false;
    }

}

/**
 * @file session.hpp
 * @brief Pseudoterminal session hosting the user's interactive shell.
 */

#pragma once

#include <string_view>
#include <sys/types.h>
#include <termios.h>

namespace shfix::core {

    /**
     * @class PTYSession
     * @brief Owns the shell child process, the PTY master fd and the raw-mode
     * state of the operator's terminal. stop() restores the terminal.
     */
    class PTYSession {
    public:
        PTYSession() = default;
        ~PTYSession();

        PTYSession(const PTYSession&) = delete;
        PTYSession& operator=(const PTYSession&) = delete;

        /**
         * @brief Spawns $SHELL (fallback /bin/sh) on a fresh PTY and switches
         * stdin to raw mode.
         * @return false if the PTY could not be created.
         */
        bool start();

        /** @brief Closes the master fd (shell sees SIGHUP) and restores the terminal. */
        void stop();

        void resize(int rows, int cols);

        /** @brief Writes all bytes to the shell, retrying on EINTR and short writes. */
        bool write_input(std::string_view data);

        /** @brief True when the shell itself owns the foreground (no job running). */
        bool is_shell_idle() const;

        int get_master_fd() const { return master_fd_; }
        pid_t get_child_pid() const { return child_pid_; }

    private:
        void enable_raw_mode();
        void disable_raw_mode();

        int master_fd_ = -1;
        pid_t child_pid_ = -1;
        struct termios orig_termios_{};
        bool raw_mode_ = false;
    };

}

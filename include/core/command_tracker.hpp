/**
 * @file command_tracker.hpp
 * @brief Reconstructs the logical command line from raw keystrokes.
 *
 * The tracker sees exactly the bytes the operator sends towards the shell.
 * It never fails; it only mutates its buffer, the last submitted command
 * and the bounded recent-command history.
 */

#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shfix::core {

    constexpr size_t kDefaultHistoryCapacity = 10;

    /**
     * @class RecentCommands
     * @brief Ordered, duplicate-free history with oldest-first eviction.
     */
    class RecentCommands {
    public:
        explicit RecentCommands(size_t capacity = kDefaultHistoryCapacity);

        /**
         * @brief Appends a trimmed, non-empty command unless it is already present.
         * @return true if the command was appended.
         */
        bool remember(const std::string& command);

        bool contains(const std::string& command) const;

        /**
         * @brief Finds the first entry that runs `program`, i.e. equals it or
         * starts with "program ".
         */
        std::optional<std::string> find_program(const std::string& program) const;

        const std::deque<std::string>& entries() const { return entries_; }
        size_t size() const { return entries_.size(); }
        size_t capacity() const { return capacity_; }

    private:
        size_t capacity_;
        std::deque<std::string> entries_;
    };

    /**
     * @brief Emitted for every Enter that carried a non-empty command.
     * `changed` is true when the command differs from the previous submission;
     * the owner uses it to purge state scoped to `previous`.
     */
    struct SubmittedCommand {
        std::string command;
        std::string previous;
        bool changed = false;
    };

    /**
     * @class CommandTracker
     * @brief Keystroke state machine: printable bytes accumulate, Enter submits,
     * Backspace drops one character, Ctrl-C discards, escape sequences are ignored.
     */
    class CommandTracker {
    public:
        explicit CommandTracker(size_t history_capacity = kDefaultHistoryCapacity);

        /**
         * @brief Feeds a raw input read. Escape sequences split across reads
         * are tracked, so arrow keys never leak into the buffer.
         * @return Every command submitted inside this read, in order.
         */
        std::vector<SubmittedCommand> feed(std::string_view input);

        std::optional<SubmittedCommand> press_enter();
        void press_backspace();
        void press_interrupt();

        /**
         * @brief Overrides the associated command after error correlation
         * (e.g. the shell names a different program than the one typed).
         */
        void set_last_command(std::string command) { last_command_ = std::move(command); }

        const std::string& buffer() const { return buffer_; }
        const std::string& last_command() const { return last_command_; }
        RecentCommands& history() { return history_; }
        const RecentCommands& history() const { return history_; }

    private:
        enum class EscState { Text, Escape, Csi, Osc, OscEscape, Ss3 };

        std::string buffer_;
        std::string last_command_;
        RecentCommands history_;
        EscState esc_state_ = EscState::Text;
    };

}

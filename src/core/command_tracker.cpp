/**
 * @file command_tracker.cpp
 * @brief Implementation of the keystroke-driven command tracker.
 */

#include "core/command_tracker.hpp"
#include "core/text_utils.hpp"
#include <algorithm>

namespace shfix::core {

    constexpr char kCtrlC = '\x03';
    constexpr char kCtrlH = '\x08';
    constexpr char kDel = '\x7f';

    // ==================================================================================
    // RECENT COMMANDS
    // ==================================================================================

    RecentCommands::RecentCommands(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    bool RecentCommands::remember(const std::string& command) {
        std::string clean = text::trim(command);
        if (clean.empty() || contains(clean)) return false;

        entries_.push_back(std::move(clean));
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
        return true;
    }

    bool RecentCommands::contains(const std::string& command) const {
        return std::find(entries_.begin(), entries_.end(), command) != entries_.end();
    }

    std::optional<std::string> RecentCommands::find_program(const std::string& program) const {
        if (program.empty()) return std::nullopt;
        const std::string prefix = program + " ";
        for (const auto& entry : entries_) {
            if (entry == program || entry.starts_with(prefix)) return entry;
        }
        return std::nullopt;
    }

    // ==================================================================================
    // COMMAND TRACKER
    // ==================================================================================

    CommandTracker::CommandTracker(size_t history_capacity)
        : history_(history_capacity) {}

    std::vector<SubmittedCommand> CommandTracker::feed(std::string_view input) {
        std::vector<SubmittedCommand> submitted;

        for (char c : input) {
            const auto u = static_cast<unsigned char>(c);

            // --- ESCAPE SEQUENCE SKIPPING ---
            // Cursor keys, bracketed-paste markers and OSC replies never reach the buffer.
            switch (esc_state_) {
                case EscState::Escape:
                    if (c == '[') esc_state_ = EscState::Csi;
                    else if (c == ']') esc_state_ = EscState::Osc;
                    else if (c == 'O') esc_state_ = EscState::Ss3;
                    else esc_state_ = EscState::Text; // Alt+key: drop both bytes
                    continue;
                case EscState::Csi:
                    if (u >= 0x40 && u <= 0x7E) esc_state_ = EscState::Text;
                    continue;
                case EscState::Osc:
                    if (c == text::kBell) esc_state_ = EscState::Text;
                    else if (c == text::kEsc) esc_state_ = EscState::OscEscape;
                    continue;
                case EscState::OscEscape:
                    esc_state_ = (c == '\\') ? EscState::Text : EscState::Osc;
                    continue;
                case EscState::Ss3:
                    esc_state_ = EscState::Text;
                    continue;
                case EscState::Text:
                    break;
            }

            if (c == text::kEsc) {
                esc_state_ = EscState::Escape;
            } else if (c == '\r' || c == '\n') {
                if (auto cmd = press_enter()) submitted.push_back(std::move(*cmd));
            } else if (c == kDel || c == kCtrlH) {
                press_backspace();
            } else if (c == kCtrlC) {
                press_interrupt();
            } else if (u >= 0x20) {
                buffer_ += c;
            }
            // Remaining C0 controls (Tab, Ctrl-D, ...) edit the shell's line in
            // ways we cannot mirror, so they are not recorded.
        }

        return submitted;
    }

    std::optional<SubmittedCommand> CommandTracker::press_enter() {
        std::string trimmed = text::trim(buffer_);
        buffer_.clear();
        if (trimmed.empty()) return std::nullopt;

        SubmittedCommand event;
        event.previous = last_command_;
        event.changed = (trimmed != last_command_);
        event.command = trimmed;

        last_command_ = trimmed;
        history_.remember(trimmed);
        return event;
    }

    void CommandTracker::press_backspace() {
        // Drop a whole UTF-8 character: continuation bytes first, then the lead byte.
        while (!buffer_.empty() && (static_cast<unsigned char>(buffer_.back()) & 0xC0) == 0x80) {
            buffer_.pop_back();
        }
        if (!buffer_.empty()) buffer_.pop_back();
    }

    void CommandTracker::press_interrupt() {
        buffer_.clear();
    }

}

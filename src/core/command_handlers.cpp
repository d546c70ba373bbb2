/**
 * @file command_handlers.cpp
 * @brief Implementation of the theme palette and text renderers.
 *
 * Includes internal helpers for ANSI width calculation and padding so that
 * suggestion lists line up in columns regardless of colour codes.
 */

#include "core/command_handlers.hpp"
#include "core/suggestion_parser.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <sys/ioctl.h>
#include <unistd.h>

namespace shfix::core::handlers {

    // ==================================================================================
    // THEME DEFAULTS
    // ==================================================================================
    std::string Theme::RESET     = "\x1b[0m";
    std::string Theme::STRUCTURE = "\x1b[38;5;240m";
    std::string Theme::UNIT      = "\x1b[38;5;109m";
    std::string Theme::VALUE     = "\x1b[0m";
    std::string Theme::TEXT      = "\x1b[38;5;250m";
    std::string Theme::SUCCESS   = "\x1b[92m";
    std::string Theme::WARNING   = "\x1b[93m";
    std::string Theme::ERROR     = "\x1b[91m";
    std::string Theme::NOTICE    = "\x1b[94m";

    // ==================================================================================
    // INTERNAL HELPERS (HIDDEN)
    // ==================================================================================
    namespace {

        /** @brief Right-pads to `width` visible columns. */
        std::string pad_visible(const std::string& s, size_t width) {
            size_t len = get_visible_length(s);
            if (len >= width) return s;
            return s + std::string(width - len, ' ');
        }

        std::string rule(size_t width) {
            std::string out;
            for (size_t i = 0; i < width; ++i) out += "\xE2\x94\x80"; // ─
            return Theme::STRUCTURE + out + Theme::RESET;
        }

        size_t rule_width() {
            int w = get_terminal_width();
            return static_cast<size_t>(std::clamp(w - 2, 20, 60));
        }
    }

    // ==================================================================================
    // HELPERS
    // ==================================================================================

    int get_terminal_width() {
        struct winsize w;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == -1 || w.ws_col == 0) return 80;
        return w.ws_col;
    }

    size_t get_visible_length(std::string_view s) {
        size_t len = 0;
        bool in_esc_seq = false;
        for (char c : s) {
            unsigned char uc = static_cast<unsigned char>(c);
            if (c == '\x1b') in_esc_seq = true;
            else if (in_esc_seq) {
                if (std::isalpha(uc) || c == '\\') in_esc_seq = false;
            } else if ((uc & 0xC0) != 0x80) {
                // UTF-8 continuation bytes do not add a column
                len++;
            }
        }
        return len;
    }

    std::string translate_newlines(std::string_view input) {
        std::string out;
        out.reserve(input.size() + 8);
        char prev = '\0';
        for (char c : input) {
            if (c == '\n' && prev != '\r') out += '\r';
            out += c;
            prev = c;
        }
        return out;
    }

    std::string status_line(const std::string& color, std::string_view tag, std::string_view message) {
        return std::format("[{}{}{}] {}\r\n", color, tag, Theme::RESET, message);
    }

    // ==================================================================================
    // RENDERERS
    // ==================================================================================

    std::string format_failure_message(const std::string& command, const std::string& error_line) {
        if (command.empty()) return error_line;
        return std::format("Error after: {}\n{} {}", command, kArrowSeparator, error_line);
    }

    std::string render_failure(std::string_view formatted_message) {
        std::string out = "\r\n";
        out += status_line(Theme::ERROR, "!", "Command failed");
        out += Theme::TEXT + translate_newlines(formatted_message) + Theme::RESET + "\r\n";
        return out;
    }

    std::string render_suggestions(const std::string& command, const std::string& error_line,
                                   const SuggestionBatch& batch) {
        std::string out = "\r\n";
        out += rule(rule_width()) + "\r\n";
        out += std::format("{}Suggestions{} for {}{}{}\r\n",
                           Theme::UNIT, Theme::RESET, Theme::VALUE, command, Theme::RESET);
        if (!error_line.empty()) {
            out += std::format("{}{} {}{}\r\n", Theme::STRUCTURE, kArrowSeparator, error_line, Theme::RESET);
        }

        if (batch.empty()) {
            out += std::format("  {}No suggestions{}\r\n", Theme::WARNING, Theme::RESET);
        } else {
            size_t cmd_width = 0;
            for (const auto& s : batch) cmd_width = std::max(cmd_width, get_visible_length(s.command));
            cmd_width = std::min<size_t>(cmd_width, 40);

            for (size_t i = 0; i < batch.size(); ++i) {
                std::string index = std::format("{}[{}{}{}]{}", Theme::STRUCTURE, Theme::VALUE, i + 1,
                                                Theme::STRUCTURE, Theme::RESET);
                out += std::format("  {} {}  {}{}{}\r\n", index,
                                   pad_visible(batch[i].command, cmd_width),
                                   Theme::TEXT, batch[i].description, Theme::RESET);
            }
            out += std::format("{}Run one with :fix <n>{}\r\n", Theme::STRUCTURE, Theme::RESET);
        }
        out += rule(rule_width()) + "\r\n";
        return out;
    }

    std::string render_history(const std::deque<std::string>& entries) {
        if (entries.empty()) {
            return status_line(Theme::NOTICE, "-", "No commands recorded yet");
        }
        std::string out = std::format("{}Recent commands{}\r\n", Theme::UNIT, Theme::RESET);
        for (size_t i = 0; i < entries.size(); ++i) {
            out += std::format("  {}{:>2}{}  {}\r\n", Theme::VALUE, i + 1, Theme::RESET, entries[i]);
        }
        return out;
    }

}

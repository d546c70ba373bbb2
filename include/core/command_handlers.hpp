/**
 * @file command_handlers.hpp
 * @brief Presentation helpers: theme colours and the text blocks shfix prints.
 *
 * Everything here returns ready-to-write strings with CRLF line endings,
 * since the operator's terminal is in raw mode while a session is active.
 */

#pragma once
#include "core/suggestion.hpp"
#include <deque>
#include <string>
#include <string_view>

namespace shfix::core::handlers {

    /**
     * @brief Colour palette. Defaults are ANSI codes; config.py THEME may override any entry.
     */
    struct Theme {
        static std::string RESET;
        static std::string STRUCTURE;   ///< Brackets, separators
        static std::string UNIT;        ///< Headings
        static std::string VALUE;       ///< Indices, highlighted values
        static std::string TEXT;        ///< Descriptions
        static std::string SUCCESS;
        static std::string WARNING;
        static std::string ERROR;
        static std::string NOTICE;
    };

    // --- HELPERS ---

    /** @brief Queries the terminal width using ioctl; 80 when unknown. */
    int get_terminal_width();

    /** @brief Visual length of a string, ignoring ANSI escape codes. */
    size_t get_visible_length(std::string_view s);

    /** @brief Translates bare '\n' into "\r\n" (prevents the raw-mode staircase). */
    std::string translate_newlines(std::string_view input);

    /** @brief "[<color>tag<reset>] message\r\n" */
    std::string status_line(const std::string& color, std::string_view tag, std::string_view message);

    // --- RENDERERS ---

    /** @brief "Error after: <cmd>\n→ <line>", or just the line when no command is known. */
    std::string format_failure_message(const std::string& command, const std::string& error_line);

    /** @brief Themed block shown when a failure is detected. */
    std::string render_failure(std::string_view formatted_message);

    /**
     * @brief Numbered suggestion list: "[1] command  description".
     * An empty batch renders "No suggestions".
     */
    std::string render_suggestions(const std::string& command, const std::string& error_line,
                                   const SuggestionBatch& batch);

    /** @brief Numbered recent-command list for :history. */
    std::string render_history(const std::deque<std::string>& entries);

}

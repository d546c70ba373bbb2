/**
 * @file suggestion_parser.hpp
 * @brief Turns the assistant's free-text reply into an ordered SuggestionBatch.
 *
 * The reply format is loosely followed at best, so each line is tried against
 * an ordered list of independent matchers; the first that recognises the line wins.
 */

#pragma once
#include "core/suggestion.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace shfix::core {

    /** @brief UTF-8 encoding of the arrow the prompt asks for ("→"). */
    constexpr std::string_view kArrowSeparator = "\xE2\x86\x92";

    namespace parse_strategies {

        using Matcher = std::optional<Suggestion> (*)(std::string_view line);

        /** `1. cmd → description` */
        std::optional<Suggestion> numbered_arrow(std::string_view line);
        /** `1. cmd: description` */
        std::optional<Suggestion> numbered_colon(std::string_view line);
        /** `1. cmd - description` */
        std::optional<Suggestion> numbered_hyphen(std::string_view line);
        /** 1. `cmd` -- description */
        std::optional<Suggestion> numbered_quoted(std::string_view line);
        /** `cmd ~ description`, numbering optional */
        std::optional<Suggestion> tilde(std::string_view line);
        /** First '~' anywhere in the line splits command from description. */
        std::optional<Suggestion> tilde_anywhere(std::string_view line);
        /**
         * Numbered line that matched nothing else: a known program name splits at
         * the first whitespace; anything else becomes the whole command.
         */
        std::optional<Suggestion> numbered_last_resort(std::string_view line);
        /** Any line starting with a known program name, split at the first whitespace. */
        std::optional<Suggestion> known_program(std::string_view line);

        /** @brief Strips surrounding quotes/backticks and a leading "label:" artifact. */
        std::string clean_command(std::string_view raw);
    }

    /**
     * @class SuggestionParser
     * @brief Never throws; an unrecognisable reply yields an empty batch.
     */
    class SuggestionParser {
    public:
        SuggestionBatch parse(std::string_view reply) const;
    };

}

/**
 * @file suggestion.hpp
 * @brief Suggestion value types shared by the parser, orchestrator and renderer.
 */

#pragma once
#include <string>
#include <vector>

namespace shfix::core {

    /** @brief One corrected command proposed by the assistant. */
    struct Suggestion {
        std::string command;
        std::string description;

        bool operator==(const Suggestion&) const = default;
    };

    /** @brief Ordered as the assistant ranked them. Empty is a valid outcome. */
    using SuggestionBatch = std::vector<Suggestion>;

    // Reply the assistant is told to give when nothing is wrong with the command.
    constexpr auto kValidCommandSentinel = "Command is valid. No suggestions needed.";

    // Stand-in when a reply was received but no line could be parsed.
    constexpr auto kUnparsedCommand = "echo 'Unable to parse suggestions'";
    constexpr auto kUnparsedDescription = "Try a different command or check API response format";

    constexpr auto kDefaultDescription = "Suggested command";

}

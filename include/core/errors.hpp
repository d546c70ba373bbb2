/**
 * @file errors.hpp
 * @brief Exception taxonomy of the failure-suggestion pipeline.
 *
 * The fetcher raises these; the SessionOrchestrator is the catch boundary
 * that turns them into "no suggestions" outcomes so the shell stream never stops.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace shfix::core {

    /** @brief Base class of every error raised by the suggestion pipeline. */
    class SuggestionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /** @brief The failed command was empty. Never sent upstream. */
    class InputError : public SuggestionError {
    public:
        using SuggestionError::SuggestionError;
    };

    /** @brief No assistant credential is configured. Raised before any network call. */
    class ConfigError : public SuggestionError {
    public:
        using SuggestionError::SuggestionError;
    };

    /** @brief Timeout, transport failure or non-success status from the assistant service. */
    class UpstreamError : public SuggestionError {
    public:
        using SuggestionError::SuggestionError;
    };

    /** @brief The assistant answered, but the envelope lacks the reply field. */
    class FormatError : public UpstreamError {
    public:
        using UpstreamError::UpstreamError;
    };

}

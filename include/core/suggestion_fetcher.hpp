/**
 * @file suggestion_fetcher.hpp
 * @brief Builds the correction prompt and calls the assistant for one failure.
 */

#pragma once
#include "core/assistant_client.hpp"
#include "core/config.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace shfix::core {

    /** @brief Everything the fetcher needs besides the client. */
    struct FetcherSettings {
        std::string api_key;                 ///< Empty means "no credential configured"
        std::string endpoint{"https://openrouter.ai/api/v1/chat/completions"};
        std::string model{"anthropic/claude-3.5-sonnet"};
        std::chrono::milliseconds timeout{10000};
        int max_tokens = 150;
        double temperature = 0.2;

        static constexpr std::chrono::milliseconds kMinTimeout{1000};
        static constexpr std::chrono::milliseconds kMaxTimeout{15000};

        /**
         * @brief Resolves settings from the loaded config.
         * The credential is read from the environment variable the config names.
         */
        static FetcherSettings from_config(const Config& config);
    };

    /**
     * @class SuggestionFetcher
     * @brief Validates preconditions, builds the prompt, returns the raw reply text.
     *
     * Not cached: deduplication happens one layer up in the orchestrator.
     */
    class SuggestionFetcher {
    public:
        SuggestionFetcher(std::shared_ptr<AssistantClient> client, FetcherSettings settings);

        /**
         * @throws InputError    if `command` is blank.
         * @throws ConfigError   if no credential is configured.
         * @throws UpstreamError on timeout, transport failure or non-success status.
         * @throws FormatError   if the reply envelope lacks the reply field.
         */
        std::string fetch(const std::string& command, const std::string& error_line) const;

        bool has_credential() const;
        const FetcherSettings& settings() const { return settings_; }

        /** @brief The natural-language instruction sent upstream. */
        static std::string build_prompt(const std::string& command, const std::string& error_line);

        /**
         * @brief Maps a program name onto the family it probably belongs to
         * ("mk" -> "mkdir", "py3" -> "python"). Returns the input when unknown.
         */
        static std::string related_command(const std::string& program);

    private:
        std::shared_ptr<AssistantClient> client_;
        FetcherSettings settings_;
    };

}

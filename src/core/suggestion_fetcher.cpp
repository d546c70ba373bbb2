/**
 * @file suggestion_fetcher.cpp
 * @brief Implementation of the assistant fetch step.
 */

#include "core/suggestion_fetcher.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "core/suggestion.hpp"
#include "core/suggestion_parser.hpp"
#include "core/text_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>
#include <utility>

namespace shfix::core {

    FetcherSettings FetcherSettings::from_config(const Config& config) {
        FetcherSettings settings;
        if (const char* key = std::getenv(config.api_key_env.c_str())) {
            settings.api_key = text::trim(key);
        }
        settings.endpoint = config.api_endpoint;
        settings.model = config.model;
        settings.timeout = std::clamp(std::chrono::milliseconds(config.request_timeout_ms), kMinTimeout, kMaxTimeout);
        settings.max_tokens = config.max_tokens > 0 ? config.max_tokens : 150;
        settings.temperature = config.temperature;
        return settings;
    }

    SuggestionFetcher::SuggestionFetcher(std::shared_ptr<AssistantClient> client, FetcherSettings settings)
        : client_(std::move(client)), settings_(std::move(settings)) {
        settings_.timeout = std::clamp(settings_.timeout, FetcherSettings::kMinTimeout, FetcherSettings::kMaxTimeout);
    }

    bool SuggestionFetcher::has_credential() const {
        return !text::trim(settings_.api_key).empty();
    }

    std::string SuggestionFetcher::related_command(const std::string& program) {
        if (program == "mk" || program == "mkd" || program == "mkdi") return "mkdir";
        if (program.find("py") != std::string::npos) return "python";
        if (program.find("node") != std::string::npos || program.find("npm") != std::string::npos) return "node";
        if (program.find("kube") != std::string::npos || program.find("k8s") != std::string::npos) return "kubernetes";
        return program;
    }

    std::string SuggestionFetcher::build_prompt(const std::string& command, const std::string& error_line) {
        std::string program = command.substr(0, command.find(' '));
        std::string related = related_command(program);
        std::string hint = (related != program) ? std::format("Possible related command: {}\n", related) : "";

        return std::format(
            "You are an AI assistant that helps users correct invalid shell commands.\n"
            "Given the user's original command and the shell error message, suggest valid alternative shell commands.\n"
            "\n"
            "User command: {}\n"
            "Error message: {}\n"
            "{}"
            "\n"
            "Respond with multiple corrected shell command suggestions, each followed by a short description. "
            "Use this format exactly:\n"
            "1. <command> {} <description>\n"
            "2. <command> {} <description>\n"
            "\n"
            "Only use the arrow ({}) as the separator between command and description. Do not use any other formats.\n"
            "If the command is valid, respond with: {}\n"
            "Do not add any explanation or markdown.",
            command, error_line, hint,
            kArrowSeparator, kArrowSeparator, kArrowSeparator,
            kValidCommandSentinel);
    }

    std::string SuggestionFetcher::fetch(const std::string& command, const std::string& error_line) const {
        if (text::trim(command).empty()) {
            throw InputError("Empty command passed to the suggestion fetcher");
        }
        if (!has_credential()) {
            throw ConfigError("API key not found. Please configure the API key in your environment.");
        }
        if (!client_) {
            throw ConfigError("No assistant client configured");
        }

        AssistantRequest request;
        request.endpoint = settings_.endpoint;
        request.api_key = settings_.api_key;
        request.model = settings_.model;
        request.prompt = build_prompt(command, error_line);
        request.timeout = settings_.timeout;
        request.max_tokens = settings_.max_tokens;
        request.temperature = settings_.temperature;

        log::debug(std::format("Requesting suggestions for '{}' (timeout {} ms)", command, request.timeout.count()));

        try {
            return text::trim(client_->complete(request));
        } catch (const SuggestionError&) {
            throw;
        } catch (const std::exception& e) {
            throw UpstreamError(std::format("Assistant call failed: {}", e.what()));
        }
    }

}

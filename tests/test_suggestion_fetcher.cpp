/**
 * @file test_suggestion_fetcher.cpp
 * @brief Unit tests for precondition checks, prompt construction and error mapping.
 *
 * The assistant is replaced by a scripted client; nothing touches the network.
 */

#include "test_harness.hpp"
#include "core/errors.hpp"
#include "core/suggestion_fetcher.hpp"
#include <cstdlib>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

using namespace shfix::core;

namespace {

    class ScriptedClient : public AssistantClient {
    public:
        std::function<std::string(const AssistantRequest&)> script;
        int calls = 0;
        AssistantRequest last;

        std::string complete(const AssistantRequest& request) override {
            ++calls;
            last = request;
            return script ? script(request) : std::string();
        }
    };

    FetcherSettings settings_with_key(const std::string& key = "sk-test") {
        FetcherSettings s;
        s.api_key = key;
        return s;
    }
}

// ============================================================================
// Test Cases: Preconditions
// ============================================================================

TEST(test_blank_command_is_input_error) {
    auto client = std::make_shared<ScriptedClient>();
    SuggestionFetcher fetcher(client, settings_with_key());
    ASSERT_THROWS(fetcher.fetch("", "error: x"), InputError, "empty command");
    ASSERT_THROWS(fetcher.fetch("   ", "error: x"), InputError, "blank command");
    ASSERT_EQ(client->calls, 0, "client never called");
    PASS("Blank commands are rejected before any call");
}

TEST(test_missing_key_is_config_error) {
    auto client = std::make_shared<ScriptedClient>();
    SuggestionFetcher fetcher(client, settings_with_key("  "));
    ASSERT_FALSE(fetcher.has_credential(), "whitespace key is no key");
    ASSERT_THROWS(fetcher.fetch("mk", "zsh: command not found: mk"), ConfigError, "no credential");
    ASSERT_EQ(client->calls, 0, "client never called");
    PASS("Missing credential fails without a network call");
}

// ============================================================================
// Test Cases: Calls
// ============================================================================

TEST(test_successful_fetch_passes_request_through) {
    auto client = std::make_shared<ScriptedClient>();
    client->script = [](const AssistantRequest&) { return std::string("\n1. mkdir x \xE2\x86\x92 Create x\n  "); };

    FetcherSettings s = settings_with_key();
    s.model = "test/model";
    s.max_tokens = 99;
    SuggestionFetcher fetcher(client, s);

    std::string reply = fetcher.fetch("mk", "zsh: command not found: mk");
    ASSERT_EQ(reply, std::string("1. mkdir x \xE2\x86\x92 Create x"), "reply trimmed");
    ASSERT_EQ(client->calls, 1, "one call");
    ASSERT_EQ(client->last.api_key, std::string("sk-test"), "key forwarded");
    ASSERT_EQ(client->last.model, std::string("test/model"), "model forwarded");
    ASSERT_EQ(client->last.max_tokens, 99, "max tokens forwarded");
    ASSERT_TRUE(client->last.prompt.find("User command: mk") != std::string::npos, "prompt carries the command");
    PASS("Request fields reach the client");
}

TEST(test_client_failures_map_to_upstream_error) {
    auto client = std::make_shared<ScriptedClient>();
    SuggestionFetcher fetcher(client, settings_with_key());

    client->script = [](const AssistantRequest&) -> std::string { throw std::runtime_error("connection reset"); };
    ASSERT_THROWS(fetcher.fetch("ls", "error: x"), UpstreamError, "foreign exception wrapped");

    client->script = [](const AssistantRequest&) -> std::string { throw FormatError("no choices"); };
    bool format_kept = false;
    try {
        fetcher.fetch("ls", "error: x");
    } catch (const FormatError&) {
        format_kept = true;
    } catch (const UpstreamError&) {
    }
    ASSERT_TRUE(format_kept, "FormatError passes through unchanged");
    PASS("Client failures surface as UpstreamError");
}

TEST(test_timeout_is_clamped) {
    auto client = std::make_shared<ScriptedClient>();
    FetcherSettings s = settings_with_key();
    s.timeout = std::chrono::milliseconds(60000);
    SuggestionFetcher fetcher(client, s);
    ASSERT_EQ(fetcher.settings().timeout.count(), 15000, "upper bound");

    s.timeout = std::chrono::milliseconds(10);
    SuggestionFetcher fast(client, s);
    ASSERT_EQ(fast.settings().timeout.count(), 1000, "lower bound");
    PASS("Timeout stays within [1000, 15000] ms");
}

TEST(test_settings_from_config) {
    Config config;
    config.api_key_env = "SHFIX_TEST_API_KEY";
    config.request_timeout_ms = 500;
    config.model = "some/model";
    setenv("SHFIX_TEST_API_KEY", "  sk-env  ", 1);

    FetcherSettings s = FetcherSettings::from_config(config);
    ASSERT_EQ(s.api_key, std::string("sk-env"), "key read from environment and trimmed");
    ASSERT_EQ(s.timeout.count(), 1000, "timeout clamped");
    ASSERT_EQ(s.model, std::string("some/model"), "model copied");

    unsetenv("SHFIX_TEST_API_KEY");
    FetcherSettings none = FetcherSettings::from_config(config);
    ASSERT_TRUE(none.api_key.empty(), "unset variable means no key");
    PASS("Settings resolve from config and environment");
}

// ============================================================================
// Test Cases: Prompt
// ============================================================================

TEST(test_prompt_contents) {
    std::string prompt = SuggestionFetcher::build_prompt("mk", "zsh: command not found: mk");
    ASSERT_TRUE(prompt.find("User command: mk\n") != std::string::npos, "command line");
    ASSERT_TRUE(prompt.find("Error message: zsh: command not found: mk\n") != std::string::npos, "error line");
    ASSERT_TRUE(prompt.find("Possible related command: mkdir") != std::string::npos, "related hint");
    ASSERT_TRUE(prompt.find("1. <command> \xE2\x86\x92 <description>") != std::string::npos, "arrow format");
    ASSERT_TRUE(prompt.find("Command is valid. No suggestions needed.") != std::string::npos, "sentinel");

    std::string plain = SuggestionFetcher::build_prompt("git stauts", "git: 'stauts' is not a git command");
    ASSERT_TRUE(plain.find("Possible related command") == std::string::npos, "no hint for unrelated programs");
    PASS("Prompt names command, error, format and sentinel");
}

TEST(test_related_command) {
    ASSERT_EQ(SuggestionFetcher::related_command("mk"), std::string("mkdir"), "mk");
    ASSERT_EQ(SuggestionFetcher::related_command("py3"), std::string("python"), "py3");
    ASSERT_EQ(SuggestionFetcher::related_command("nodejs"), std::string("node"), "nodejs");
    ASSERT_EQ(SuggestionFetcher::related_command("kubectl"), std::string("kubernetes"), "kubectl");
    ASSERT_EQ(SuggestionFetcher::related_command("git"), std::string("git"), "unknown kept");
    PASS("Program families are recognised");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    print_banner("shfix Suggestion Fetcher Tests");

    std::cout << "\n[Precondition Tests]" << std::endl;
    test_blank_command_is_input_error();
    test_missing_key_is_config_error();

    std::cout << "\n[Call Tests]" << std::endl;
    test_successful_fetch_passes_request_through();
    test_client_failures_map_to_upstream_error();
    test_timeout_is_clamped();
    test_settings_from_config();

    std::cout << "\n[Prompt Tests]" << std::endl;
    test_prompt_contents();
    test_related_command();

    return print_summary();
}

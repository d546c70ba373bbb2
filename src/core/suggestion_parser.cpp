/**
 * @file suggestion_parser.cpp
 * @brief Implementation of the multi-format suggestion parser.
 *
 * Strategy order (first match wins per line):
 * 1. numbered arrow  2. numbered colon  3. numbered hyphen  4. numbered quoted
 * 5. tilde           6. tilde anywhere  7. numbered last resort
 * If nothing matched at all, a final sweep tries known program names on every line.
 */

#include "core/suggestion_parser.hpp"
#include "core/text_utils.hpp"
#include <array>
#include <regex>
#include <vector>

namespace shfix::core {

    namespace parse_strategies {

        namespace {

            const std::regex& numbered_re() {
                static const std::regex re(R"(^\s*\d+\.\s+(.*)$)");
                return re;
            }

            const std::regex& label_re() {
                static const std::regex re(R"(^[\w-]+:\s+)");
                return re;
            }

            bool is_quote(char c) { return c == '`' || c == '\'' || c == '"'; }

            std::string strip_surrounding_quotes(std::string s) {
                while (s.size() >= 2 && is_quote(s.front()) && is_quote(s.back())) {
                    s = text::trim(std::string_view(s).substr(1, s.size() - 2));
                }
                return s;
            }

            /** @brief Body of a numbered line ("3. foo" -> "foo"), or nullopt. */
            std::optional<std::string> numbered_body(std::string_view line) {
                std::string s(line);
                std::smatch m;
                if (!std::regex_match(s, m, numbered_re())) return std::nullopt;
                return text::trim(m[1].str());
            }

            std::optional<Suggestion> make(std::string_view raw_command, std::string_view raw_description) {
                std::string command = clean_command(raw_command);
                if (command.empty()) return std::nullopt;

                std::string description = strip_surrounding_quotes(text::trim(raw_description));
                if (description.empty()) description = kDefaultDescription;
                return Suggestion{std::move(command), std::move(description)};
            }

            /** @brief Two-group regex matcher shared by the numbered strategies. */
            std::optional<Suggestion> match_pair(std::string_view line, const std::regex& re) {
                std::string s(line);
                std::smatch m;
                if (!std::regex_match(s, m, re)) return std::nullopt;
                if (text::trim(m[2].str()).empty()) return std::nullopt;
                return make(m[1].str(), m[2].str());
            }

            std::optional<Suggestion> split_at_whitespace(const std::string& body) {
                const auto ws = body.find_first_of(" \t");
                if (ws == std::string::npos) return make(body, "");
                return make(body.substr(0, ws), body.substr(ws + 1));
            }

            bool starts_with_known_program(const std::string& body) {
                static const std::regex re(
                    R"(^(git|node|npm|python3?|pip3?|cd|ls|mkdir|rm|cp|mv|echo|cat|ssh|curl|wget|docker|kubectl)(\s|$))",
                    std::regex::icase);
                return std::regex_search(body, re);
            }
        }

        std::string clean_command(std::string_view raw) {
            std::string command = strip_surrounding_quotes(text::trim(raw));
            command = std::regex_replace(command, label_re(), "", std::regex_constants::format_first_only);
            return strip_surrounding_quotes(text::trim(command));
        }

        std::optional<Suggestion> numbered_arrow(std::string_view line) {
            auto body = numbered_body(line);
            if (!body) return std::nullopt;

            const auto sep = body->find(kArrowSeparator);
            if (sep == std::string::npos) return std::nullopt;

            std::string description = text::trim(std::string_view(*body).substr(sep + kArrowSeparator.size()));
            if (description.empty()) return std::nullopt;
            return make(std::string_view(*body).substr(0, sep), description);
        }

        std::optional<Suggestion> numbered_colon(std::string_view line) {
            static const std::regex re(R"(^\s*\d+\.\s+([^:]+):\s*(.+)$)");
            return match_pair(line, re);
        }

        std::optional<Suggestion> numbered_hyphen(std::string_view line) {
            static const std::regex re(R"(^\s*\d+\.\s+(.+?)\s+-\s+(.+)$)");
            return match_pair(line, re);
        }

        std::optional<Suggestion> numbered_quoted(std::string_view line) {
            static const std::regex re(R"(^\s*\d+\.\s+[`'"](.*?)[`'"] +-+ (.+)$)");
            return match_pair(line, re);
        }

        std::optional<Suggestion> tilde(std::string_view line) {
            static const std::regex re(R"(^(?:\s*\d+\.\s+)?(.+?)\s*~\s*(.+)$)");
            return match_pair(line, re);
        }

        std::optional<Suggestion> tilde_anywhere(std::string_view line) {
            const auto pos = line.find('~');
            if (pos == std::string_view::npos || pos == 0) return std::nullopt;
            return make(line.substr(0, pos), line.substr(pos + 1));
        }

        std::optional<Suggestion> numbered_last_resort(std::string_view line) {
            auto body = numbered_body(line);
            if (!body || body->empty()) return std::nullopt;

            if (starts_with_known_program(*body)) return split_at_whitespace(*body);
            return make(*body, "");
        }

        std::optional<Suggestion> known_program(std::string_view line) {
            std::string body = numbered_body(line).value_or(text::trim(line));
            if (!starts_with_known_program(body)) return std::nullopt;
            return split_at_whitespace(body);
        }
    }

    SuggestionBatch SuggestionParser::parse(std::string_view reply) const {
        using namespace parse_strategies;

        if (reply.find(kValidCommandSentinel) != std::string_view::npos) {
            return {Suggestion{kValidCommandSentinel, ""}};
        }

        std::vector<std::string> lines;
        size_t start = 0;
        while (start <= reply.size()) {
            size_t end = reply.find('\n', start);
            if (end == std::string_view::npos) end = reply.size();
            std::string line(reply.substr(start, end - start));
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            start = end + 1;
        }

        static constexpr std::array<Matcher, 6> kPrimary = {
            numbered_arrow, numbered_colon, numbered_hyphen, numbered_quoted, tilde, tilde_anywhere,
        };

        SuggestionBatch batch;
        for (const auto& line : lines) {
            if (text::trim(line).empty()) continue;

            bool matched = false;
            for (Matcher matcher : kPrimary) {
                if (auto suggestion = matcher(line)) {
                    batch.push_back(std::move(*suggestion));
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                if (auto suggestion = numbered_last_resort(line)) batch.push_back(std::move(*suggestion));
            }
        }

        // Final sweep: nothing recognised, look for bare command lines anywhere
        if (batch.empty()) {
            for (const auto& line : lines) {
                if (auto suggestion = known_program(line)) batch.push_back(std::move(*suggestion));
            }
        }

        return batch;
    }

}

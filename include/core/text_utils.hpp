/**
 * @file text_utils.hpp
 * @brief String helpers shared by the classifier, tracker and parser.
 *
 * Terminal output arrives with ANSI colour codes, OSC title updates and
 * carriage-return redraws mixed into the text. These helpers reduce it to
 * plain lines that can be matched and shown to the user.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace shfix::core::text {

    constexpr char kEsc = '\x1b';
    constexpr char kBell = '\x07';

    /** @brief Removes leading and trailing whitespace (space, tab, CR, LF). */
    inline std::string trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return "";
        const auto last = s.find_last_not_of(" \t\r\n");
        return std::string(s.substr(first, last - first + 1));
    }

    inline std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    /** @brief Case-insensitive substring test (ASCII only). */
    inline bool contains_icase(std::string_view haystack, std::string_view needle) {
        return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
    }

    /**
     * @brief Strips ANSI escape sequences and stray control bytes.
     *
     * State machine: 0=text, 1=ESC, 2=CSI, 3=OSC, 4=OSC saw ESC.
     * CSI ends on a final byte in 0x40-0x7E, OSC ends on BEL or ESC '\'.
     * Tabs, CR and LF survive so line splitting still works afterwards.
     */
    inline std::string strip_ansi(std::string_view s) {
        std::string result;
        result.reserve(s.size());
        int state = 0;
        for (char c : s) {
            const auto u = static_cast<unsigned char>(c);
            switch (state) {
                case 1:
                    if (c == '[') state = 2;
                    else if (c == ']') state = 3;
                    else state = 0; // two-byte sequence (ESC =, ESC (, ...)
                    continue;
                case 2:
                    if (u >= 0x40 && u <= 0x7E) state = 0;
                    continue;
                case 3:
                    if (c == kBell) state = 0;
                    else if (c == kEsc) state = 4;
                    continue;
                case 4:
                    state = (c == '\\') ? 0 : 3;
                    continue;
                default:
                    break;
            }
            if (c == kEsc) {
                state = 1;
            } else if (c == '\t' || c == '\r' || c == '\n' || (u >= 0x20 && u != 0x7F)) {
                result += c;
            }
        }
        return result;
    }

    /**
     * @brief Splits text into trimmed, non-blank lines.
     * Both CR and LF terminate a line, which covers "\n", "\r\n" and
     * carriage-return redraws alike.
     */
    inline std::vector<std::string> split_lines(std::string_view s) {
        std::vector<std::string> lines;
        size_t start = 0;
        for (size_t i = 0; i <= s.size(); ++i) {
            if (i == s.size() || s[i] == '\n' || s[i] == '\r') {
                std::string line = trim(s.substr(start, i - start));
                if (!line.empty()) lines.push_back(std::move(line));
                start = i + 1;
            }
        }
        return lines;
    }

}

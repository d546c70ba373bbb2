/**
 * @file output_classifier.cpp
 * @brief Implementation of the failure-signal classifier.
 */

#include "core/output_classifier.hpp"
#include "core/text_utils.hpp"
#include <utility>

namespace shfix::core {

    namespace {

        constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

        // Specific families first: the first matching pattern names the kind,
        // so "zsh: command not found: mk" is CommandNotFound, never Generic.
        const std::vector<std::pair<FailureKind, const char*>>& builtin_patterns() {
            static const std::vector<std::pair<FailureKind, const char*>> patterns = {
                {FailureKind::CommandNotFound,   R"(command not found)"},
                {FailureKind::PermissionDenied,  R"(permission denied)"},
                {FailureKind::NoSuchFile,        R"(no such file or directory)"},
                {FailureKind::CannotAccess,      R"(cannot access)"},
                {FailureKind::NotADirectory,     R"(not a directory)"},
                {FailureKind::BadOption,         R"(bad option)"},                 // also "/path/to/node: bad option: -ver"
                {FailureKind::UnknownOption,     R"((unknown|unrecognized|invalid|illegal) (option|flag))"},
                {FailureKind::UnknownOption,     R"(bad flag)"},
                {FailureKind::NotRecognized,     R"((unknown|unrecognized) command)"},
                {FailureKind::NotRecognized,     R"(not recognized)"},
                {FailureKind::SyntaxError,       R"(syntax error)"},
                {FailureKind::SegmentationFault, R"(segmentation fault)"},
                {FailureKind::RuntimeError,      R"(ModuleNotFoundError|ImportError|AttributeError|NameError)"},
                {FailureKind::RuntimeError,      R"(cannot find module)"},
                {FailureKind::RuntimeError,      R"(python[0-9.]*:.*error)"},
                {FailureKind::Traceback,         R"(traceback|exception)"},
                {FailureKind::Generic,           R"(error:)"},
                {FailureKind::Generic,           R"(failed:)"},
            };
            return patterns;
        }
    }

    const char* to_string(FailureKind kind) {
        switch (kind) {
            case FailureKind::CommandNotFound:   return "command-not-found";
            case FailureKind::PermissionDenied:  return "permission-denied";
            case FailureKind::NoSuchFile:        return "no-such-file";
            case FailureKind::CannotAccess:      return "cannot-access";
            case FailureKind::NotADirectory:     return "not-a-directory";
            case FailureKind::BadOption:         return "bad-option";
            case FailureKind::UnknownOption:     return "unknown-option";
            case FailureKind::NotRecognized:     return "not-recognized";
            case FailureKind::SyntaxError:       return "syntax-error";
            case FailureKind::SegmentationFault: return "segfault";
            case FailureKind::RuntimeError:      return "runtime-error";
            case FailureKind::Traceback:         return "traceback";
            case FailureKind::Generic:           return "generic";
        }
        return "generic";
    }

    OutputClassifier::OutputClassifier() {
        for (const auto& [kind, expr] : builtin_patterns()) {
            patterns_.push_back({kind, std::regex(expr, kFlags)});
        }
    }

    void OutputClassifier::add_pattern(const std::string& expression, FailureKind kind) {
        patterns_.push_back({kind, std::regex(expression, kFlags)});
    }

    std::optional<FailureKind> OutputClassifier::match_kind(const std::string& text) const {
        for (const auto& pattern : patterns_) {
            if (std::regex_search(text, pattern.re)) return pattern.kind;
        }
        return std::nullopt;
    }

    std::optional<Evidence> OutputClassifier::classify(std::string_view chunk) const {
        if (chunk.empty()) return std::nullopt;

        const std::string clean = text::strip_ansi(chunk);

        // 1. Fast reject on the whole chunk
        if (!match_kind(clean)) return std::nullopt;

        // 2. First matching line is the evidence. A match that only exists across
        //    a line break yields no evidence and counts as a non-failure.
        for (auto& line : text::split_lines(clean)) {
            if (auto kind = match_kind(line)) {
                return Evidence{std::move(line), *kind};
            }
        }
        return std::nullopt;
    }

}

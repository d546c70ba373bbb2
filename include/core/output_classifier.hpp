/**
 * @file output_classifier.hpp
 * @brief Detects failure signals in streamed shell output.
 */

#pragma once
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace shfix::core {

    /** @brief Family of the failure pattern that matched. */
    enum class FailureKind {
        CommandNotFound,
        PermissionDenied,
        NoSuchFile,
        CannotAccess,
        NotADirectory,
        BadOption,
        UnknownOption,
        NotRecognized,
        SyntaxError,
        SegmentationFault,
        RuntimeError,
        Traceback,
        Generic
    };

    const char* to_string(FailureKind kind);

    /** @brief The single line of output chosen as proof of failure. */
    struct Evidence {
        std::string line;
        FailureKind kind = FailureKind::Generic;
    };

    /**
     * @class OutputClassifier
     * @brief Ordered, case-insensitive failure patterns applied per chunk.
     *
     * The whole (ANSI-stripped) chunk is tested first as a fast reject. On a hit,
     * lines are scanned in order and the first line that matches any pattern is
     * the evidence; its kind is the first pattern in list order that matches it.
     */
    class OutputClassifier {
    public:
        /** @brief Builds the classifier with the built-in pattern set. */
        OutputClassifier();

        /**
         * @brief Appends a user pattern (lowest priority).
         * @throws std::regex_error if the expression does not compile.
         */
        void add_pattern(const std::string& expression, FailureKind kind = FailureKind::Generic);

        std::optional<Evidence> classify(std::string_view chunk) const;

        size_t pattern_count() const { return patterns_.size(); }

    private:
        struct Pattern {
            FailureKind kind;
            std::regex re;
        };

        std::optional<FailureKind> match_kind(const std::string& text) const;

        std::vector<Pattern> patterns_;
    };

}

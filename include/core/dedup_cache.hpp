/**
 * @file dedup_cache.hpp
 * @brief Suppresses repeat suggestion requests for the same failure.
 */

#pragma once
#include <chrono>
#include <compare>
#include <cstdint>
#include <deque>
#include <set>
#include <string>

namespace shfix::core {

    /** @brief (command, error line, time bucket). Equal keys describe the same failure. */
    struct DedupKey {
        std::string command;
        std::string error_line;
        std::int64_t bucket = 0;

        auto operator<=>(const DedupKey&) const = default;
    };

    /**
     * @class DedupCache
     * @brief Per-session record of already-handled failures.
     *
     * Keys expire implicitly when the time bucket rolls over. The owner purges
     * a command's keys when the command changes, and a hard cap evicts the
     * oldest keys so long sessions stay bounded.
     */
    class DedupCache {
    public:
        using TimePoint = std::chrono::system_clock::time_point;

        static constexpr std::chrono::seconds kDefaultWindow{30};
        static constexpr size_t kDefaultMaxKeys = 256;

        explicit DedupCache(std::chrono::seconds window = kDefaultWindow,
                            size_t max_keys = kDefaultMaxKeys);

        /**
         * @brief Tests and records a failure.
         * @return false if the key was already recorded, otherwise records it and returns true.
         */
        bool should_process(const std::string& command, const std::string& error_line, TimePoint now);

        /** @brief Drops every key whose command equals `command`. @return number removed. */
        size_t purge_command(const std::string& command);

        void clear();

        std::int64_t bucket_of(TimePoint now) const;
        size_t size() const { return keys_.size(); }
        std::chrono::seconds window() const { return window_; }

    private:
        std::chrono::seconds window_;
        size_t max_keys_;
        std::set<DedupKey> keys_;
        std::deque<DedupKey> insertion_order_;
    };

}

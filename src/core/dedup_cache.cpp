/**
 * @file dedup_cache.cpp
 * @brief Implementation of the time-bucketed dedup cache.
 */

#include "core/dedup_cache.hpp"
#include <algorithm>

namespace shfix::core {

    DedupCache::DedupCache(std::chrono::seconds window, size_t max_keys)
        : window_(window.count() > 0 ? window : kDefaultWindow),
          max_keys_(max_keys == 0 ? kDefaultMaxKeys : max_keys) {}

    std::int64_t DedupCache::bucket_of(TimePoint now) const {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        const auto width = window_.count();
        // Floor division, also for pre-epoch instants
        std::int64_t bucket = secs / width;
        if (secs % width != 0 && secs < 0) --bucket;
        return bucket;
    }

    bool DedupCache::should_process(const std::string& command, const std::string& error_line, TimePoint now) {
        DedupKey key{command, error_line, bucket_of(now)};
        if (keys_.contains(key)) return false;

        keys_.insert(key);
        insertion_order_.push_back(std::move(key));

        while (keys_.size() > max_keys_ && !insertion_order_.empty()) {
            keys_.erase(insertion_order_.front());
            insertion_order_.pop_front();
        }
        return true;
    }

    size_t DedupCache::purge_command(const std::string& command) {
        const size_t removed = std::erase_if(keys_, [&](const DedupKey& k) { return k.command == command; });
        if (removed > 0) {
            std::erase_if(insertion_order_, [&](const DedupKey& k) { return k.command == command; });
        }
        return removed;
    }

    void DedupCache::clear() {
        keys_.clear();
        insertion_order_.clear();
    }

}

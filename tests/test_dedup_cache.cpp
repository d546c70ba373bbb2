/**
 * @file test_dedup_cache.cpp
 * @brief Unit tests for the time-bucketed failure dedup cache.
 */

#include "test_harness.hpp"
#include "core/dedup_cache.hpp"
#include <chrono>
#include <string>

using shfix::core::DedupCache;
using namespace std::chrono_literals;

namespace {
    // Fixed instant aligned on a 30 s boundary (1'700'000'010 = 56'666'667 * 30)
    DedupCache::TimePoint at(std::chrono::seconds offset) {
        return DedupCache::TimePoint(std::chrono::seconds(1'700'000'010) + offset);
    }
}

TEST(test_same_failure_same_bucket) {
    DedupCache cache;
    ASSERT_TRUE(cache.should_process("mk", "zsh: command not found: mk", at(0s)), "first occurrence processed");
    ASSERT_FALSE(cache.should_process("mk", "zsh: command not found: mk", at(5s)), "repeat suppressed");
    ASSERT_FALSE(cache.should_process("mk", "zsh: command not found: mk", at(29s)), "still same bucket");
    ASSERT_EQ(cache.size(), 1u, "one key");
    PASS("Repeats inside the window are suppressed");
}

TEST(test_next_bucket_processes_again) {
    DedupCache cache;
    ASSERT_TRUE(cache.should_process("mk", "err", at(29s)), "first occurrence");
    ASSERT_TRUE(cache.should_process("mk", "err", at(30s)), "bucket rolled over");
    ASSERT_EQ(cache.size(), 2u, "both buckets recorded");
    PASS("A new bucket allows a new request");
}

TEST(test_key_components_are_distinct) {
    DedupCache cache;
    ASSERT_TRUE(cache.should_process("mk", "err A", at(0s)), "A");
    ASSERT_TRUE(cache.should_process("mk", "err B", at(0s)), "different line");
    ASSERT_TRUE(cache.should_process("mkdir", "err A", at(0s)), "different command");
    PASS("Command and line both take part in the key");
}

TEST(test_purge_is_scoped_to_command) {
    DedupCache cache;
    cache.should_process("mk", "err A", at(0s));
    cache.should_process("mk", "err B", at(0s));
    cache.should_process("ls x", "err C", at(0s));

    ASSERT_EQ(cache.purge_command("mk"), 2u, "both mk keys removed");
    ASSERT_EQ(cache.size(), 1u, "other command kept");
    ASSERT_TRUE(cache.should_process("mk", "err A", at(1s)), "purged key processes again");
    ASSERT_FALSE(cache.should_process("ls x", "err C", at(1s)), "unrelated key still suppresses");
    ASSERT_EQ(cache.purge_command("nothing"), 0u, "unknown command purges nothing");
    PASS("purge_command only touches its command");
}

TEST(test_max_keys_evicts_oldest) {
    DedupCache cache(30s, 3);
    cache.should_process("a", "e", at(0s));
    cache.should_process("b", "e", at(0s));
    cache.should_process("c", "e", at(0s));
    cache.should_process("d", "e", at(0s));
    ASSERT_EQ(cache.size(), 3u, "bounded");
    ASSERT_TRUE(cache.should_process("a", "e", at(0s)), "oldest key was evicted");
    ASSERT_FALSE(cache.should_process("d", "e", at(0s)), "newest key retained");
    PASS("Hard cap evicts in insertion order");
}

TEST(test_bucket_floor) {
    DedupCache cache(30s);
    ASSERT_EQ(cache.bucket_of(DedupCache::TimePoint(59s)), 1, "59 s in bucket 1");
    ASSERT_EQ(cache.bucket_of(DedupCache::TimePoint(60s)), 2, "60 s in bucket 2");
    ASSERT_EQ(cache.bucket_of(DedupCache::TimePoint(-1s)), -1, "pre-epoch floors down");
    PASS("Bucket index is floor(seconds / window)");
}

TEST(test_clear_and_invalid_settings) {
    DedupCache cache(0s, 0);
    ASSERT_TRUE(cache.window() == DedupCache::kDefaultWindow, "zero window falls back to default");
    cache.should_process("x", "e", at(0s));
    cache.clear();
    ASSERT_EQ(cache.size(), 0u, "cleared");
    ASSERT_TRUE(cache.should_process("x", "e", at(0s)), "processed after clear");
    PASS("clear() forgets everything");
}

int main() {
    print_banner("shfix Dedup Cache Tests");

    std::cout << "\n[Window Tests]" << std::endl;
    test_same_failure_same_bucket();
    test_next_bucket_processes_again();
    test_key_components_are_distinct();
    test_bucket_floor();

    std::cout << "\n[Maintenance Tests]" << std::endl;
    test_purge_is_scoped_to_command();
    test_max_keys_evicts_oldest();
    test_clear_and_invalid_settings();

    return print_summary();
}

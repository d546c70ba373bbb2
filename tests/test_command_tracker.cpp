/**
 * @file test_command_tracker.cpp
 * @brief Unit tests for keystroke reconstruction and recent-command history.
 *
 * @note Standalone: links shfix_core only, no PTY or Python.
 */

#include "test_harness.hpp"
#include "core/command_tracker.hpp"
#include <string>

using shfix::core::CommandTracker;
using shfix::core::RecentCommands;

// ============================================================================
// Test Cases: Keystrokes
// ============================================================================

TEST(test_enter_submits_trimmed_command) {
    CommandTracker t;
    auto out = t.feed("  ls -la  \r");
    ASSERT_EQ(out.size(), 1u, "one submission");
    ASSERT_EQ(out[0].command, std::string("ls -la"), "trimmed command");
    ASSERT_EQ(t.last_command(), std::string("ls -la"), "last command updated");
    ASSERT_TRUE(t.buffer().empty(), "buffer reset after Enter");
    PASS("Enter submits the trimmed buffer");
}

TEST(test_blank_enter_is_ignored) {
    CommandTracker t;
    t.feed("pwd\r");
    auto out = t.feed("   \r\r");
    ASSERT_TRUE(out.empty(), "no submission for blank lines");
    ASSERT_EQ(t.last_command(), std::string("pwd"), "last command kept");
    ASSERT_EQ(t.history().size(), 1u, "history unchanged");
    PASS("Blank Enter registers nothing");
}

TEST(test_backspace_and_ctrl_c) {
    CommandTracker t;
    t.feed("gti");
    t.feed("\x7f\x7f");
    t.feed("it");
    ASSERT_EQ(t.buffer(), std::string("git"), "DEL removes last characters");

    t.feed("\x08");
    ASSERT_EQ(t.buffer(), std::string("gi"), "Ctrl-H behaves like DEL");

    t.feed("\x03");
    ASSERT_TRUE(t.buffer().empty(), "Ctrl-C clears buffer");
    ASSERT_TRUE(t.last_command().empty(), "Ctrl-C registers no command");

    t.feed("\x7f");
    ASSERT_TRUE(t.buffer().empty(), "Backspace on empty buffer is a no-op");
    PASS("Backspace and Ctrl-C edit the buffer");
}

TEST(test_backspace_removes_whole_utf8_character) {
    CommandTracker t;
    t.feed("echo \xC3\xA9");     // "echo é"
    t.feed("\x7f");
    ASSERT_EQ(t.buffer(), std::string("echo "), "two-byte character removed at once");
    PASS("Backspace is UTF-8 aware");
}

TEST(test_escape_sequences_are_ignored) {
    CommandTracker t;
    t.feed("ls\x1b[A\x1b[D -l\x1bOB\r");
    ASSERT_EQ(t.last_command(), std::string("ls -l"), "CSI and SS3 sequences dropped");

    // Sequence split across two reads
    t.feed("cat\x1b[");
    t.feed("1;5Cfile\r");
    ASSERT_EQ(t.last_command(), std::string("catfile"), "split CSI dropped");

    // OSC reply terminated by BEL
    t.feed("\x1b]11;rgb:0000/0000/0000\x07" "pwd\r");
    ASSERT_EQ(t.last_command(), std::string("pwd"), "OSC dropped");
    PASS("Escape sequences never reach the buffer");
}

TEST(test_changed_flag_and_previous) {
    CommandTracker t;
    auto a = t.feed("mk\r");
    ASSERT_TRUE(a[0].changed, "first command counts as changed");
    ASSERT_TRUE(a[0].previous.empty(), "no previous command");

    auto b = t.feed("mk\r");
    ASSERT_FALSE(b[0].changed, "same command is not a change");

    auto c = t.feed("mkdir x\r");
    ASSERT_TRUE(c[0].changed, "different command is a change");
    ASSERT_EQ(c[0].previous, std::string("mk"), "previous carried");
    PASS("Submissions report command changes");
}

TEST(test_multiple_submissions_in_one_read) {
    CommandTracker t;
    auto out = t.feed("cd /tmp\rls\r");
    ASSERT_EQ(out.size(), 2u, "two submissions");
    ASSERT_EQ(out[0].command, std::string("cd /tmp"), "first in order");
    ASSERT_EQ(out[1].command, std::string("ls"), "second in order");
    PASS("Pasted multi-line input yields ordered submissions");
}

TEST(test_partial_command_never_enters_history) {
    CommandTracker t;
    t.feed("git status\r");
    t.feed("git st");
    for (int i = 0; i < 6; ++i) t.feed("\x7f");
    t.feed("\r");
    ASSERT_EQ(t.history().size(), 1u, "only the submitted command is recorded");
    ASSERT_EQ(t.history().entries().front(), std::string("git status"), "entry is the full command");
    PASS("Backspace-cleared input adds no history entry");
}

// ============================================================================
// Test Cases: Recent Commands
// ============================================================================

TEST(test_history_capacity_and_dedup) {
    RecentCommands h(10);
    for (int i = 0; i < 12; ++i) h.remember("cmd" + std::to_string(i));
    ASSERT_EQ(h.size(), 10u, "capacity enforced");
    ASSERT_EQ(h.entries().front(), std::string("cmd2"), "oldest evicted first");
    ASSERT_EQ(h.entries().back(), std::string("cmd11"), "newest at the back");

    ASSERT_FALSE(h.remember("cmd5"), "duplicate rejected");
    ASSERT_FALSE(h.remember("   "), "blank rejected");
    ASSERT_EQ(h.size(), 10u, "size unchanged");
    PASS("History is bounded and duplicate-free");
}

TEST(test_find_program) {
    RecentCommands h;
    h.remember("mkdirx");
    h.remember("mk -p build");
    ASSERT_EQ(h.find_program("mk").value_or(""), std::string("mk -p build"), "prefix with space matches");
    ASSERT_FALSE(h.find_program("mkd").has_value(), "partial word does not match");
    ASSERT_FALSE(h.find_program("").has_value(), "empty program never matches");
    PASS("find_program matches whole program names");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    print_banner("shfix Command Tracker Tests");

    std::cout << "\n[Keystroke Tests]" << std::endl;
    test_enter_submits_trimmed_command();
    test_blank_enter_is_ignored();
    test_backspace_and_ctrl_c();
    test_backspace_removes_whole_utf8_character();
    test_escape_sequences_are_ignored();
    test_changed_flag_and_previous();
    test_multiple_submissions_in_one_read();
    test_partial_command_never_enters_history();

    std::cout << "\n[History Tests]" << std::endl;
    test_history_capacity_and_dedup();
    test_find_program();

    return print_summary();
}

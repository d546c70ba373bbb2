/**
 * @file log.hpp
 * @brief Bracket-style diagnostics ("[-] message") on stderr.
 *
 * Debug lines are off unless enabled by config (DEBUG = True) or by the
 * SHFIX_DEBUG=1 environment variable. Safe to call from any thread.
 */

#pragma once
#include <string_view>

namespace shfix::core::log {

    void set_debug(bool enabled);

    void debug(std::string_view message);
    void notice(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

}

/**
 * @file log.cpp
 * @brief Implementation of the stderr diagnostics channel.
 */

#include "core/log.hpp"
#include "core/command_handlers.hpp"
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>

namespace shfix::core::log {

    namespace {
        bool env_debug() {
            const char* v = std::getenv("SHFIX_DEBUG");
            return v && std::string(v) == "1";
        }

        std::atomic<bool> g_debug{env_debug()};
        std::mutex g_log_mutex;

        void write_line(const std::string& color, std::string_view tag, std::string_view message) {
            std::lock_guard<std::mutex> lock(g_log_mutex);
            // Raw-mode terminal: CR before and CRLF after keeps lines flush left
            std::cerr << "\r[" << color << tag << handlers::Theme::RESET << "] " << message << "\r\n" << std::flush;
        }
    }

    void set_debug(bool enabled) {
        g_debug = enabled || env_debug();
    }

    void debug(std::string_view message) {
        if (!g_debug) return;
        write_line(handlers::Theme::STRUCTURE, "DEBUG", message);
    }

    void notice(std::string_view message) { write_line(handlers::Theme::NOTICE, "-", message); }
    void warn(std::string_view message) { write_line(handlers::Theme::WARNING, "WARN", message); }
    void error(std::string_view message) { write_line(handlers::Theme::ERROR, "-", message); }

}

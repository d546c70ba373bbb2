/**
 * @file help_text.hpp
 * @brief Text shown by the :help internal command.
 */

#pragma once
#include "core/command_handlers.hpp"
#include <string>

namespace shfix::core {

    inline std::string get_help_text() {
        using handlers::Theme;
        auto cmd = [](const char* name, const char* desc) {
            return "  " + Theme::VALUE + name + Theme::RESET + "  " + Theme::TEXT + desc + Theme::RESET + "\r\n";
        };

        std::string out;
        out += Theme::STRUCTURE + "[" + Theme::UNIT + "shfix" + Theme::STRUCTURE + "]" + Theme::RESET
             + " Internal commands (type at an empty prompt):\r\n";
        out += cmd(":fix <n>     ", "Run suggestion <n> from the latest list");
        out += cmd(":fix         ", "Show the latest suggestions again");
        out += cmd(":suggestions ", "Show the latest suggestions again");
        out += cmd(":history     ", "List the recent commands shfix has seen");
        out += cmd(":help        ", "Show this help");
        out += cmd(":q, :exit    ", "End the session");
        out += "\r\n";
        out += Theme::STRUCTURE + "Failed commands are detected automatically; suggestions appear below the error." + Theme::RESET + "\r\n";
        return out;
    }

}

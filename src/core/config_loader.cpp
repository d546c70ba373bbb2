/**
 * @file config_loader.cpp
 * @brief Reflects config.py attributes into Config and the Theme palette.
 */

#include "core/config_loader.hpp"
#include "core/config.hpp"
#include "core/command_handlers.hpp" // For Theme
#include "core/log.hpp"
#include <pybind11/embed.h>
#include <pybind11/stl.h> // For casting vector/map
#include <filesystem>
#include <format>

namespace py = pybind11;

namespace shfix::core {

    namespace {
        /** @brief Copies module attribute `name` into `target` when present and castable. */
        template <typename T>
        void load_prop(const py::module_& m, const char* name, T& target) {
            if (py::hasattr(m, name)) {
                try {
                    target = m.attr(name).cast<T>();
                } catch (const py::cast_error& e) {
                    log::warn(std::format("config.py: '{}' has the wrong type, keeping the default: {}", name, e.what()));
                }
            }
        }

        /** @brief Same as load_prop, for one THEME entry. */
        template <typename T>
        void load_dict_item(const py::dict& d, const char* key, T& target) {
            if (d.contains(key)) {
                try {
                    target = d[key].cast<T>();
                } catch (const py::cast_error& e) {
                    log::warn(std::format("config.py: THEME['{}'] has the wrong type: {}", key, e.what()));
                }
            }
        }
    }

    bool ConfigLoader::load(Config& config, const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(fs::absolute(p).string());

            py::module_ conf_module = py::module_::import("config");

            // 1. Assistant service
            load_prop(conf_module, "API_KEY_ENV", config.api_key_env);
            load_prop(conf_module, "API_ENDPOINT", config.api_endpoint);
            load_prop(conf_module, "MODEL", config.model);
            load_prop(conf_module, "REQUEST_TIMEOUT_MS", config.request_timeout_ms);
            load_prop(conf_module, "MAX_TOKENS", config.max_tokens);
            load_prop(conf_module, "TEMPERATURE", config.temperature);

            // 2. Pipeline
            load_prop(conf_module, "DEDUP_WINDOW_SECONDS", config.dedup_window_seconds);
            load_prop(conf_module, "DEDUP_MAX_KEYS", config.dedup_max_keys);
            load_prop(conf_module, "GRACE_DELAY_MS", config.grace_delay_ms);
            load_prop(conf_module, "HISTORY_CAPACITY", config.history_capacity);
            load_prop(conf_module, "EXTRA_ERROR_PATTERNS", config.extra_error_patterns);

            // 3. Presentation
            load_prop(conf_module, "SHOW_NOTICES", config.show_notices);
            load_prop(conf_module, "DEBUG", config.debug);

            // 4. Theme
            if (py::hasattr(conf_module, "THEME")) {
                try {
                    py::dict theme = conf_module.attr("THEME").cast<py::dict>();
                    load_dict_item(theme, "RESET", handlers::Theme::RESET);
                    load_dict_item(theme, "STRUCTURE", handlers::Theme::STRUCTURE);
                    load_dict_item(theme, "UNIT", handlers::Theme::UNIT);
                    load_dict_item(theme, "VALUE", handlers::Theme::VALUE);
                    load_dict_item(theme, "TEXT", handlers::Theme::TEXT);
                    load_dict_item(theme, "SUCCESS", handlers::Theme::SUCCESS);
                    load_dict_item(theme, "WARNING", handlers::Theme::WARNING);
                    load_dict_item(theme, "ERROR", handlers::Theme::ERROR);
                    load_dict_item(theme, "NOTICE", handlers::Theme::NOTICE);
                } catch (const py::cast_error& e) {
                    log::warn(std::format("Config THEME must be a dict: {}", e.what()));
                }
            }

            log::set_debug(config.debug);
            log::notice("Config loaded successfully.");
            return true;

        } catch (const py::error_already_set& e) {
            log::error("No config.py found (or error reading it). Using defaults.");
            log::debug(e.what());
            return false;
        }
    }

} // namespace shfix::core

/**
 * @file config_loader.hpp
 * @brief Reads config/config.py into the runtime Config.
 *
 * The settings file is plain Python, so users can compute values (for example
 * pick a model from an environment variable) without a C++ parser.
 */

#pragma once
#include <string>

namespace shfix::core {
    struct Config;

    /** @class ConfigLoader */
    class ConfigLoader {
    public:
        /**
         * @brief Loads runtime configuration from a config.py file into the Config struct.
         *
         * Requires the embedded interpreter to be running (the Engine owns it).
         * Adds the target directory to sys.path, imports the `config` module and
         * reflects known attributes into `config`. Unknown attributes are ignored;
         * wrongly typed ones keep their default with a warning.
         *
         * @param config The configuration object to populate.
         * @param path Absolute path to the directory containing config.py.
         * @return false if config.py could not be imported (defaults remain).
         */
        static bool load(Config& config, const std::string& path);
    };
}

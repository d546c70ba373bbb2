#pragma once

#include <string>
#include <vector>

namespace shfix::core {

    /**
     * @brief Runtime settings, filled from config/config.py by ConfigLoader.
     * Every field keeps its default when the key is absent or has the wrong type.
     */
    struct Config {
        // --- Assistant service ---
        std::string api_key_env{"OPENROUTER_API_KEY"};   ///< Env var holding the credential
        std::string api_endpoint{"https://openrouter.ai/api/v1/chat/completions"};
        std::string model{"anthropic/claude-3.5-sonnet"};
        int request_timeout_ms{10000};                   ///< Clamped to [1000, 15000]
        int max_tokens{150};
        double temperature{0.2};

        // --- Pipeline ---
        int dedup_window_seconds{30};
        int dedup_max_keys{256};
        int grace_delay_ms{300};                         ///< Single-flight release delay
        int history_capacity{10};
        std::vector<std::string> extra_error_patterns;   ///< Appended to the classifier

        // --- Presentation ---
        bool show_notices{true};
        bool debug{false};
    };

}

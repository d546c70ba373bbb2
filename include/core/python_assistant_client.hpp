/**
 * @file python_assistant_client.hpp
 * @brief AssistantClient backed by the embedded `assistant_client.py` helper.
 */

#pragma once
#include "core/assistant_client.hpp"

namespace shfix::core {

    /**
     * @class PythonAssistantClient
     * @brief Delegates the HTTPS round-trip to Python's urllib.
     *
     * The helper returns a JSON status document:
     *   {"status": "ok", "body": "<raw response>"}
     *   {"status": "timeout" | "network_error", "message": "..."}
     *   {"status": "http_error", "code": 401, "message": "..."}
     * This class decodes it and extracts choices[0].message.content.
     *
     * Safe to call from worker threads: the GIL is acquired per call.
     * The helper's directory must already be on sys.path.
     */
    class PythonAssistantClient : public AssistantClient {
    public:
        std::string complete(const AssistantRequest& request) override;

        /**
         * @brief Extracts the reply field from a chat-completion response body.
         * @throws FormatError if the body is not JSON or lacks the field.
         * Caller must hold the GIL.
         */
        static std::string extract_reply(const std::string& body);
    };

}

/**
 * @file assistant_client.hpp
 * @brief Boundary to the external free-text completion service.
 */

#pragma once
#include <chrono>
#include <string>

namespace shfix::core {

    /** @brief One chat-completion call: a single user prompt plus transport settings. */
    struct AssistantRequest {
        std::string endpoint;
        std::string api_key;
        std::string model;
        std::string prompt;
        std::chrono::milliseconds timeout{10000};
        int max_tokens = 150;
        double temperature = 0.2;
    };

    /**
     * @class AssistantClient
     * @brief Performs the network call and returns the reply text field.
     *
     * Implementations throw UpstreamError on timeout, transport failure or a
     * non-success status, and FormatError when the envelope has no reply field.
     */
    class AssistantClient {
    public:
        virtual ~AssistantClient() = default;
        virtual std::string complete(const AssistantRequest& request) = 0;
    };

}

/**
 * @file python_assistant_client.cpp
 * @brief Proxies the assistant call to `assistant_client.py` and decodes the result.
 *
 * Same split as the rest of the embedded helpers: Python owns the network
 * stack, C++ owns validation and error mapping. Every Python exception is
 * translated into the pipeline's own error types before it leaves this file.
 */

#include "core/python_assistant_client.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <pybind11/embed.h>
#include <format>

namespace py = pybind11;

namespace shfix::core {

    std::string PythonAssistantClient::complete(const AssistantRequest& request) {
        py::gil_scoped_acquire gil;

        std::string envelope;
        try {
            py::module_ helper = py::module_::import("assistant_client");
            double timeout_s = static_cast<double>(request.timeout.count()) / 1000.0;
            envelope = helper.attr("complete")(request.endpoint, request.api_key, request.model,
                                               request.prompt, timeout_s, request.max_tokens,
                                               request.temperature).cast<std::string>();
        } catch (const py::error_already_set& e) {
            throw UpstreamError(std::format("assistant_client.py failed: {}", e.what()));
        } catch (const py::cast_error& e) {
            throw UpstreamError(std::format("assistant_client.py returned a non-string: {}", e.what()));
        }

        try {
            py::module_ json = py::module_::import("json");
            py::object result_obj = json.attr("loads")(envelope);
            std::string status = result_obj["status"].cast<std::string>();

            if (status == "ok") {
                return extract_reply(result_obj["body"].cast<std::string>());
            }

            std::string message = py::str(result_obj.attr("get")("message", "")).cast<std::string>();

            if (status == "timeout") {
                throw UpstreamError(std::format("Request timed out after {} ms", request.timeout.count()));
            }
            if (status == "http_error") {
                int code = result_obj.attr("get")("code", 0).cast<int>();
                throw UpstreamError(std::format("HTTP {}: {}", code, message));
            }
            throw UpstreamError(std::format("Network error: {}", message));

        } catch (const py::error_already_set& e) {
            throw UpstreamError(std::format("Malformed helper response: {}", e.what()));
        } catch (const py::cast_error& e) {
            throw UpstreamError(std::format("Malformed helper response: {}", e.what()));
        }
    }

    std::string PythonAssistantClient::extract_reply(const std::string& body) {
        try {
            py::module_ json = py::module_::import("json");
            py::object data = json.attr("loads")(body);
            py::object content = data["choices"][py::int_(0)]["message"]["content"];
            if (content.is_none()) {
                throw FormatError("Assistant reply has no content");
            }
            return content.cast<std::string>();
        } catch (const py::error_already_set& e) {
            log::debug(std::format("Unexpected response body: {}", body.substr(0, 200)));
            throw FormatError(std::format("Invalid response format from assistant: {}", e.what()));
        } catch (const py::cast_error& e) {
            throw FormatError(std::format("Invalid response format from assistant: {}", e.what()));
        }
    }

}

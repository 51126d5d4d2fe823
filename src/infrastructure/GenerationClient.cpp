/**
 * @file GenerationClient.cpp
 * @brief Implementation of GenerationClient.
 */
#include "infrastructure/GenerationClient.hpp"
#include "domain/GenerationTypes.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace genclient::infrastructure {

using json = nlohmann::json;
using domain::GenerationError;
using domain::Result;

namespace {

constexpr const char* kGeneratePath = "/api/generate";

struct EndpointParts {
    std::string origin;     ///< scheme://host[:port]
    std::string pathPrefix; ///< Everything after the authority, kept verbatim.
};

std::optional<EndpointParts> SplitEndpoint(const std::string& endpoint) {
    const auto schemeEnd = endpoint.find("://");
    const size_t hostStart = (schemeEnd == std::string::npos) ? 0 : schemeEnd + 3;
    const auto slash = endpoint.find('/', hostStart);
    const size_t hostEnd = (slash == std::string::npos) ? endpoint.size() : slash;
    if (hostEnd <= hostStart) {
        return std::nullopt;
    }

    EndpointParts parts;
    parts.origin = endpoint.substr(0, hostEnd);
    if (slash != std::string::npos) {
        parts.pathPrefix = endpoint.substr(slash);
    }
    return parts;
}

// Counts UTF-8 code points.
size_t CharCount(const std::string& text) {
    size_t count = 0;
    for (char ch : text) {
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// Extracts the {"error": "..."} text Ollama sends with non-2xx replies.
std::optional<std::string> ServerErrorText(const std::string& body) {
    auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    auto it = parsed.find("error");
    if (it == parsed.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

GenerationClient::GenerationClient(const std::string& endpoint, const std::string& model, int timeoutSeconds)
    : m_endpoint(endpoint), m_model(model), m_timeoutSeconds(timeoutSeconds) {
    if (m_model.empty()) {
        throw std::invalid_argument("model identifier must not be empty");
    }
    if (m_timeoutSeconds <= 0) {
        throw std::invalid_argument("timeout must be positive, got " + std::to_string(m_timeoutSeconds));
    }
    auto parts = SplitEndpoint(m_endpoint);
    if (!parts) {
        throw std::invalid_argument("malformed endpoint URL: '" + m_endpoint + "'");
    }
    m_generatePath = parts->pathPrefix + kGeneratePath;

    try {
        m_transport = std::make_unique<httplib::Client>(parts->origin);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("cannot build HTTP transport for " + m_endpoint + ": " + e.what());
    }
    if (!m_transport->is_valid()) {
        throw std::runtime_error("cannot build HTTP transport for " + m_endpoint);
    }

    m_transport->set_connection_timeout(m_timeoutSeconds, 0);
    m_transport->set_read_timeout(m_timeoutSeconds, 0);
    m_transport->set_write_timeout(m_timeoutSeconds, 0);
}

GenerationClient::~GenerationClient() = default;
GenerationClient::GenerationClient(GenerationClient&&) noexcept = default;
GenerationClient& GenerationClient::operator=(GenerationClient&&) noexcept = default;

Result<std::string> GenerationClient::generate(const std::string& prompt) const {
    if (!m_transport) {
        return GenerationError::Transport("request to " + m_endpoint + m_generatePath + " failed",
                                          "client has no transport (moved from)");
    }

    const domain::GenerationRequest request{m_model, prompt, false};
    const json payload = request;

    std::clog << "[GenerationClient] Sending prompt (" << CharCount(prompt) << " chars) to "
              << m_endpoint << " using model " << m_model << std::endl;

    auto res = m_transport->Post(m_generatePath,
                                 payload.dump(-1, ' ', false, json::error_handler_t::replace),
                                 "application/json");
    if (!res) {
        return GenerationError::Transport("request to " + m_endpoint + m_generatePath + " failed",
                                          httplib::to_string(res.error()));
    }

    domain::GenerationResponse response;
    try {
        response = json::parse(res->body).get<domain::GenerationResponse>();
    } catch (const json::exception& e) {
        std::string context = "failed to parse response";
        if (res->status < 200 || res->status >= 300) {
            context += " (HTTP " + std::to_string(res->status);
            if (auto serverError = ServerErrorText(res->body)) {
                context += ": " + *serverError;
            }
            context += ")";
        }
        return GenerationError::ParseFailure(context, e.what());
    }

    if (!response.done) {
        return GenerationError::Incomplete();
    }

    std::clog << "[GenerationClient] Received response (" << CharCount(response.response) << " chars)" << std::endl;
    return response.response;
}

std::future<Result<std::string>> GenerationClient::generateAsync(const std::string& prompt) const {
    return std::async(std::launch::async, [this, prompt]() {
        return generate(prompt);
    });
}

} // namespace genclient::infrastructure

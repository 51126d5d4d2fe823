/**
 * @file GenerationClient.hpp
 * @brief HTTP client for the /api/generate endpoint of a local inference server.
 */

#pragma once

#include <future>
#include <memory>
#include <string>
#include "domain/GenerationError.hpp"

namespace httplib {
class Client;
}

namespace genclient::infrastructure {

/**
 * @class GenerationClient
 * @brief Sends a prompt to the inference server and returns the generated text.
 *
 * Holds one reusable transport for its whole lifetime. Configuration is fixed
 * at construction; no network I/O happens until generate() is called.
 * Concurrent calls on one instance are safe, but the transport serves them one
 * at a time. A moved-from client returns a Transport error from generate().
 */
class GenerationClient {
public:
    /**
     * @brief Builds the client and its HTTP transport.
     * @param endpoint Base URL, e.g. "http://localhost:11434". Not normalized.
     * @param model Model identifier sent with every request.
     * @param timeoutSeconds Connect/read/write timeout applied to every request.
     *        Each socket wait is bounded by it, not the total latency of a call:
     *        a call queued behind other calls on this client can take longer.
     * @throws std::invalid_argument on an empty endpoint or model, or a non-positive timeout.
     * @throws std::runtime_error when the transport cannot be built for the endpoint.
     */
    GenerationClient(const std::string& endpoint, const std::string& model, int timeoutSeconds);
    ~GenerationClient();

    GenerationClient(const GenerationClient&) = delete;
    GenerationClient& operator=(const GenerationClient&) = delete;
    GenerationClient(GenerationClient&&) noexcept;
    GenerationClient& operator=(GenerationClient&&) noexcept;

    /**
     * @brief Performs one non-streaming generation and blocks until the server reports completion.
     * @return The generated text, or a Transport/Generation error.
     */
    domain::Result<std::string> generate(const std::string& prompt) const;

    /**
     * @brief Runs generate() on its own task.
     *
     * The client must outlive the returned future. Destroying the future
     * without get() still waits for the in-flight request, which ends at the
     * latest when the timeout expires.
     */
    [[nodiscard]] std::future<domain::Result<std::string>> generateAsync(const std::string& prompt) const;

    const std::string& endpoint() const { return m_endpoint; }
    const std::string& model() const { return m_model; }
    int timeoutSeconds() const { return m_timeoutSeconds; }

private:
    std::string m_endpoint;
    std::string m_model;
    int m_timeoutSeconds;
    std::string m_generatePath; ///< Endpoint path prefix + "/api/generate".
    std::unique_ptr<httplib::Client> m_transport;
};

} // namespace genclient::infrastructure

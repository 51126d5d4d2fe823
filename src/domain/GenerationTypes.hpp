/**
 * @file GenerationTypes.hpp
 * @brief Wire-level request/response objects of the /api/generate endpoint.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace genclient::domain {

/**
 * @struct GenerationRequest
 * @brief Body of a single non-streaming generation call.
 *
 * Serializes to exactly {"model", "prompt", "stream"}.
 */
struct GenerationRequest {
    std::string model;
    std::string prompt;
    bool stream = false;
};

/**
 * @struct GenerationResponse
 * @brief Decoded reply of the inference server.
 *
 * Only `response` and `done` are consumed; the rest is kept for completeness.
 * A reply is usable output only when `done` is true.
 */
struct GenerationResponse {
    std::optional<std::string> model;
    std::string response;
    bool done = false;
    std::optional<std::vector<std::int64_t>> context; ///< Token context vector, unused.
};

void to_json(nlohmann::json& j, const GenerationRequest& request);

/** @brief Throws nlohmann::json::exception when `response` or `done` is missing or mistyped. */
void from_json(const nlohmann::json& j, GenerationResponse& response);

} // namespace genclient::domain

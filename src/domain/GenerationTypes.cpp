/**
 * @file GenerationTypes.cpp
 * @brief JSON mapping of the generation wire types.
 */
#include "domain/GenerationTypes.hpp"

namespace genclient::domain {

void to_json(nlohmann::json& j, const GenerationRequest& request) {
    j = nlohmann::json{
        {"model", request.model},
        {"prompt", request.prompt},
        {"stream", request.stream}
    };
}

void from_json(const nlohmann::json& j, GenerationResponse& response) {
    j.at("response").get_to(response.response);
    j.at("done").get_to(response.done);

    response.model.reset();
    if (j.contains("model") && !j["model"].is_null()) {
        response.model = j["model"].get<std::string>();
    }

    response.context.reset();
    if (j.contains("context") && !j["context"].is_null()) {
        response.context = j["context"].get<std::vector<std::int64_t>>();
    }
}

} // namespace genclient::domain

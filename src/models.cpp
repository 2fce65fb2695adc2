#include "models.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace ollie {

static const std::vector<Header> kJsonHeaders = {
    {"Content-Type", "application/json"}
};

static std::string name_body(const std::string& name) {
    json body;
    body["name"] = name;
    return body.dump();
}

static ModelDetails parse_details(const json& d) {
    ModelDetails details;
    details.format = d.value("format", "");
    details.family = d.value("family", "");
    if (d.contains("families") && d["families"].is_array()) {
        std::vector<std::string> families;
        for (const auto& f : d["families"]) {
            if (f.is_string()) families.push_back(f.get<std::string>());
        }
        details.families = std::move(families);
    }
    details.parameter_size = d.value("parameter_size", "");
    details.quantization_level = d.value("quantization_level", "");
    return details;
}

ModelsResponse parse_models_response(const json& j) {
    if (!j.is_object() || !j.contains("models") || !j["models"].is_array())
        throw std::runtime_error("missing \"models\" array");

    ModelsResponse result;
    for (const auto& m : j["models"]) {
        if (!m.is_object() || !m.contains("name") || !m["name"].is_string())
            throw std::runtime_error("model entry without a name");
        OllamaModel model;
        model.name = m["name"].get<std::string>();
        model.modified_at = m.value("modified_at", "");
        model.size = m.value("size", int64_t{0});
        model.digest = m.value("digest", "");
        if (m.contains("details") && m["details"].is_object())
            model.details = parse_details(m["details"]);
        result.models.push_back(std::move(model));
    }
    return result;
}

ShowResponse parse_show_response(const json& j) {
    if (!j.is_object())
        throw std::runtime_error("expected a JSON object");

    ShowResponse result;
    for (auto& [key, value] : j.items()) {
        if (key == "modelfile" && value.is_string()) {
            result.modelfile = value.get<std::string>();
        } else if (key == "parameters") {
            if (!value.is_null()) result.parameters = value;
        } else if (key == "template" && value.is_string()) {
            result.template_ = value.get<std::string>();
        } else if (key == "license" && value.is_string()) {
            result.license = value.get<std::string>();
        } else {
            result.extra[key] = value;
        }
    }
    return result;
}

ModelClient::ModelClient(HttpClient& http, std::string base_url)
    : http_(http), base_url_(strip_trailing_slashes(base_url)) {}

ModelsResponse ModelClient::list_models() {
    auto response = http_.get(base_url_ + "/api/tags", {}, 10);
    if (response.status_code == 0)
        throw std::runtime_error("Failed to fetch models: " + response.error);
    if (!is_success(response))
        throw std::runtime_error("Server returned status: " +
                                 std::to_string(response.status_code));

    try {
        return parse_models_response(json::parse(response.body));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse models response: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string("Failed to parse models response: ") + e.what());
    }
}

SimpleResponse ModelClient::delete_model(const std::string& name) {
    std::string endpoint = base_url_ + "/api/delete";
    std::string body = name_body(name);

    auto response = http_.del(endpoint, body, kJsonHeaders, 60);
    if (response.status_code == 405) {
        // Some servers and proxies refuse DELETE with a body.
        std::cerr << "[models] DELETE rejected by " << base_url_
                  << ", retrying delete as POST\n";
        response = http_.post(endpoint, body, kJsonHeaders, 60);
    }

    if (response.status_code == 0)
        return SimpleResponse::fail("Request error: " + response.error);
    if (!is_success(response))
        return SimpleResponse::fail("HTTP error: " + std::to_string(response.status_code));
    return SimpleResponse::ok();
}

ShowResponse ModelClient::show_model(const std::string& name) {
    auto response = http_.post(base_url_ + "/api/show",
                               name_body(name), kJsonHeaders, 30);
    if (response.status_code == 0)
        throw std::runtime_error("Request error: " + response.error);
    if (!is_success(response))
        throw std::runtime_error("HTTP error: " + std::to_string(response.status_code));

    try {
        return parse_show_response(json::parse(response.body));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse show response: ") + e.what());
    }
}

} // namespace ollie

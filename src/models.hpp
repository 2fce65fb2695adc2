#pragma once
#include "http.hpp"
#include "result.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ollie {

struct ModelDetails {
    std::string format;
    std::string family;
    std::optional<std::vector<std::string>> families;
    std::string parameter_size;
    std::string quantization_level;
};

struct OllamaModel {
    std::string name;
    std::string modified_at;
    int64_t size = 0;
    std::string digest;
    std::optional<ModelDetails> details;
};

struct ModelsResponse {
    std::vector<OllamaModel> models;
};

// /api/show reply. Keys other than the four named ones land in extra.
struct ShowResponse {
    std::optional<std::string> modelfile;
    std::optional<nlohmann::json> parameters;
    std::optional<std::string> template_;
    std::optional<std::string> license;
    std::map<std::string, nlohmann::json> extra;
};

ModelsResponse parse_models_response(const nlohmann::json& j);
ShowResponse parse_show_response(const nlohmann::json& j);

// One-shot model management calls against an Ollama-compatible server.
class ModelClient {
public:
    ModelClient(HttpClient& http, std::string base_url);

    // GET /api/tags. Throws std::runtime_error on failure.
    ModelsResponse list_models();

    // DELETE /api/delete, retried as POST when the server answers 405.
    SimpleResponse delete_model(const std::string& name);

    // POST /api/show. Throws std::runtime_error on failure.
    ShowResponse show_model(const std::string& name);

    const std::string& base_url() const { return base_url_; }

private:
    HttpClient& http_;
    std::string base_url_;
};

} // namespace ollie

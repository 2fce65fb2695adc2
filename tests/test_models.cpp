#include <catch2/catch_test_macros.hpp>
#include "models.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace ollie;
using json = nlohmann::json;

static const char* kTagsBody = R"({
    "models": [
        {
            "name": "llama3:latest",
            "modified_at": "2024-05-01T10:00:00Z",
            "size": 4661224676,
            "digest": "365c0bd3c000",
            "details": {
                "format": "gguf",
                "family": "llama",
                "families": ["llama"],
                "parameter_size": "8.0B",
                "quantization_level": "Q4_0"
            }
        },
        {
            "name": "tiny",
            "modified_at": "2024-05-02T10:00:00Z",
            "size": 1000,
            "digest": "abc"
        }
    ]
})";

// ── parse_models_response ────────────────────────────────────────

TEST_CASE("parse_models_response: reads entries and details", "[models]") {
    auto result = parse_models_response(json::parse(kTagsBody));
    REQUIRE(result.models.size() == 2);

    const auto& m = result.models[0];
    REQUIRE(m.name == "llama3:latest");
    REQUIRE(m.size == 4661224676LL);
    REQUIRE(m.digest == "365c0bd3c000");
    REQUIRE(m.details.has_value());
    REQUIRE(m.details->family == "llama");
    REQUIRE(m.details->families.has_value());
    REQUIRE(m.details->families->size() == 1);
    REQUIRE(m.details->parameter_size == "8.0B");
    REQUIRE(m.details->quantization_level == "Q4_0");

    REQUIRE_FALSE(result.models[1].details.has_value());
}

TEST_CASE("parse_models_response: empty list", "[models]") {
    auto result = parse_models_response(json::parse(R"({"models": []})"));
    REQUIRE(result.models.empty());
}

TEST_CASE("parse_models_response: missing models array throws", "[models]") {
    REQUIRE_THROWS_AS(parse_models_response(json::parse(R"({"other": 1})")),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_models_response(json::parse(R"({"models": [{"size": 1}]})")),
                      std::runtime_error);
}

// ── list_models ──────────────────────────────────────────────────

TEST_CASE("ModelClient::list_models: GET /api/tags", "[models]") {
    MockHttpClient http;
    http.next_response = {200, kTagsBody, ""};
    ModelClient client(http, "http://localhost:11434/");

    auto result = client.list_models();

    REQUIRE(result.models.size() == 2);
    REQUIRE(http.last_call().method == "GET");
    REQUIRE(http.last_call().url == "http://localhost:11434/api/tags");
    REQUIRE(http.last_call().timeout_seconds == 10);
}

TEST_CASE("ModelClient::list_models: connection failure throws", "[models]") {
    MockHttpClient http;
    http.next_response = {0, "", "Connection refused"};
    ModelClient client(http, "http://localhost:11434");

    try {
        client.list_models();
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "Failed to fetch models: Connection refused");
    }
}

TEST_CASE("ModelClient::list_models: non-2xx status throws", "[models]") {
    MockHttpClient http;
    http.next_response = {503, "busy", ""};
    ModelClient client(http, "http://localhost:11434");

    try {
        client.list_models();
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()) == "Server returned status: 503");
    }
}

TEST_CASE("ModelClient::list_models: unparseable body throws", "[models]") {
    MockHttpClient http;
    http.next_response = {200, "<html>", ""};
    ModelClient client(http, "http://localhost:11434");

    try {
        client.list_models();
        FAIL("expected exception");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).rfind("Failed to parse models response: ", 0) == 0);
    }
}

// ── delete_model ─────────────────────────────────────────────────

TEST_CASE("ModelClient::delete_model: DELETE with name body", "[models]") {
    MockHttpClient http;
    http.next_response = {200, "", ""};
    ModelClient client(http, "http://localhost:11434");

    auto result = client.delete_model("llama3");

    REQUIRE(result.success);
    REQUIRE(http.calls.size() == 1);
    REQUIRE(http.last_call().method == "DELETE");
    REQUIRE(http.last_call().url == "http://localhost:11434/api/delete");
    REQUIRE(http.last_call().timeout_seconds == 60);
    REQUIRE(find_header(http.last_call().headers, "Content-Type") == "application/json");
    REQUIRE(json::parse(http.last_call().body)["name"] == "llama3");
}

TEST_CASE("ModelClient::delete_model: 405 retries as POST", "[models]") {
    MockHttpClient http;
    http.response_queue = {{405, "", ""}, {200, "", ""}};
    ModelClient client(http, "http://localhost:11434");

    auto result = client.delete_model("llama3");

    REQUIRE(result.success);
    REQUIRE(http.calls.size() == 2);
    REQUIRE(http.calls[0].method == "DELETE");
    REQUIRE(http.calls[1].method == "POST");
    REQUIRE(http.calls[1].url == "http://localhost:11434/api/delete");
    REQUIRE(http.calls[1].body == http.calls[0].body);
}

TEST_CASE("ModelClient::delete_model: failures are reported, not thrown", "[models]") {
    MockHttpClient http;
    ModelClient client(http, "http://localhost:11434");

    http.next_response = {404, R"({"error":"model not found"})", ""};
    auto not_found = client.delete_model("ghost");
    REQUIRE_FALSE(not_found.success);
    REQUIRE(*not_found.error == "HTTP error: 404");

    http.next_response = {0, "", "timed out"};
    auto unreachable = client.delete_model("llama3");
    REQUIRE_FALSE(unreachable.success);
    REQUIRE(*unreachable.error == "Request error: timed out");
}

// ── show_model ───────────────────────────────────────────────────

TEST_CASE("ModelClient::show_model: known fields and extra keys", "[models]") {
    MockHttpClient http;
    http.next_response = {200, R"({
        "modelfile": "FROM llama3",
        "parameters": "stop \"<|eot_id|>\"",
        "template": "{{ .Prompt }}",
        "license": "META LLAMA 3",
        "details": {"family": "llama"},
        "model_info": {"general.architecture": "llama"}
    })", ""};
    ModelClient client(http, "http://localhost:11434");

    auto info = client.show_model("llama3");

    REQUIRE(http.last_call().method == "POST");
    REQUIRE(http.last_call().url == "http://localhost:11434/api/show");
    REQUIRE(http.last_call().timeout_seconds == 30);
    REQUIRE(json::parse(http.last_call().body)["name"] == "llama3");

    REQUIRE(info.modelfile == std::optional<std::string>("FROM llama3"));
    REQUIRE(info.parameters.has_value());
    REQUIRE(info.parameters->is_string());
    REQUIRE(info.template_ == std::optional<std::string>("{{ .Prompt }}"));
    REQUIRE(info.license == std::optional<std::string>("META LLAMA 3"));
    REQUIRE(info.extra.size() == 2);
    REQUIRE(info.extra.at("details")["family"] == "llama");
    REQUIRE(info.extra.count("model_info") == 1);
}

TEST_CASE("ModelClient::show_model: missing fields stay empty", "[models]") {
    MockHttpClient http;
    http.next_response = {200, R"({"parameters": null})", ""};
    ModelClient client(http, "http://localhost:11434");

    auto info = client.show_model("tiny");
    REQUIRE_FALSE(info.modelfile.has_value());
    REQUIRE_FALSE(info.parameters.has_value());
    REQUIRE_FALSE(info.template_.has_value());
    REQUIRE_FALSE(info.license.has_value());
    REQUIRE(info.extra.empty());
}

TEST_CASE("ModelClient::show_model: HTTP error throws", "[models]") {
    MockHttpClient http;
    http.next_response = {404, "", ""};
    ModelClient client(http, "http://localhost:11434");

    REQUIRE_THROWS_AS(client.show_model("ghost"), std::runtime_error);
}

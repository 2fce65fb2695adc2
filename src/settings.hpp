#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ollie {

constexpr const char* kDefaultServerUrl = "http://localhost:11434";

// Generation defaults the UI pre-fills; unset means "server default".
struct DefaultParams {
    std::optional<double> temperature;
    std::optional<int> top_k;
    std::optional<double> top_p;
    std::optional<int> max_tokens;
};

struct Settings {
    std::string server_url = kDefaultServerUrl;
    std::optional<std::string> default_model;
    DefaultParams default_params;
    std::optional<std::string> theme = std::string("light");

    // Load from ~/.config/ollie/settings.json. Missing file → defaults.
    // OLLAMA_HOST, then OLLIE_SERVER_URL, override server_url when
    // apply_env is set.
    static Settings load(bool apply_env = true);

    // Default settings JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static Settings from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Persist to ~/.config/ollie/settings.json atomically.
    bool save() const;

    // Assign one key from its textual form ("server_url", "default_model",
    // "theme", "temperature", "top_k", "top_p", "max_tokens").
    // An empty value clears optional keys. Returns false for an unknown
    // key or a value of the wrong type.
    bool set(const std::string& key, const std::string& value);

    // Caller-supplied server URL if given, else the configured one.
    std::string server_url_or(const std::optional<std::string>& override_url) const;
};

// ~/.config/ollie/settings.json, with ~ expanded
std::string settings_path();

} // namespace ollie

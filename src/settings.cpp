#include "settings.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ollie {

std::string settings_path() {
    return expand_home("~/.config/ollie/settings.json");
}

nlohmann::json Settings::defaults_json() {
    return {
        {"server_url", kDefaultServerUrl},
        {"default_model", nullptr},
        {"default_params", {
            {"temperature", nullptr},
            {"top_k", nullptr},
            {"top_p", nullptr},
            {"max_tokens", nullptr}
        }},
        {"theme", "light"}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// "host:port" (OLLAMA_HOST style) gets an http:// scheme.
static std::string normalize_server_url(const std::string& raw) {
    std::string url = strip_trailing_slashes(trim(raw));
    if (!url.empty() && url.find("://") == std::string::npos)
        url = "http://" + url;
    return url;
}

Settings Settings::from_json(const nlohmann::json& j) {
    Settings s;
    if (!j.is_object()) return s;

    if (j.contains("server_url") && j["server_url"].is_string())
        s.server_url = normalize_server_url(j["server_url"].get<std::string>());
    if (s.server_url.empty())
        s.server_url = kDefaultServerUrl;

    if (j.contains("default_model") && j["default_model"].is_string())
        s.default_model = j["default_model"].get<std::string>();

    if (j.contains("theme")) {
        if (j["theme"].is_string())
            s.theme = j["theme"].get<std::string>();
        else if (j["theme"].is_null())
            s.theme.reset();
    }

    if (j.contains("default_params") && j["default_params"].is_object()) {
        auto& p = j["default_params"];
        if (p.contains("temperature") && p["temperature"].is_number())
            s.default_params.temperature = p["temperature"].get<double>();
        if (p.contains("top_k") && p["top_k"].is_number_integer())
            s.default_params.top_k = p["top_k"].get<int>();
        if (p.contains("top_p") && p["top_p"].is_number())
            s.default_params.top_p = p["top_p"].get<double>();
        if (p.contains("max_tokens") && p["max_tokens"].is_number_integer())
            s.default_params.max_tokens = p["max_tokens"].get<int>();
    }
    return s;
}

template<typename T>
static nlohmann::json optional_json(const std::optional<T>& v) {
    if (v) return *v;
    return nullptr;
}

nlohmann::json Settings::to_json() const {
    return {
        {"server_url", server_url},
        {"default_model", optional_json(default_model)},
        {"default_params", {
            {"temperature", optional_json(default_params.temperature)},
            {"top_k", optional_json(default_params.top_k)},
            {"top_p", optional_json(default_params.top_p)},
            {"max_tokens", optional_json(default_params.max_tokens)}
        }},
        {"theme", optional_json(theme)}
    };
}

Settings Settings::load(bool apply_env) {
    std::string path = settings_path();
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[settings] Ignoring malformed " << path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    }

    Settings s = from_json(j);

    // Environment variables override the file
    if (apply_env) {
        if (const char* v = std::getenv("OLLAMA_HOST"); v && *v)
            s.server_url = normalize_server_url(v);
        if (const char* v = std::getenv("OLLIE_SERVER_URL"); v && *v)
            s.server_url = normalize_server_url(v);
    }
    return s;
}

bool Settings::save() const {
    std::string path = settings_path();
    if (!atomic_write_file(path, to_json().dump(2) + "\n")) {
        std::cerr << "[settings] Failed to write " << path << "\n";
        return false;
    }
    return true;
}

template<typename T, typename Parse>
static bool parse_optional(const std::string& value, std::optional<T>& out, Parse parse) {
    if (value.empty()) {
        out.reset();
        return true;
    }
    try {
        size_t used = 0;
        T parsed = parse(value, &used);
        if (used != value.size()) return false;
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool Settings::set(const std::string& key, const std::string& value) {
    auto to_double = [](const std::string& v, size_t* used) { return std::stod(v, used); };
    auto to_int = [](const std::string& v, size_t* used) { return std::stoi(v, used); };

    if (key == "server_url") {
        std::string url = normalize_server_url(value);
        if (url.empty()) return false;
        server_url = url;
        return true;
    }
    if (key == "default_model") {
        if (value.empty()) default_model.reset();
        else default_model = value;
        return true;
    }
    if (key == "theme") {
        if (value.empty()) theme.reset();
        else theme = value;
        return true;
    }
    if (key == "temperature")
        return parse_optional(value, default_params.temperature, to_double);
    if (key == "top_k")
        return parse_optional(value, default_params.top_k, to_int);
    if (key == "top_p")
        return parse_optional(value, default_params.top_p, to_double);
    if (key == "max_tokens")
        return parse_optional(value, default_params.max_tokens, to_int);
    return false;
}

std::string Settings::server_url_or(const std::optional<std::string>& override_url) const {
    if (override_url && !trim(*override_url).empty())
        return normalize_server_url(*override_url);
    return server_url;
}

} // namespace ollie

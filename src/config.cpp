#include "config.hpp"
#include "http.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace guidctl {

nlohmann::json Config::defaults_json() {
    return {
        {"url", ""},
        {"timeout", 30},
        {"mock", {
            {"scheme", "mock"},
            {"host", "test.net"}
        }}
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

Config Config::load() {
    return load_from(expand_home("~/.guidctl/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    Config cfg;
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            if (original.is_object())
                j = merge_defaults(original, defaults_json());
            else
                std::cerr << "[config] Ignoring malformed config: " << config_path << "\n";
        } catch (const nlohmann::json::parse_error&) {
            std::cerr << "[config] Ignoring malformed config: " << config_path << "\n";
        }
    }

    // Parse JSON into Config struct
    if (j.contains("url") && j["url"].is_string())
        cfg.url = j["url"].get<std::string>();
    if (j.contains("timeout") && j["timeout"].is_number_unsigned() && j["timeout"].get<long>() > 0)
        cfg.timeout = j["timeout"].get<long>();

    if (j.contains("mock") && j["mock"].is_object()) {
        auto& m = j["mock"];
        if (m.contains("scheme") && m["scheme"].is_string() && !m["scheme"].get<std::string>().empty())
            cfg.mock.scheme = m["scheme"].get<std::string>();
        if (m.contains("host") && m["host"].is_string() && !m["host"].get<std::string>().empty())
            cfg.mock.host = m["host"].get<std::string>();
    }

    // Environment overrides
    if (const char* env = std::getenv("GUIDCTL_URL"); env && *env)
        cfg.url = env;
    if (const char* env = std::getenv("GUIDCTL_TIMEOUT"); env && *env) {
        char* end = nullptr;
        long t = std::strtol(env, &end, 10);
        if (end && *end == '\0' && t > 0)
            cfg.timeout = t;
        else
            std::cerr << "[config] Ignoring invalid GUIDCTL_TIMEOUT: " << env << "\n";
    }

    return cfg;
}

bool Config::is_simulated(const std::string& url) const {
    return url_scheme(url) == mock.scheme;
}

} // namespace guidctl

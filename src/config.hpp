#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace guidctl {

// Where simulated endpoints live: requests to <scheme>://<host>/guid... are
// answered in-process instead of going to the network.
struct MockConfig {
    std::string scheme = "mock";
    std::string host = "test.net";
};

struct Config {
    std::string url;     // default endpoint when --url is not given
    long timeout = 30;   // seconds, per request
    MockConfig mock;

    // Load from ~/.guidctl/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars (used by load() and tests)
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // True when url uses the simulated scheme
    bool is_simulated(const std::string& url) const;
};

} // namespace guidctl

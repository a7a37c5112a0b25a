#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace guidctl;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.url.empty());
    REQUIRE(cfg.timeout == 30);
    REQUIRE(cfg.mock.scheme == "mock");
    REQUIRE(cfg.mock.host == "test.net");
}

TEST_CASE("Config::defaults_json: matches struct defaults", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(j["url"] == "");
    REQUIRE(j["timeout"] == 30);
    REQUIRE(j["mock"]["scheme"] == "mock");
    REQUIRE(j["mock"]["host"] == "test.net");
}

// ── is_simulated ─────────────────────────────────────────────────

TEST_CASE("Config::is_simulated: matches on scheme only", "[config]") {
    Config cfg;
    REQUIRE(cfg.is_simulated("mock://test.net"));
    REQUIRE(cfg.is_simulated("mock://elsewhere"));
    REQUIRE_FALSE(cfg.is_simulated("https://test.net"));
    REQUIRE_FALSE(cfg.is_simulated("mocks://test.net"));
    REQUIRE_FALSE(cfg.is_simulated("test.net"));
}

TEST_CASE("Config::is_simulated: honours a custom scheme", "[config]") {
    Config cfg;
    cfg.mock.scheme = "sim";
    REQUIRE(cfg.is_simulated("sim://x"));
    REQUIRE_FALSE(cfg.is_simulated("mock://x"));
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "guidctl_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("GUIDCTL_URL");
        unsetenv("GUIDCTL_TIMEOUT");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("GUIDCTL_URL");
        unsetenv("GUIDCTL_TIMEOUT");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.guidctl/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.guidctl");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "url": "https://guid.example.com",
        "timeout": 5,
        "mock": { "scheme": "sim", "host": "guid.local" }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.url == "https://guid.example.com");
    REQUIRE(cfg.timeout == 5);
    REQUIRE(cfg.mock.scheme == "sim");
    REQUIRE(cfg.mock.host == "guid.local");
}

TEST_CASE("Config::load: partial file keeps other defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"mock": {"host": "other.net"}})");

    Config cfg = Config::load();
    REQUIRE(cfg.url.empty());
    REQUIRE(cfg.timeout == 30);
    REQUIRE(cfg.mock.scheme == "mock");
    REQUIRE(cfg.mock.host == "other.net");
}

TEST_CASE("Config::load: wrong types are ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"url": 42, "timeout": -3, "mock": {"host": ""}})");

    Config cfg = Config::load();
    REQUIRE(cfg.url.empty());
    REQUIRE(cfg.timeout == 30);
    REQUIRE(cfg.mock.host == "test.net");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.url.empty());
    REQUIRE(cfg.mock.host == "test.net");
}

TEST_CASE("Config::load: non-object JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("[1, 2, 3]");

    Config cfg = Config::load();
    REQUIRE(cfg.timeout == 30);
}

TEST_CASE("Config::load: missing config file uses defaults and creates nothing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.url.empty());
    REQUIRE(cfg.timeout == 30);
    REQUIRE_FALSE(std::filesystem::exists(g.config_path()));
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"url": "https://from-file", "timeout": 10})");
    setenv("GUIDCTL_URL", "mock://test.net", 1);
    setenv("GUIDCTL_TIMEOUT", "7", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.url == "mock://test.net");
    REQUIRE(cfg.timeout == 7);
}

TEST_CASE("Config::load: invalid GUIDCTL_TIMEOUT is ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("GUIDCTL_TIMEOUT", "soon", 1);
    REQUIRE(Config::load().timeout == 30);

    setenv("GUIDCTL_TIMEOUT", "0", 1);
    REQUIRE(Config::load().timeout == 30);
}

TEST_CASE("Config::load_from: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"url": "https://custom"})";
    }
    REQUIRE(Config::load_from(path).url == "https://custom");
}

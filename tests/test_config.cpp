#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <iterator>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace hoofy;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("MemoryConfig: default values", "[config]") {
    MemoryConfig mc;
    REQUIRE(mc.data_dir == "~/.hoofy");
    REQUIRE(mc.max_observation_length == 2000);
    REQUIRE(mc.max_context_results == 20);
    REQUIRE(mc.max_search_results == 20);
    REQUIRE(mc.dedupe_window_minutes == 15);
    REQUIRE(mc.busy_timeout_ms == 5000);
}

TEST_CASE("MemoryConfig::db_path: file inside data_dir", "[config]") {
    MemoryConfig mc;
    mc.data_dir = "/var/lib/hoofy";
    REQUIRE(mc.db_path() == "/var/lib/hoofy/memory.db");
    mc.data_dir = "/var/lib/hoofy/";
    REQUIRE(mc.db_path() == "/var/lib/hoofy/memory.db");
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads memory section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "memory": {
            "data_dir": "/data",
            "max_observation_length": 500,
            "max_context_results": 7,
            "max_search_results": 3,
            "dedupe_window_minutes": 30,
            "busy_timeout_ms": 100
        }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.memory.data_dir == "/data");
    REQUIRE(cfg.memory.max_observation_length == 500);
    REQUIRE(cfg.memory.max_context_results == 7);
    REQUIRE(cfg.memory.max_search_results == 3);
    REQUIRE(cfg.memory.dedupe_window_minutes == 30);
    REQUIRE(cfg.memory.busy_timeout_ms == 100);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "memory": { "data_dir": 42, "max_search_results": "many", "busy_timeout_ms": -5 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.memory.data_dir == "~/.hoofy");
    REQUIRE(cfg.memory.max_search_results == 20);
    REQUIRE(cfg.memory.busy_timeout_ms == 5000);
}

TEST_CASE("Config::from_json: negative dedupe window is kept as given", "[config]") {
    auto j = nlohmann::json::parse(R"({"memory": {"dedupe_window_minutes": -1}})");
    REQUIRE(Config::from_json(j).memory.dedupe_window_minutes == -1);
}

TEST_CASE("Config::from_json: zero and out-of-range values keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "memory": {
            "max_search_results": 0,
            "max_context_results": 5000000000,
            "max_observation_length": 0,
            "busy_timeout_ms": 18446744073709551615,
            "dedupe_window_minutes": 3000000000
        }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.memory.max_search_results == 20);
    REQUIRE(cfg.memory.max_context_results == 20);
    REQUIRE(cfg.memory.max_observation_length == 2000);
    REQUIRE(cfg.memory.busy_timeout_ms == 5000);
    REQUIRE(cfg.memory.dedupe_window_minutes == 15);

    auto low = nlohmann::json::parse(R"({"memory": {"dedupe_window_minutes": -3000000000}})");
    REQUIRE(Config::from_json(low).memory.dedupe_window_minutes == 15);
}

TEST_CASE("Config::from_json: limits at the edge of range are accepted", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "memory": { "max_search_results": 4294967295, "dedupe_window_minutes": 2147483647 }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.memory.max_search_results == 4294967295u);
    REQUIRE(cfg.memory.dedupe_window_minutes == 2147483647);

    auto timeout = nlohmann::json::parse(R"({"memory": {"busy_timeout_ms": 2147483648}})");
    REQUIRE(Config::from_json(timeout).memory.busy_timeout_ms == 5000);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "hoofy_cfg_XXXXXX";
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
        unsetenv("HOOFY_DATA_DIR");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.hoofy/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.hoofy");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"memory": {"data_dir": "/srv/memory", "max_search_results": 50}})");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.data_dir == "/srv/memory");
    REQUIRE(cfg.memory.max_search_results == 50);
    REQUIRE(cfg.memory.max_context_results == 20);
}

TEST_CASE("Config::load: explicit path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/custom.json";
    {
        std::ofstream f(path);
        f << R"({"memory": {"dedupe_window_minutes": 5}})";
    }
    Config cfg = Config::load(path);
    REQUIRE(cfg.memory.dedupe_window_minutes == 5);
}

TEST_CASE("Config::load: HOOFY_DATA_DIR overrides config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"memory": {"data_dir": "/from/file"}})");
    setenv("HOOFY_DATA_DIR", "/from/env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.memory.data_dir == "/from/env");
    REQUIRE(cfg.memory.db_path() == "/from/env/memory.db");

    unsetenv("HOOFY_DATA_DIR");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.data_dir == "~/.hoofy");
    REQUIRE(cfg.memory.max_observation_length == 2000);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();

    REQUIRE(std::filesystem::exists(g.config_path()));
    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j == Config::defaults_json());
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"memory": {"max_search_results": 5}, "editor": "vim"})");

    Config cfg = Config::load();
    REQUIRE(cfg.memory.max_search_results == 5);

    nlohmann::json j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["memory"]["max_search_results"] == 5);
    REQUIRE(j["memory"]["busy_timeout_ms"] == 5000);
    REQUIRE(j["memory"]["data_dir"] == "~/.hoofy");
    // Unknown keys survive migration
    REQUIRE(j["editor"] == "vim");
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["memory"]["max_context_results"] = 3;
    g.write_config(full.dump(4) + "\n");

    std::string before = g.read_config();
    Config cfg = Config::load();
    REQUIRE(cfg.memory.max_context_results == 3);
    REQUIRE(g.read_config() == before);
}

TEST_CASE("Config::load: defaults roundtrip without re-migration", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    std::string first = g.read_config();
    Config::load();
    REQUIRE(g.read_config() == first);
}

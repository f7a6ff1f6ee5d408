#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace hoofy {

struct MemoryConfig {
    std::string data_dir = "~/.hoofy";
    uint32_t max_observation_length = 2000;
    uint32_t max_context_results = 20;
    uint32_t max_search_results = 20;
    int32_t dedupe_window_minutes = 15;   // <= 0 falls back to 15
    uint32_t busy_timeout_ms = 5000;

    // Full path of the database file inside data_dir
    std::string db_path() const;
};

struct Config {
    MemoryConfig memory;

    // Load from a JSON config file (default ~/.hoofy/config.json) + env vars.
    // A missing file is created with defaults; missing keys are merged in.
    static Config load(const std::string& path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document without touching the filesystem or env
    static Config from_json(const nlohmann::json& j);
};

} // namespace hoofy

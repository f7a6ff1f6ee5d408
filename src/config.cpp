#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace hoofy {

std::string MemoryConfig::db_path() const {
    std::string dir = expand_home(data_dir);
    if (dir.empty()) return "memory.db";
    if (dir.back() == '/') return dir + "memory.db";
    return dir + "/memory.db";
}

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"data_dir", "~/.hoofy"},
            {"max_observation_length", 2000},
            {"max_context_results", 20},
            {"max_search_results", 20},
            {"dedupe_window_minutes", 15},
            {"busy_timeout_ms", 5000}
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

// Positive counts up to max; anything else keeps the default
static void read_count(const nlohmann::json& m, const char* key, uint32_t& out,
                       uint64_t max = std::numeric_limits<uint32_t>::max()) {
    if (!m.contains(key) || !m[key].is_number_unsigned()) return;
    uint64_t v = m[key].get<uint64_t>();
    if (v == 0 || v > max) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << v << "\n";
        return;
    }
    out = static_cast<uint32_t>(v);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.contains("memory") || !j["memory"].is_object()) return cfg;

    auto& m = j["memory"];
    if (m.contains("data_dir") && m["data_dir"].is_string())
        cfg.memory.data_dir = m["data_dir"].get<std::string>();
    read_count(m, "max_observation_length", cfg.memory.max_observation_length);
    read_count(m, "max_context_results", cfg.memory.max_context_results);
    read_count(m, "max_search_results", cfg.memory.max_search_results);
    // sqlite3_busy_timeout takes an int
    read_count(m, "busy_timeout_ms", cfg.memory.busy_timeout_ms,
               static_cast<uint64_t>(std::numeric_limits<int>::max()));
    if (m.contains("dedupe_window_minutes") && m["dedupe_window_minutes"].is_number_integer()) {
        auto& w = m["dedupe_window_minutes"];
        bool fits = w.is_number_unsigned()
            ? w.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
            : w.get<int64_t>() >= std::numeric_limits<int32_t>::min();
        if (fits)
            cfg.memory.dedupe_window_minutes = static_cast<int32_t>(w.get<int64_t>());
        else
            std::cerr << "[config] Ignoring out-of-range dedupe_window_minutes: " << w << "\n";
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path.empty() ? "~/.hoofy/config.json" : path);
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                } else {
                    std::cerr << "[config] Failed to write migrated config: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("HOOFY_DATA_DIR"))
        cfg.memory.data_dir = v;

    return cfg;
}

} // namespace hoofy

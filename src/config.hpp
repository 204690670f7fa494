#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace largefile {

struct Config {
    // Access strategy thresholds (bytes)
    uint64_t memory_threshold = 52428800;   // 50 MiB
    uint64_t mmap_threshold = 524288000;    // 500 MiB
    uint32_t streaming_chunk_size = 8192;

    uint32_t max_line_length = 1000;
    uint32_t truncate_length = 500;

    double fuzzy_threshold = 0.8;
    uint32_t max_search_results = 20;
    uint32_t context_lines = 2;

    std::string backup_dir = ".largefile_backups";

    bool enable_outline = true;
    uint32_t outline_timeout = 5;           // seconds

    bool edit_locking = false;

    // Load from ~/.largefile/config.json (if present) + LARGEFILE_* env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config object; missing or mistyped keys keep current values
    void apply_json(const nlohmann::json& j);

    // Apply LARGEFILE_* environment overrides
    void apply_env();
};

} // namespace largefile

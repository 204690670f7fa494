#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace largefile {

nlohmann::json Config::defaults_json() {
    return {
        {"memory_threshold", 52428800},
        {"mmap_threshold", 524288000},
        {"streaming_chunk_size", 8192},
        {"max_line_length", 1000},
        {"truncate_length", 500},
        {"fuzzy_threshold", 0.8},
        {"max_search_results", 20},
        {"context_lines", 2},
        {"backup_dir", ".largefile_backups"},
        {"enable_outline", true},
        {"outline_timeout", 5},
        {"edit_locking", false}
    };
}

namespace {

// Non-negative integer, whether parsed (unsigned) or built in code (signed)
bool is_count(const nlohmann::json& v) {
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

template <typename T>
void json_count(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (!is_count(v) || v.get<uint64_t>() > std::numeric_limits<T>::max()) {
        std::cerr << "[config] Ignoring invalid " << key << "=" << v.dump() << "\n";
        return;
    }
    out = static_cast<T>(v.get<uint64_t>());
}

} // namespace

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    json_count(j, "memory_threshold", memory_threshold);
    json_count(j, "mmap_threshold", mmap_threshold);
    json_count(j, "streaming_chunk_size", streaming_chunk_size);
    json_count(j, "max_line_length", max_line_length);
    json_count(j, "truncate_length", truncate_length);
    if (j.contains("fuzzy_threshold") && j["fuzzy_threshold"].is_number())
        fuzzy_threshold = j["fuzzy_threshold"].get<double>();
    json_count(j, "max_search_results", max_search_results);
    json_count(j, "context_lines", context_lines);
    if (j.contains("backup_dir") && j["backup_dir"].is_string())
        backup_dir = j["backup_dir"].get<std::string>();
    if (j.contains("enable_outline") && j["enable_outline"].is_boolean())
        enable_outline = j["enable_outline"].get<bool>();
    json_count(j, "outline_timeout", outline_timeout);
    if (j.contains("edit_locking") && j["edit_locking"].is_boolean())
        edit_locking = j["edit_locking"].get<bool>();
}

namespace {

template <typename T>
void env_unsigned(const char* name, T& out) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        size_t used = 0;
        std::string s = trim(v);
        unsigned long long parsed = std::stoull(s, &used);
        if (used != s.size() || s[0] == '-') throw std::invalid_argument("trailing characters");
        if (parsed > std::numeric_limits<T>::max()) throw std::out_of_range("too large");
        out = static_cast<T>(parsed);
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
    }
}

void env_double(const char* name, double& out) {
    const char* v = std::getenv(name);
    if (!v) return;
    try {
        size_t used = 0;
        std::string s = trim(v);
        double parsed = std::stod(s, &used);
        if (used != s.size()) throw std::invalid_argument("trailing characters");
        out = parsed;
    } catch (const std::exception&) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
    }
}

void env_bool(const char* name, bool& out) {
    const char* v = std::getenv(name);
    if (!v) return;
    std::string s = to_lower(trim(v));
    if (s == "true" || s == "1" || s == "yes") {
        out = true;
    } else if (s == "false" || s == "0" || s == "no") {
        out = false;
    } else {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
    }
}

} // namespace

void Config::apply_env() {
    env_unsigned("LARGEFILE_MEMORY_THRESHOLD", memory_threshold);
    env_unsigned("LARGEFILE_MMAP_THRESHOLD", mmap_threshold);
    env_unsigned("LARGEFILE_STREAMING_CHUNK_SIZE", streaming_chunk_size);
    env_unsigned("LARGEFILE_MAX_LINE_LENGTH", max_line_length);
    env_unsigned("LARGEFILE_TRUNCATE_LENGTH", truncate_length);
    env_double("LARGEFILE_FUZZY_THRESHOLD", fuzzy_threshold);
    env_unsigned("LARGEFILE_MAX_SEARCH_RESULTS", max_search_results);
    env_unsigned("LARGEFILE_CONTEXT_LINES", context_lines);
    if (const char* v = std::getenv("LARGEFILE_BACKUP_DIR"))
        backup_dir = v;
    env_bool("LARGEFILE_ENABLE_OUTLINE", enable_outline);
    env_unsigned("LARGEFILE_OUTLINE_TIMEOUT", outline_timeout);
    env_bool("LARGEFILE_EDIT_LOCKING", edit_locking);
}

Config Config::load() {
    Config cfg;
    cfg.apply_json(defaults_json());

    std::string config_path = expand_home("~/.largefile/config.json");
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            cfg.apply_json(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
        }
    }

    // Environment variables always override config file
    cfg.apply_env();

    if (cfg.streaming_chunk_size == 0) {
        std::cerr << "[config] streaming_chunk_size must be positive, using 8192\n";
        cfg.streaming_chunk_size = 8192;
    }
    return cfg;
}

} // namespace largefile

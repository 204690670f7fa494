#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

// Helper: create a temp directory and return its path
inline std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "largefile_test_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// Helper: write raw bytes for setup
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

// Helper: read raw bytes for verification
inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// RAII temp directory, removed with its contents
struct TempDir {
    std::string path = make_temp_dir();

    TempDir() = default;
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return path + "/" + name; }
};

inline size_t count_files(const std::string& dir) {
    if (!std::filesystem::exists(dir)) return 0;
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

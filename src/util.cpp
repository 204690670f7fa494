#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <random>

namespace largefile {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string generate_id() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    thread_local std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    // Only "~" and "~/..." refer to the current user
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + path.substr(1);
    }
    return path;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace largefile

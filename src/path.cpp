#include "path.hpp"
#include "util.hpp"
#include <filesystem>

namespace largefile {

std::string resolve_path(const std::string& path) {
    std::filesystem::path p(expand_home(path));
    if (p.is_relative()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (!ec) p = cwd / p;
    }

    // Resolves symlinks in the existing prefix; a missing tail stays lexical
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(p, ec);
    p = ec ? p.lexically_normal() : resolved.lexically_normal();

    // lexically_normal keeps the trailing separator of "dir/"
    std::string out = p.string();
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

} // namespace largefile

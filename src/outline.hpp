#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace largefile {

struct OutlineItem {
    std::string name;
    std::string type;          // "function", "class", "method", ...
    size_t line_number = 0;    // 1-based, inclusive
    size_t end_line = 0;
    size_t line_count = 0;
    std::vector<OutlineItem> children;
};

// Structural outline of a source file, e.g. from a syntax tree. Optional.
class OutlineProvider {
public:
    virtual ~OutlineProvider() = default;
    virtual std::vector<OutlineItem> outline(const std::string& path,
                                             const std::string& content) = 0;
};

// Run provider within budget. Failure or timeout yields an empty outline.
std::vector<OutlineItem> outline_with_budget(std::shared_ptr<OutlineProvider> provider,
                                             const std::string& path,
                                             const std::string& content,
                                             std::chrono::milliseconds budget);

// Innermost item containing line, or nullptr.
const OutlineItem* find_enclosing(const std::vector<OutlineItem>& items, size_t line);

} // namespace largefile

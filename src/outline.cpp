#include "outline.hpp"
#include <future>
#include <iostream>
#include <thread>

namespace largefile {

std::vector<OutlineItem> outline_with_budget(std::shared_ptr<OutlineProvider> provider,
                                             const std::string& path,
                                             const std::string& content,
                                             std::chrono::milliseconds budget) {
    if (!provider) return {};

    // The task owns copies of its inputs so a timed-out run can finish alone
    auto task = std::make_shared<std::packaged_task<std::vector<OutlineItem>()>>(
        [provider, path, content]() { return provider->outline(path, content); });
    auto result = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (result.wait_for(budget) != std::future_status::ready) {
        std::cerr << "[outline] Timed out after " << budget.count() << "ms for " << path << "\n";
        return {};
    }
    try {
        return result.get();
    } catch (const std::exception& e) {
        std::cerr << "[outline] Provider failed for " << path << ": " << e.what() << "\n";
        return {};
    }
}

const OutlineItem* find_enclosing(const std::vector<OutlineItem>& items, size_t line) {
    for (const auto& item : items) {
        if (line < item.line_number || line > item.end_line) continue;
        const OutlineItem* inner = find_enclosing(item.children, line);
        return inner ? inner : &item;
    }
    return nullptr;
}

} // namespace largefile

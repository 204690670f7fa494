#include "tool.hpp"
#include "tools/overview.hpp"
#include "tools/search.hpp"
#include "tools/read.hpp"
#include "tools/edit.hpp"

namespace largefile {

std::vector<std::unique_ptr<Tool>> create_builtin_tools(Engine& engine) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<OverviewTool>(engine));
    tools.push_back(std::make_unique<SearchTool>(engine));
    tools.push_back(std::make_unique<ReadTool>(engine));
    tools.push_back(std::make_unique<EditTool>(engine));
    return tools;
}

Tool* find_tool(const std::vector<std::unique_ptr<Tool>>& tools, const std::string& name) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

} // namespace largefile

#include "overview.hpp"
#include "tool_util.hpp"
#include "../engine.hpp"

namespace largefile {

namespace {

nlohmann::json outline_json(const std::vector<OutlineItem>& items) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back({
            {"name", item.name},
            {"type", item.type},
            {"line_number", item.line_number},
            {"end_line", item.end_line},
            {"line_count", item.line_count},
            {"children", outline_json(item.children)},
        });
    }
    return arr;
}

} // namespace

ToolResult OverviewTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;

    std::string path = args["path"].get<std::string>();
    return run_tool([&]() {
        auto ov = engine_.overview(path);
        nlohmann::json out = {
            {"line_count", ov.line_count},
            {"file_size", ov.file_size},
            {"encoding", ov.encoding},
            {"has_long_lines", ov.has_long_lines},
            {"strategy", strategy_name(ov.strategy)},
            {"outline", outline_json(ov.outline)},
            {"search_hints", ov.search_hints},
        };
        return ToolResult{true, out.dump(2)};
    });
}

std::string OverviewTool::description() const {
    return "Summarize a file: line count, size, encoding, long lines, outline and search hints";
}

std::string OverviewTool::parameters_json() const {
    return R"({"type":"object","properties":{"path":{"type":"string","description":"The path of the file to inspect"}},"required":["path"]})";
}

} // namespace largefile

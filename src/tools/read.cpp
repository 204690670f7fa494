#include "read.hpp"
#include "tool_util.hpp"
#include "../engine.hpp"

namespace largefile {

ToolResult ReadTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (!args.contains("target")) {
        return ToolResult{false, "Missing required parameter: target"};
    }

    const auto& target = args["target"];
    if (!target.is_string() && !target.is_number_integer()) {
        return ToolResult{false, "Parameter target must be a line number or a pattern"};
    }

    std::string mode = "lines";
    if (args.contains("mode") && !args["mode"].is_null()) {
        if (!args["mode"].is_string()) {
            return ToolResult{false, "Parameter must be a string: mode"};
        }
        mode = args["mode"].get<std::string>();
    }

    std::string path = args["path"].get<std::string>();

    return run_tool([&]() {
        ReadWindow w;
        if (target.is_string()) {
            w = engine_.read_at_pattern(path, target.get<std::string>(), mode);
        } else {
            int64_t line = target.get<int64_t>();
            if (line < 1) {
                throw std::invalid_argument("Line numbers start at 1");
            }
            w = engine_.read_at_line(path, static_cast<size_t>(line), mode);
        }

        nlohmann::json out = {
            {"content", w.content},
            {"start_line", w.start_line},
            {"end_line", w.end_line},
            {"total_lines", w.total_lines},
            {"target_type", w.target_type},
            {"mode", w.mode},
        };
        if (w.match_line) out["match_line"] = *w.match_line;
        if (w.similarity_score) out["similarity_score"] = *w.similarity_score;
        if (!w.pattern.empty()) out["pattern"] = w.pattern;
        return ToolResult{true, out.dump(2)};
    });
}

std::string ReadTool::description() const {
    return "Read a window of lines starting at a line number or around the first match of a pattern";
}

std::string ReadTool::parameters_json() const {
    return R"({"type":"object","properties":{"path":{"type":"string","description":"The file to read"},"target":{"type":["integer","string"],"description":"1-based line number or text pattern"},"mode":{"type":"string","enum":["lines","semantic"],"description":"lines (default) or semantic to read the enclosing definition"}},"required":["path","target"]})";
}

} // namespace largefile

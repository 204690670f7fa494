#include "search.hpp"
#include "tool_util.hpp"
#include "../engine.hpp"

namespace largefile {

ToolResult SearchTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (auto err = require_string(args, "pattern")) return *err;

    size_t max_results = engine_.config().max_search_results;
    size_t context_lines = engine_.config().context_lines;
    bool fuzzy = true;
    if (auto err = optional_unsigned(args, "max_results", max_results)) return *err;
    if (auto err = optional_unsigned(args, "context_lines", context_lines)) return *err;
    if (auto err = optional_bool(args, "fuzzy", fuzzy)) return *err;

    std::string path = args["path"].get<std::string>();
    std::string pattern = args["pattern"].get<std::string>();

    return run_tool([&]() {
        auto results = engine_.search(path, pattern, max_results, context_lines, fuzzy);

        nlohmann::json arr = nlohmann::json::array();
        for (const auto& r : results) {
            nlohmann::json spans = nlohmann::json::array();
            for (const auto& s : r.submatches) {
                spans.push_back({{"start", s.start}, {"end", s.end}});
            }
            arr.push_back({
                {"line_number", r.line_number},
                {"match", r.match},
                {"truncated", r.truncated},
                {"context_before", r.context_before},
                {"context_after", r.context_after},
                {"semantic_context", r.semantic_context},
                {"similarity_score", r.similarity_score},
                {"match_type", match_kind_name(r.match_type)},
                {"submatches", spans},
            });
        }

        nlohmann::json out = {
            {"results", arr},
            {"total_matches", results.size()},
            {"fuzzy_enabled", fuzzy},
            {"pattern", pattern},
        };
        return ToolResult{true, out.dump(2)};
    });
}

std::string SearchTool::description() const {
    return "Find lines matching a pattern, exactly or by similarity, with surrounding context";
}

std::string SearchTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"The file to search"},"pattern":{"type":"string","description":"Text to look for"},"max_results":{"type":"integer","description":"Maximum number of results (default 20)"},"context_lines":{"type":"integer","description":"Lines of context before and after each match (default 2)"},"fuzzy":{"type":"boolean","description":"Also return similar lines (default true)"}},"required":["path","pattern"]})json";
}

} // namespace largefile

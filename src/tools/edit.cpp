#include "edit.hpp"
#include "tool_util.hpp"
#include "../engine.hpp"

namespace largefile {

ToolResult EditTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (auto err = require_string(args, "search_text")) return *err;
    if (auto err = require_string(args, "replace_text")) return *err;

    bool fuzzy = true;
    bool preview = true;
    if (auto err = optional_bool(args, "fuzzy", fuzzy)) return *err;
    if (auto err = optional_bool(args, "preview", preview)) return *err;

    std::string path = args["path"].get<std::string>();
    std::string search_text = args["search_text"].get<std::string>();
    std::string replace_text = args["replace_text"].get<std::string>();

    return run_tool([&]() {
        auto r = engine_.edit(path, search_text, replace_text, fuzzy, preview);
        nlohmann::json out = {
            {"success", r.success},
            {"preview", r.preview},
            {"changes_made", r.changes_made},
            {"line_number", r.line_number},
            {"similarity_used", r.similarity_used},
            {"match_type", edit_match_type_name(r.match_type)},
            {"backup_created", r.backup_created ? nlohmann::json(*r.backup_created)
                                                : nlohmann::json(nullptr)},
        };
        if (!r.success) {
            out["error"] = "Edit failed: " + r.preview;
            out["suggestion"] = suggestion_for(EditError::Kind::NoTarget);
        }
        return ToolResult{r.success, out.dump(2)};
    });
}

std::string EditTool::description() const {
    return "Replace text in a file, exactly or by similarity. Previews by default; "
           "a committed edit backs up the file first";
}

std::string EditTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"The file to edit"},"search_text":{"type":"string","description":"Text to replace"},"replace_text":{"type":"string","description":"Replacement text"},"fuzzy":{"type":"boolean","description":"Fall back to the most similar line (default true)"},"preview":{"type":"boolean","description":"Only show the diff (default true)"}},"required":["path","search_text","replace_text"]})json";
}

} // namespace largefile

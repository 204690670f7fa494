#pragma once
#include "../tool.hpp"

namespace largefile {

class SearchTool : public Tool {
public:
    explicit SearchTool(Engine& engine) : engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "search"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    Engine& engine_;
};

} // namespace largefile

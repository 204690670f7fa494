#pragma once
#include "../tool.hpp"

namespace largefile {

class OverviewTool : public Tool {
public:
    explicit OverviewTool(Engine& engine) : engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "overview"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    Engine& engine_;
};

} // namespace largefile

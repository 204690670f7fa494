#pragma once
#include "../tool.hpp"

namespace largefile {

class EditTool : public Tool {
public:
    explicit EditTool(Engine& engine) : engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "edit"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    Engine& engine_;
};

} // namespace largefile

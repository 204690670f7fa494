#pragma once
#include "../tool.hpp"

namespace largefile {

class ReadTool : public Tool {
public:
    explicit ReadTool(Engine& engine) : engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "read"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    Engine& engine_;
};

} // namespace largefile

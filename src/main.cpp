#include "config.hpp"
#include "engine.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <iterator>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: largefile [options] [TOOL [ARGS_JSON]]\n"
              << "\n"
              << "Runs one tool call and prints its JSON result. ARGS_JSON is read from\n"
              << "stdin when omitted. Without TOOL, reads one call per line from stdin:\n"
              << "  TOOL ARGS_JSON\n"
              << "\n"
              << "Tools:\n"
              << "  overview   {\"path\": ...}\n"
              << "  search     {\"path\": ..., \"pattern\": ..., \"max_results\", \"context_lines\", \"fuzzy\"}\n"
              << "  read       {\"path\": ..., \"target\": LINE|PATTERN, \"mode\": \"lines\"|\"semantic\"}\n"
              << "  edit       {\"path\": ..., \"search_text\": ..., \"replace_text\": ..., \"fuzzy\", \"preview\"}\n"
              << "\n"
              << "Options:\n"
              << "  --list               Print tool names, descriptions and parameter schemas\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Configuration: ~/.largefile/config.json, overridden by LARGEFILE_* variables\n"
              << "  LARGEFILE_MEMORY_THRESHOLD, LARGEFILE_MMAP_THRESHOLD, LARGEFILE_BACKUP_DIR,\n"
              << "  LARGEFILE_FUZZY_THRESHOLD, LARGEFILE_EDIT_LOCKING, ...\n";
}

static void print_tools(const std::vector<std::unique_ptr<largefile::Tool>>& tools) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tool : tools) {
        auto spec = tool->spec();
        arr.push_back({
            {"name", spec.name},
            {"description", spec.description},
            {"parameters", nlohmann::json::parse(spec.parameters_json)},
        });
    }
    std::cout << arr.dump(2) << "\n";
}

static bool run_call(const std::vector<std::unique_ptr<largefile::Tool>>& tools,
                     const std::string& name, const std::string& args_json) {
    largefile::Tool* tool = largefile::find_tool(tools, name);
    if (!tool) {
        std::cerr << "Unknown tool: " << name << "\n";
        return false;
    }
    auto result = tool->execute(args_json);
    (result.success ? std::cout : std::cerr) << result.output << "\n";
    return result.success;
}

// One "TOOL ARGS_JSON" call per line; sessions stay warm between calls.
static int run_loop(const std::vector<std::unique_ptr<largefile::Tool>>& tools) {
    int failures = 0;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;
        if (line == "/quit" || line == "/exit") break;

        auto space = line.find(' ');
        std::string name = line.substr(0, space);
        std::string args = space == std::string::npos ? "{}" : line.substr(space + 1);
        if (!run_call(tools, name, args)) ++failures;
        std::cout.flush();
    }
    return failures == 0 ? 0 : 1;
}

int main(int argc, char* argv[]) try {
    std::string tool_name;
    std::string args_json;
    bool list = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list = true;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (tool_name.empty()) {
            tool_name = argv[i];
        } else if (args_json.empty()) {
            args_json = argv[i];
        } else {
            std::cerr << "Unexpected argument: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = largefile::Config::load();
    largefile::Engine engine(config);
    auto tools = largefile::create_builtin_tools(engine);

    if (list) {
        print_tools(tools);
        return 0;
    }
    if (tool_name.empty()) {
        return run_loop(tools);
    }
    if (args_json.empty()) {
        args_json.assign(std::istreambuf_iterator<char>(std::cin),
                         std::istreambuf_iterator<char>());
    }
    return run_call(tools, tool_name, args_json) ? 0 : 1;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

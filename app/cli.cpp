#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tauri_mcp::cli {

    namespace detail {

        static constexpr auto app_description =
                "tauri-mcp: MCP server for testing and interacting with Tauri v2 applications.\n"
                "Speaks line-delimited JSON-RPC 2.0 on stdin/stdout; diagnostics go to stderr.";

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg, cli_request& request) {
        CLI::App app{detail::app_description, "tauri-mcp"};

        bool show_version = false;
        std::string config_arg{cfg.config_path.string()};
        std::string log_level_arg{};
        std::string app_path_arg{};
        std::vector<std::string> app_args{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--config", config_arg, "JSON configuration file (missing file means defaults)");
        app.add_option("--log-level", log_level_arg, "Log level: trace|debug|info|warn|error|off");
        app.add_option("--app-path", app_path_arg, "Tauri application to launch when the server starts");
        app.add_option("--app-arg", app_args, "Argument for the startup application (repeatable)");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");

        app.require_subcommand(0, 1);
        app.add_subcommand("serve", "Start the MCP server on stdio (default)");
        auto* tool = app.add_subcommand("tool", "Execute a single tool and exit");
        tool->add_option("name", request.tool_name, "Tool name, e.g. find_running_apps")->required();
        tool->add_option("arguments", request.tool_arguments, "Tool arguments as a JSON object");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "tauri-mcp " << version << '\n';
            return std::optional<int>{0};
        }

        cfg.config_path = config_arg;
        load_config_file(cfg);

        if (!log_level_arg.empty() && !try_parse_log_level(log_level_arg, cfg.level)) {
            std::cerr << "invalid --log-level value: " << log_level_arg
                      << " (expected trace|debug|info|warn|error|off)\n";
            return std::optional<int>{2};
        }
        set_log_level(cfg.level);

        if (!app_path_arg.empty()) {
            cfg.app_path = app_path_arg;
            cfg.app_args = std::move(app_args);
        }
        else if (!app_args.empty()) {
            std::cerr << "--app-arg requires --app-path\n";
            return std::optional<int>{2};
        }

        request.mode = tool->parsed() ? run_mode::tool : run_mode::serve;

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run(const server_config& cfg, const cli_request& request) {
        if (request.mode == run_mode::tool) {
            return mcp::run_single_tool(cfg, request.tool_name, request.tool_arguments, std::cout, std::cerr);
        }
        return mcp::run_mcp_server(cfg);
    }

}  // namespace tauri_mcp::cli

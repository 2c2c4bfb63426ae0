#include "utils.hpp"

namespace tauri_mcp::test {
    using namespace std::string_view_literals;

    namespace detail {
        inline internal::subprocess_result run_cli(std::vector<std::string> args) {
            args.insert(args.begin(), TAURI_MCP_CLI_PATH);
            return internal::run_subprocess(args, 15000);
        }
    }  // namespace detail

    TEST_CASE("009: version flag", "[009][cli]") {
        auto res = detail::run_cli({"--version"});
        CHECK(res.exit_code == 0);
        CHECK(res.stdout_output == std::format("tauri-mcp {}\n", tauri_mcp::version));
    }

    TEST_CASE("009: print-config reflects file and command line", "[009][cli]") {
        detail::temp_dir temp{"tauri_mcp_cli_cfg"};
        auto path = temp.path / "tauri-mcp.json";
        detail::write_file(path, R"({"log_capacity":42,"features":{"event_streaming":true}})");

        auto res = detail::run_cli(
                {"--config", path.string(), "--app-path", "/bin/true", "--app-arg=--flag", "--print-config"});
        CHECK(res.exit_code == 0);
        CHECK(detail::contains(res.stdout_output, "\"log_capacity\": 42"));
        CHECK(detail::contains(res.stdout_output, "\"event_streaming\": true"));
        CHECK(detail::contains(res.stdout_output, "\"app_path\": \"/bin/true\""));
        CHECK(detail::contains(res.stdout_output, "--flag"));
        CHECK(detail::contains(res.stdout_output, path.string()));
    }

    TEST_CASE("009: invalid command lines", "[009][cli]") {
        auto bad_level = detail::run_cli({"--config", "/nonexistent/x.json", "--log-level", "loud", "--print-config"});
        CHECK(bad_level.exit_code == 2);
        CHECK(detail::contains(bad_level.stderr_output, "invalid --log-level value: loud"));

        auto stray_arg = detail::run_cli({"--config", "/nonexistent/x.json", "--app-arg", "x", "--print-config"});
        CHECK(stray_arg.exit_code == 2);
        CHECK(detail::contains(stray_arg.stderr_output, "--app-arg requires --app-path"));

        auto no_tool_name = detail::run_cli({"--config", "/nonexistent/x.json", "tool"});
        CHECK(no_tool_name.exit_code != 0);

        detail::temp_dir temp{"tauri_mcp_cli_badcfg"};
        auto path = temp.path / "tauri-mcp.json";
        detail::write_file(path, R"({"not_an_option":1})");
        auto bad_config = detail::run_cli({"--config", path.string(), "--print-config"});
        CHECK(bad_config.exit_code == 1);
        CHECK(detail::contains(bad_config.stderr_output, "fatal: Configuration error"));
    }

    TEST_CASE("009: single tool invocation", "[009][cli]") {
        auto apps = detail::run_cli({"--config", "/nonexistent/x.json", "tool", "find_running_apps"});
        CHECK(apps.exit_code == 0);
        CHECK(apps.stdout_output.starts_with(R"({"apps":[)"));

        auto stop = detail::run_cli(
                {"--config", "/nonexistent/x.json", "tool", "stop_app", R"({"process_id":"x"})"});
        CHECK(stop.exit_code == 1);
        CHECK(stop.stdout_output.empty());
        CHECK(detail::contains(stop.stderr_output, "Process not found: x"));

        auto unknown = detail::run_cli({"--config", "/nonexistent/x.json", "tool", "warp_drive"});
        CHECK(unknown.exit_code == 1);
        CHECK(detail::contains(unknown.stderr_output, "Unknown tool: warp_drive"));

        auto bad_json = detail::run_cli({"--config", "/nonexistent/x.json", "tool", "stop_app", "[1,2]"});
        CHECK(bad_json.exit_code == 1);
        CHECK(detail::contains(bad_json.stderr_output, "must be a JSON object"));
    }

    TEST_CASE("009: single tool honours disabled discovery", "[009][cli]") {
        detail::temp_dir temp{"tauri_mcp_cli_nodiscover"};
        auto path = temp.path / "tauri-mcp.json";
        detail::write_file(path, R"({"features":{"auto_discover":false}})");

        auto res = detail::run_cli({"--config", path.string(), "tool", "find_running_apps"});
        CHECK(res.exit_code == 1);
        CHECK(detail::contains(res.stderr_output, "Auto-discovery is disabled by configuration"));
    }
}  // namespace tauri_mcp::test

#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tauri_mcp {

    using namespace std::string_view_literals;

    /*
     * tauri-mcp Server Config Options
     *
     * Feature flags (config file)
     * - auto_discover: Allow find_running_apps to scan the OS process table.
     * - session_management, event_streaming, performance_profiling, network_interception:
     *   accepted and reported by --print-config; no behavior is attached to them yet.
     *
     * Process tracking (config file)
     * - log_capacity: Per-process log queue capacity; oldest lines are dropped beyond it.
     * - stop_timeout_ms: Grace period between SIGTERM and SIGKILL in stop_app.
     * - discovery_patterns: Case-insensitive name/command-line markers for find_running_apps.
     *
     * DevTools bridge (config file)
     * - devtools_port_first/devtools_port_last: Inclusive port range probed for a debug endpoint.
     * - http_timeout_ms: Connect/read budget per DevTools HTTP request.
     *
     * Startup (command line)
     * - config_path: JSON config file; a missing file means defaults.
     * - level: Log threshold for stderr diagnostics.
     * - app_path/app_args: Application launched when the server starts.
     * - print_config: Print the resolved config and exit.
     */

    struct feature_flags {
        bool auto_discover{true};
        bool session_management{true};
        bool event_streaming{false};
        bool performance_profiling{false};
        bool network_interception{false};
    };

    inline constexpr bool try_parse_log_level(std::string_view text, log_level& out) {
        if (utils::str_case_eq(text, "trace"sv)) {
            out = log_level::trace;
            return true;
        }
        if (utils::str_case_eq(text, "debug"sv)) {
            out = log_level::debug;
            return true;
        }
        if (utils::str_case_eq(text, "info"sv)) {
            out = log_level::info;
            return true;
        }
        if (utils::str_case_eq(text, "warn"sv) || utils::str_case_eq(text, "warning"sv)) {
            out = log_level::warn;
            return true;
        }
        if (utils::str_case_eq(text, "error"sv)) {
            out = log_level::error;
            return true;
        }
        if (utils::str_case_eq(text, "off"sv)) {
            out = log_level::off;
            return true;
        }
        return false;
    }

    inline constexpr log_level parse_log_level(std::string_view text) {
        log_level parsed = log_level::info;
        if (try_parse_log_level(text, parsed)) {
            return parsed;
        }
        return log_level::info;
    }

    struct server_config {
        std::filesystem::path config_path{"tauri-mcp.json"};
        log_level level{log_level::info};
        std::optional<std::filesystem::path> app_path{};
        std::vector<std::string> app_args{};

        feature_flags features{};

        std::size_t log_capacity{1000U};
        int stop_timeout_ms{5'000};
        std::vector<std::string> discovery_patterns{"tauri"};

        uint16_t devtools_port_first{9222};
        uint16_t devtools_port_last{9249};
        int http_timeout_ms{1'000};

        bool print_config{false};
    };

    // Applies the JSON config file at `cfg.config_path` if it exists.
    // Returns true when a file was loaded; throws tool_error on malformed content.
    bool load_config_file(server_config& cfg);

    void print_config(const server_config& cfg, std::ostream& os);

}  // namespace tauri_mcp

#include "tauri_mcp/tools.hpp"

#include "tauri_mcp/error.hpp"

#include <glaze/glaze.hpp>

#include <climits>
#include <format>
#include <map>

namespace glz {

    template <>
    struct meta<tauri_mcp::app_candidate> {
        using T = tauri_mcp::app_candidate;
        static constexpr auto value = object(&T::pid, &T::name, &T::cmd, &T::exe);
    };

    template <>
    struct meta<tauri_mcp::disk_usage> {
        using T = tauri_mcp::disk_usage;
        static constexpr auto value = object(&T::read_bytes, &T::written_bytes);
    };

    template <>
    struct meta<tauri_mcp::resource_usage> {
        using T = tauri_mcp::resource_usage;
        static constexpr auto value = object(
                &T::cpu_usage,
                &T::memory_usage,
                &T::virtual_memory,
                "disk_usage",
                &T::disk,
                &T::status,
                &T::start_time,
                &T::run_time);
    };

    template <>
    struct meta<tauri_mcp::window_info> {
        using T = tauri_mcp::window_info;
        static constexpr auto value = object(
                &T::title, &T::x, &T::y, &T::width, &T::height, &T::is_visible, &T::is_focused, &T::platform);
    };

}  // namespace glz

namespace tauri_mcp {

    namespace detail {

        // ── Tool schemas ────────────────────────────────────────────────

        static constexpr auto launch_app_schema =
                R"json({"type":"object","properties":{"app_path":{"type":"string","description":"Path to the Tauri application"},"args":{"type":"array","items":{"type":"string"},"description":"Optional launch arguments"}},"required":["app_path"]})json"sv;
        static constexpr auto stop_app_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app to stop"}},"required":["process_id"]})json"sv;
        static constexpr auto get_app_logs_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"},"lines":{"type":"number","description":"Number of recent lines to return"}},"required":["process_id"]})json"sv;
        static constexpr auto take_screenshot_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"},"output_path":{"type":"string","description":"Optional path to save the screenshot"}},"required":["process_id"]})json"sv;
        static constexpr auto process_only_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"}},"required":["process_id"]})json"sv;
        static constexpr auto send_keyboard_input_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"},"keys":{"type":"string","description":"Keys to send; 'ctrl+' or 'cmd+' prefixed strings are sent as a key chord"}},"required":["process_id","keys"]})json"sv;
        static constexpr auto send_mouse_click_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"},"x":{"type":"number","description":"X coordinate"},"y":{"type":"number","description":"Y coordinate"},"button":{"type":"string","enum":["left","right","middle"],"description":"Mouse button"}},"required":["process_id","x","y"]})json"sv;
        static constexpr auto execute_js_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"},"javascript_code":{"type":"string","description":"JavaScript code to execute"}},"required":["process_id","javascript_code"]})json"sv;
        static constexpr auto call_ipc_command_schema =
                R"json({"type":"object","properties":{"process_id":{"type":"string","description":"Process ID of the app"},"command_name":{"type":"string","description":"Name of the IPC command"},"args":{"type":"object","description":"Arguments to pass to the command"}},"required":["process_id","command_name"]})json"sv;
        static constexpr auto find_running_apps_schema = R"json({"type":"object","properties":{}})json"sv;
        static constexpr auto attach_to_app_schema =
                R"json({"type":"object","properties":{"pid":{"type":"number","description":"Process ID of the running app"}},"required":["pid"]})json"sv;

        // ── Argument types ──────────────────────────────────────────────

        struct launch_args {
            std::string app_path{};
            std::optional<std::vector<std::string>> args{};
            struct glaze {
                using T = launch_args;
                static constexpr auto value = glz::object(&T::app_path, &T::args);
            };
        };

        struct process_args {
            std::string process_id{};
            struct glaze {
                using T = process_args;
                static constexpr auto value = glz::object(&T::process_id);
            };
        };

        struct logs_args {
            std::string process_id{};
            std::optional<int64_t> lines{};
            struct glaze {
                using T = logs_args;
                static constexpr auto value = glz::object(&T::process_id, &T::lines);
            };
        };

        struct attach_args {
            int64_t pid{};
            struct glaze {
                using T = attach_args;
                static constexpr auto value = glz::object(&T::pid);
            };
        };

        struct screenshot_args {
            std::string process_id{};
            std::optional<std::string> output_path{};
            struct glaze {
                using T = screenshot_args;
                static constexpr auto value = glz::object(&T::process_id, &T::output_path);
            };
        };

        struct keyboard_args {
            std::string process_id{};
            std::string keys{};
            struct glaze {
                using T = keyboard_args;
                static constexpr auto value = glz::object(&T::process_id, &T::keys);
            };
        };

        struct mouse_args {
            std::string process_id{};
            int x{};
            int y{};
            std::optional<std::string> button{};
            struct glaze {
                using T = mouse_args;
                static constexpr auto value = glz::object(&T::process_id, &T::x, &T::y, &T::button);
            };
        };

        struct js_args {
            std::string process_id{};
            std::string javascript_code{};
            struct glaze {
                using T = js_args;
                static constexpr auto value = glz::object(&T::process_id, &T::javascript_code);
            };
        };

        struct ipc_call_args {
            std::string process_id{};
            std::string command_name{};
            std::optional<glz::raw_json> args{};
            struct glaze {
                using T = ipc_call_args;
                static constexpr auto value = glz::object(&T::process_id, &T::command_name, &T::args);
            };
        };

        // ── Result types ────────────────────────────────────────────────

        struct launch_result {
            std::string process_id{};
            std::string status{"launched"};
            struct glaze {
                using T = launch_result;
                static constexpr auto value = glz::object(&T::process_id, &T::status);
            };
        };

        struct status_result {
            std::string status{};
            struct glaze {
                using T = status_result;
                static constexpr auto value = glz::object(&T::status);
            };
        };

        struct logs_result {
            std::vector<std::string> logs{};
            uint64_t dropped{};
            struct glaze {
                using T = logs_result;
                static constexpr auto value = glz::object(&T::logs, &T::dropped);
            };
        };

        struct attach_result {
            std::string process_id{};
            int pid{};
            std::string status{"attached"};
            struct glaze {
                using T = attach_result;
                static constexpr auto value = glz::object(&T::process_id, &T::pid, &T::status);
            };
        };

        struct apps_result {
            std::vector<app_candidate> apps{};
            struct glaze {
                using T = apps_result;
                static constexpr auto value = glz::object(&T::apps);
            };
        };

        struct screenshot_result {
            std::string screenshot{};
            struct glaze {
                using T = screenshot_result;
                static constexpr auto value = glz::object(&T::screenshot);
            };
        };

        struct js_result {
            glz::raw_json result{};
            struct glaze {
                using T = js_result;
                static constexpr auto value = glz::object(&T::result);
            };
        };

        struct devtools_result {
            uint16_t debug_port{};
            std::string devtools_url{};
            glz::raw_json version_info{};
            struct glaze {
                using T = devtools_result;
                static constexpr auto value = glz::object(&T::debug_port, &T::devtools_url, &T::version_info);
            };
        };

        struct handlers_result {
            std::vector<std::string> handlers{};
            struct glaze {
                using T = handlers_result;
                static constexpr auto value = glz::object(&T::handlers);
            };
        };

        // ── Helpers ─────────────────────────────────────────────────────

        template <typename T>
        static T read_args(std::string_view tool, const std::string& raw) {
            T args{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, raw)) {
                throw argument_error(std::format("Invalid arguments for {}: {}", tool, glz::format_error(ec, raw)));
            }
            return args;
        }

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            if (auto ec = glz::write_json(value, json)) {
                throw std::runtime_error(std::format("failed to serialize result: {}", glz::format_error(ec, json)));
            }
            return json;
        }

        static std::string normalize_arguments(std::string_view arguments) {
            auto trimmed = utils::trim_view(arguments);
            if (trimmed.empty() || trimmed == "null"sv) {
                return "{}";
            }
            return std::string{trimmed};
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_launch_app(tool_context& ctx, const std::string& raw) {
            auto args = read_args<launch_args>("launch_app"sv, raw);
            auto id = ctx.processes.launch(args.app_path, args.args.value_or(std::vector<std::string>{}));
            return to_json(launch_result{.process_id = std::move(id)});
        }

        static std::string handle_stop_app(tool_context& ctx, const std::string& raw) {
            auto args = read_args<process_args>("stop_app"sv, raw);
            ctx.processes.stop(args.process_id);
            return to_json(status_result{.status = "stopped"});
        }

        static std::string handle_get_app_logs(tool_context& ctx, const std::string& raw) {
            auto args = read_args<logs_args>("get_app_logs"sv, raw);
            std::optional<std::size_t> limit{};
            if (args.lines) {
                if (*args.lines < 0) {
                    throw argument_error(std::format("lines must be non-negative, got {}", *args.lines));
                }
                limit = static_cast<std::size_t>(*args.lines);
            }
            auto snapshot = ctx.processes.get_logs(args.process_id, limit);
            return to_json(logs_result{.logs = std::move(snapshot.logs), .dropped = snapshot.dropped});
        }

        static std::string handle_monitor_resources(tool_context& ctx, const std::string& raw) {
            auto args = read_args<process_args>("monitor_resources"sv, raw);
            return to_json(ctx.processes.monitor_resources(args.process_id));
        }

        static std::string handle_find_running_apps(tool_context& ctx, const std::string&) {
            return to_json(apps_result{.apps = ctx.processes.find_running_apps()});
        }

        static std::string handle_attach_to_app(tool_context& ctx, const std::string& raw) {
            auto args = read_args<attach_args>("attach_to_app"sv, raw);
            if (args.pid <= 0 || args.pid > INT_MAX) {
                throw argument_error(std::format("pid out of range: {}", args.pid));
            }
            auto pid = static_cast<pid_t>(args.pid);
            auto id = ctx.processes.attach(pid);
            return to_json(attach_result{.process_id = std::move(id), .pid = static_cast<int>(pid)});
        }

        static std::string handle_take_screenshot(tool_context& ctx, const std::string& raw) {
            auto args = read_args<screenshot_args>("take_screenshot"sv, raw);
            return to_json(screenshot_result{
                    .screenshot = ctx.capabilities.take_screenshot(args.process_id, args.output_path)});
        }

        static std::string handle_get_window_info(tool_context& ctx, const std::string& raw) {
            auto args = read_args<process_args>("get_window_info"sv, raw);
            return to_json(ctx.capabilities.get_window_info(args.process_id));
        }

        static std::string handle_send_keyboard_input(tool_context& ctx, const std::string& raw) {
            auto args = read_args<keyboard_args>("send_keyboard_input"sv, raw);
            ctx.capabilities.send_keyboard_input(args.process_id, args.keys);
            return to_json(status_result{.status = "sent"});
        }

        static std::string handle_send_mouse_click(tool_context& ctx, const std::string& raw) {
            auto args = read_args<mouse_args>("send_mouse_click"sv, raw);
            auto button = mouse_button::left;
            if (args.button && !try_parse_mouse_button(*args.button, button)) {
                throw argument_error(std::format("Invalid mouse button: {}", *args.button));
            }
            ctx.capabilities.send_mouse_click(args.process_id, args.x, args.y, button);
            return to_json(status_result{.status = "clicked"});
        }

        static std::string handle_execute_js(tool_context& ctx, const std::string& raw) {
            auto args = read_args<js_args>("execute_js"sv, raw);
            return to_json(
                    js_result{.result = glz::raw_json{ctx.capabilities.execute_js(args.process_id, args.javascript_code)}});
        }

        static std::string handle_get_devtools_info(tool_context& ctx, const std::string& raw) {
            auto args = read_args<process_args>("get_devtools_info"sv, raw);
            auto info = ctx.capabilities.get_devtools_info(args.process_id);
            return to_json(devtools_result{
                    .debug_port = info.debug_port,
                    .devtools_url = std::move(info.devtools_url),
                    .version_info = glz::raw_json{std::move(info.version_info)}});
        }

        static std::string handle_list_ipc_handlers(tool_context& ctx, const std::string& raw) {
            auto args = read_args<process_args>("list_ipc_handlers"sv, raw);
            return to_json(handlers_result{.handlers = ctx.capabilities.list_ipc_handlers(args.process_id)});
        }

        static std::string handle_call_ipc_command(tool_context& ctx, const std::string& raw) {
            auto args = read_args<ipc_call_args>("call_ipc_command"sv, raw);
            auto ipc_args = args.args ? args.args->str : std::string{"{}"};
            // the command's own result is relayed unchanged
            return ctx.capabilities.call_ipc_command(args.process_id, args.command_name, ipc_args);
        }

    }  // namespace detail

    const std::vector<tool_spec>& tool_catalog() {
        static const std::vector<tool_spec> catalog{
                {"launch_app"sv,
                 "Launch a Tauri application"sv,
                 detail::launch_app_schema,
                 {"app_path"sv},
                 &detail::handle_launch_app},
                {"stop_app"sv,
                 "Stop a running Tauri application"sv,
                 detail::stop_app_schema,
                 {"process_id"sv},
                 &detail::handle_stop_app},
                {"get_app_logs"sv,
                 "Get stdout/stderr logs from a running app"sv,
                 detail::get_app_logs_schema,
                 {"process_id"sv},
                 &detail::handle_get_app_logs},
                {"take_screenshot"sv,
                 "Take a screenshot of the app window"sv,
                 detail::take_screenshot_schema,
                 {"process_id"sv},
                 &detail::handle_take_screenshot},
                {"get_window_info"sv,
                 "Get window dimensions, position, and state"sv,
                 detail::process_only_schema,
                 {"process_id"sv},
                 &detail::handle_get_window_info},
                {"send_keyboard_input"sv,
                 "Send keyboard input to the app"sv,
                 detail::send_keyboard_input_schema,
                 {"process_id"sv, "keys"sv},
                 &detail::handle_send_keyboard_input},
                {"send_mouse_click"sv,
                 "Send mouse click to specific coordinates"sv,
                 detail::send_mouse_click_schema,
                 {"process_id"sv, "x"sv, "y"sv},
                 &detail::handle_send_mouse_click},
                {"execute_js"sv,
                 "Execute JavaScript in the app's webview"sv,
                 detail::execute_js_schema,
                 {"process_id"sv, "javascript_code"sv},
                 &detail::handle_execute_js},
                {"get_devtools_info"sv,
                 "Get DevTools connection information"sv,
                 detail::process_only_schema,
                 {"process_id"sv},
                 &detail::handle_get_devtools_info},
                {"monitor_resources"sv,
                 "Monitor CPU, memory, and other resource usage"sv,
                 detail::process_only_schema,
                 {"process_id"sv},
                 &detail::handle_monitor_resources},
                {"list_ipc_handlers"sv,
                 "List all registered Tauri IPC commands"sv,
                 detail::process_only_schema,
                 {"process_id"sv},
                 &detail::handle_list_ipc_handlers},
                {"call_ipc_command"sv,
                 "Call a Tauri IPC command"sv,
                 detail::call_ipc_command_schema,
                 {"process_id"sv, "command_name"sv},
                 &detail::handle_call_ipc_command},
                {"find_running_apps"sv,
                 "Find running Tauri applications on the system"sv,
                 detail::find_running_apps_schema,
                 {},
                 &detail::handle_find_running_apps},
                {"attach_to_app"sv,
                 "Attach to an already running Tauri application by PID"sv,
                 detail::attach_to_app_schema,
                 {"pid"sv},
                 &detail::handle_attach_to_app},
        };
        return catalog;
    }

    const tool_spec* find_tool(std::string_view name) {
        for (const auto& spec : tool_catalog()) {
            if (spec.name == name) {
                return &spec;
            }
        }
        return nullptr;
    }

    const tool_spec& tool_dispatcher::validate(std::string_view name, std::string_view arguments) const {
        const auto* spec = find_tool(name);
        if (spec == nullptr) {
            throw protocol_error(std::format("Unknown tool: {}", name), glz::rpc::error_e::method_not_found);
        }

        auto normalized = detail::normalize_arguments(arguments);
        std::map<std::string, glz::raw_json, std::less<>> fields{};
        if (auto ec = glz::read_json(fields, normalized)) {
            throw argument_error(std::format("arguments for {} must be a JSON object", name));
        }

        for (auto key : spec->required) {
            auto it = fields.find(key);
            if (it == fields.end() || utils::trim_view(it->second.str) == "null"sv) {
                throw argument_error(std::format("Missing required argument: {}", key));
            }
        }
        return *spec;
    }

    std::string tool_dispatcher::resolve(std::string_view name, std::string_view arguments) {
        const auto& spec = validate(name, arguments);
        debug_log("dispatching tool ", name);
        return spec.handler(ctx_, detail::normalize_arguments(arguments));
    }

}  // namespace tauri_mcp

#include "tauri_mcp/capabilities.hpp"

#include "tauri_mcp/error.hpp"
#include "tauri_mcp/process.hpp"

#include "internal/desktop.hpp"
#include "internal/platform.hpp"
#include "internal/subprocess.hpp"

#include <glaze/base64/base64.hpp>
#include <glaze/glaze.hpp>
#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <format>

namespace tauri_mcp {

    namespace detail {

        static constexpr auto subprocess_timeout_ms = 10'000;
        static constexpr auto devtools_host = "localhost"sv;

        // Connect and read are each bounded by `timeout_ms`; a failed request yields an empty result
        inline httplib::Result devtools_get(uint16_t port, const std::string& path, int timeout_ms) {
            httplib::Client cli{std::string{devtools_host}, port};
            cli.set_connection_timeout(std::chrono::milliseconds{timeout_ms});
            cli.set_read_timeout(std::chrono::milliseconds{timeout_ms});
            return cli.Get(path);
        }

        struct ipc_args {
            std::optional<std::string> cmd{};
            std::optional<std::string> title{};
            struct glaze {
                using T = ipc_args;
                static constexpr auto value = glz::object(&T::cmd, &T::title);
            };
        };

        struct ipc_tauri_result {
            std::string status{"success"};
            std::string message{"Tauri command executed"};
            std::string version{"2.0.0"};
            struct glaze {
                using T = ipc_tauri_result;
                static constexpr auto value = glz::object(&T::status, &T::message, &T::version);
            };
        };

        struct ipc_ready_result {
            std::string status{"success"};
            bool ready{true};
            std::string timestamp{};
            struct glaze {
                using T = ipc_ready_result;
                static constexpr auto value = glz::object(&T::status, &T::ready, &T::timestamp);
            };
        };

        struct ipc_window_result {
            std::string status{"success"};
            std::string window_id{};
            std::string title{};
            struct glaze {
                using T = ipc_window_result;
                static constexpr auto value = glz::object(&T::status, &T::window_id, &T::title);
            };
        };

        struct ipc_invoke_result {
            std::string status{"success"};
            std::string command{};
            std::string result{"Command invoked successfully"};
            struct glaze {
                using T = ipc_invoke_result;
                static constexpr auto value = glz::object(&T::status, &T::command, &T::result);
            };
        };

        struct ipc_custom_result {
            std::string status{"success"};
            std::string command{};
            std::string message{};
            glz::raw_json args{};
            struct glaze {
                using T = ipc_custom_result;
                static constexpr auto value = glz::object(&T::status, &T::command, &T::message, &T::args);
            };
        };

        struct devtools_target {
            std::string id{};
            std::string type{};
            std::string title{};
            std::string url{};
            std::string webSocketDebuggerUrl{};
            struct glaze {
                using T = devtools_target;
                static constexpr auto value = glz::object(
                        &T::id, &T::type, &T::title, &T::url, "webSocketDebuggerUrl", &T::webSocketDebuggerUrl);
            };
        };

        struct js_target_result {
            std::string status{"target_resolved"};
            uint16_t debug_port{};
            std::string page_id{};
            std::string page_url{};
            std::string websocket_debugger_url{};
            std::string code{};
            struct glaze {
                using T = js_target_result;
                static constexpr auto value = glz::object(
                        &T::status, &T::debug_port, &T::page_id, &T::page_url, &T::websocket_debugger_url, &T::code);
            };
        };

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            (void)glz::write_json(value, json);
            return json;
        }

        static std::string utc_timestamp() {
            auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            return std::format("{:%FT%TZ}", now);
        }

        static std::string first_line(std::string_view text) {
            auto eol = text.find('\n');
            return std::string{utils::trim_view(text.substr(0U, eol))};
        }

        static internal::subprocess_result run_desktop_tool(const std::vector<std::string>& args) {
            debug_log("running ", utils::join_with_separator(args, " "sv));
            auto res = internal::run_subprocess(args, subprocess_timeout_ms);
            if (res.exit_code == 127 && res.stdout_output.empty()) {
                throw capability_error(std::format("{} is not installed or not executable", args.front()));
            }
            if (res.timed_out) {
                throw capability_error(std::format("{} timed out", args.front()));
            }
            return res;
        }

        static std::string_view xdotool_button(mouse_button button) {
            switch (button) {
                case mouse_button::left:
                    return "1"sv;
                case mouse_button::middle:
                    return "2"sv;
                case mouse_button::right:
                    return "3"sv;
            }
            return "1"sv;
        }

        [[noreturn]] static void no_display(std::string_view operation) {
            throw capability_error(std::format("{} requires a desktop session, but no X11 display is available", operation));
        }

    }  // namespace detail

    // ── IPC bridge ──────────────────────────────────────────────────

    const std::vector<std::string>& ipc_bridge::default_handlers() {
        static const std::vector<std::string> handlers{
                "tauri",
                "app_ready",
                "window_created",
                "window_destroyed",
                "webview_created",
                "webview_destroyed",
                "event",
                "invoke"};
        return handlers;
    }

    std::vector<std::string> ipc_bridge::list_handlers() const { return default_handlers(); }

    std::string ipc_bridge::call(
            std::string_view process_id, std::string_view command_name, std::string_view args_json) const {
        info_log("calling IPC command '", command_name, "' for process ", process_id);

        auto args_text = utils::trim_view(args_json).empty() ? "null"sv : args_json;
        detail::ipc_args args{};
        // non-object or mistyped arguments simply leave the optional fields empty
        (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(args, args_text);

        if (command_name == "tauri"sv) {
            return detail::to_json(detail::ipc_tauri_result{});
        }
        if (command_name == "app_ready"sv) {
            return detail::to_json(detail::ipc_ready_result{.timestamp = detail::utc_timestamp()});
        }
        if (command_name == "window_created"sv) {
            return detail::to_json(detail::ipc_window_result{
                    .window_id = utils::make_uuid_v4(), .title = args.title.value_or("Tauri Window")});
        }
        if (command_name == "invoke"sv) {
            if (!args.cmd) {
                throw argument_error("Missing 'cmd' parameter for invoke");
            }
            return detail::to_json(detail::ipc_invoke_result{.command = *args.cmd});
        }
        return detail::to_json(detail::ipc_custom_result{
                .command = std::string{command_name},
                .message = std::format("Custom command '{}' executed", command_name),
                .args = glz::raw_json{std::string{args_text}}});
    }

    // ── Portable (DevTools + IPC) ───────────────────────────────────

    portable_capabilities::portable_capabilities(process_manager& processes, const server_config& cfg)
            : processes_{processes},
              port_first_{cfg.devtools_port_first},
              port_last_{cfg.devtools_port_last},
              http_timeout_ms_{cfg.http_timeout_ms} {}

    uint16_t portable_capabilities::find_debug_port() const {
        for (uint32_t port = port_first_; port <= port_last_; ++port) {
            auto res = detail::devtools_get(static_cast<uint16_t>(port), "/json/version", http_timeout_ms_);
            if (res && res->status == 200) {
                debug_log("DevTools endpoint found on port ", port);
                return static_cast<uint16_t>(port);
            }
        }
        throw capability_error(std::format("No debug port found in {}..{}", port_first_, port_last_));
    }

    devtools_info portable_capabilities::get_devtools_info(std::string_view process_id) {
        (void)processes_.pid_of(process_id);
        auto port = find_debug_port();

        auto res = detail::devtools_get(port, "/json/version", http_timeout_ms_);
        if (!res) {
            throw capability_error(std::format("Failed to get DevTools info from port {}", port));
        }
        if (res->status != 200) {
            throw capability_error(std::format("DevTools returned error: {}", res->status));
        }
        if (glz::validate_json(res->body)) {
            throw capability_error("Failed to parse DevTools response");
        }

        return devtools_info{
                .debug_port = port,
                .devtools_url = std::format("http://{}:{}", detail::devtools_host, port),
                .version_info = std::move(res->body)};
    }

    std::string portable_capabilities::execute_js(std::string_view process_id, std::string_view javascript_code) {
        (void)processes_.pid_of(process_id);
        info_log("resolving DevTools target for process ", process_id);

        auto port = find_debug_port();
        auto res = detail::devtools_get(port, "/json/list", http_timeout_ms_);
        if (!res || res->status != 200) {
            throw capability_error(std::format("Failed to list pages on DevTools port {}", port));
        }

        std::vector<detail::devtools_target> targets{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(targets, res->body)) {
            throw capability_error(std::format("Failed to parse pages: {}", glz::format_error(ec, res->body)));
        }
        if (targets.empty()) {
            throw capability_error("No pages found");
        }

        auto it = std::ranges::find(targets, "page"sv, &detail::devtools_target::type);
        const auto& target = it != targets.end() ? *it : targets.front();
        if (target.id.empty()) {
            throw capability_error("No page ID found");
        }

        return detail::to_json(detail::js_target_result{
                .debug_port = port,
                .page_id = target.id,
                .page_url = target.url,
                .websocket_debugger_url = target.webSocketDebuggerUrl,
                .code = std::string{javascript_code}});
    }

    std::vector<std::string> portable_capabilities::list_ipc_handlers(std::string_view process_id) {
        (void)processes_.pid_of(process_id);
        return ipc_.list_handlers();
    }

    std::string portable_capabilities::call_ipc_command(
            std::string_view process_id, std::string_view command_name, std::string_view args_json) {
        (void)processes_.pid_of(process_id);
        return ipc_.call(process_id, command_name, args_json);
    }

    // ── X11 desktop ─────────────────────────────────────────────────

    std::string x11_capabilities::find_window(std::string_view process_id) const {
        auto pid = processes_.pid_of(process_id);
        auto res = detail::run_desktop_tool(
                {std::string{internal::platform::tool::xdotool}, "search", "--onlyvisible", "--pid", std::to_string(pid)});
        auto window = detail::first_line(res.stdout_output);
        if (res.exit_code != 0 || window.empty()) {
            throw capability_error(std::format("No visible window found for process {} (pid {})", process_id, pid));
        }
        return window;
    }

    std::string x11_capabilities::take_screenshot(
            std::string_view process_id, const std::optional<std::string>& output_path) {
        info_log("taking screenshot for process ", process_id);
        auto window = find_window(process_id);
        auto import = std::string{internal::platform::tool::import};

        if (output_path) {
            auto res = detail::run_desktop_tool({import, "-window", window, *output_path});
            if (res.exit_code != 0) {
                throw capability_error(std::format("Screenshot failed: {}", utils::trim_view(res.stderr_output)));
            }
            info_log("screenshot saved to ", *output_path);
            return *output_path;
        }

        auto res = detail::run_desktop_tool({import, "-window", window, "png:-"});
        if (res.exit_code != 0 || res.stdout_output.empty()) {
            throw capability_error(std::format("Screenshot failed: {}", utils::trim_view(res.stderr_output)));
        }
        return std::format("data:image/png;base64,{}", glz::write_base64(res.stdout_output));
    }

    window_info x11_capabilities::get_window_info(std::string_view process_id) {
        auto window = find_window(process_id);
        auto xdotool = std::string{internal::platform::tool::xdotool};

        auto geometry_res = detail::run_desktop_tool({xdotool, "getwindowgeometry", "--shell", window});
        auto geometry = internal::desktop::parse_window_geometry(geometry_res.stdout_output);
        if (geometry_res.exit_code != 0 || !geometry) {
            throw capability_error(std::format("Failed to read geometry of window {}", window));
        }

        auto name_res = detail::run_desktop_tool({xdotool, "getwindowname", window});
        auto active_res = detail::run_desktop_tool({xdotool, "getactivewindow"});

        return window_info{
                .title = detail::first_line(name_res.stdout_output),
                .x = geometry->x,
                .y = geometry->y,
                .width = geometry->width,
                .height = geometry->height,
                .is_visible = true,
                .is_focused = active_res.exit_code == 0 && detail::first_line(active_res.stdout_output) == window,
                .platform = "linux"};
    }

    void x11_capabilities::send_keyboard_input(std::string_view process_id, std::string_view keys) {
        info_log("sending keyboard input to process ", process_id);
        auto window = find_window(process_id);
        auto xdotool = std::string{internal::platform::tool::xdotool};

        std::vector<std::string> args{xdotool, "windowactivate", "--sync", window};
        if (internal::desktop::is_key_chord(keys)) {
            args.insert(args.end(), {"key", "--clearmodifiers", internal::desktop::translate_key_chord(keys)});
        }
        else {
            args.insert(args.end(), {"type", "--delay", "10", "--", std::string{keys}});
        }

        auto res = detail::run_desktop_tool(args);
        if (res.exit_code != 0) {
            throw capability_error(
                    std::format("Failed to send keyboard input: {}", utils::trim_view(res.stderr_output)));
        }
    }

    void x11_capabilities::send_mouse_click(std::string_view process_id, int x, int y, mouse_button button) {
        info_log("sending ", to_string(button), " click to process ", process_id, " at (", x, ", ", y, ")");
        (void)processes_.pid_of(process_id);

        auto res = detail::run_desktop_tool(
                {std::string{internal::platform::tool::xdotool},
                 "mousemove",
                 std::to_string(x),
                 std::to_string(y),
                 "click",
                 std::string{detail::xdotool_button(button)}});
        if (res.exit_code != 0) {
            throw capability_error(std::format("Failed to send mouse click: {}", utils::trim_view(res.stderr_output)));
        }
    }

    // ── Headless ────────────────────────────────────────────────────

    std::string headless_capabilities::take_screenshot(std::string_view process_id, const std::optional<std::string>&) {
        (void)processes_.pid_of(process_id);
        detail::no_display("take_screenshot"sv);
    }

    window_info headless_capabilities::get_window_info(std::string_view process_id) {
        (void)processes_.pid_of(process_id);
        detail::no_display("get_window_info"sv);
    }

    void headless_capabilities::send_keyboard_input(std::string_view process_id, std::string_view) {
        (void)processes_.pid_of(process_id);
        detail::no_display("send_keyboard_input"sv);
    }

    void headless_capabilities::send_mouse_click(std::string_view process_id, int, int, mouse_button) {
        (void)processes_.pid_of(process_id);
        detail::no_display("send_mouse_click"sv);
    }

    std::unique_ptr<capability_set> make_platform_capabilities(process_manager& processes, const server_config& cfg) {
        const char* display = std::getenv("DISPLAY");
        if (internal::platform::is_linux && display != nullptr && *display != '\0') {
            info_log("desktop capabilities: X11 (DISPLAY=", display, ")");
            return std::make_unique<x11_capabilities>(processes, cfg);
        }
        info_log("desktop capabilities: headless");
        return std::make_unique<headless_capabilities>(processes, cfg);
    }

}  // namespace tauri_mcp

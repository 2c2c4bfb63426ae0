#pragma once

#include "config.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tauri_mcp {

    using namespace std::string_view_literals;

    class process_manager;

    enum class mouse_button : uint8_t { left, right, middle };

    inline constexpr std::string_view to_string(mouse_button button) {
        switch (button) {
            case mouse_button::left:
                return "left"sv;
            case mouse_button::right:
                return "right"sv;
            case mouse_button::middle:
                return "middle"sv;
        }
        return "left"sv;
    }

    inline constexpr bool try_parse_mouse_button(std::string_view text, mouse_button& out) {
        if (utils::str_case_eq(text, "left"sv)) {
            out = mouse_button::left;
            return true;
        }
        if (utils::str_case_eq(text, "right"sv)) {
            out = mouse_button::right;
            return true;
        }
        if (utils::str_case_eq(text, "middle"sv)) {
            out = mouse_button::middle;
            return true;
        }
        return false;
    }

    struct window_info {
        std::string title{};
        int x{};
        int y{};
        uint32_t width{};
        uint32_t height{};
        bool is_visible{};
        bool is_focused{};
        std::string platform{};
    };

    struct devtools_info {
        uint16_t debug_port{};
        std::string devtools_url{};
        // JSON document returned by /json/version
        std::string version_info{};
    };

    /*
     * Operations that reach outside the server: the desktop session (screenshots, window
     * geometry, synthetic input), the app's DevTools endpoint, and the IPC command bridge.
     * The dispatcher validates arguments and relays results; everything here reports
     * failure by throwing tool_error.
     *
     * JSON-valued results (execute_js, call_ipc_command) are returned as serialized JSON.
     */
    class capability_set {
      public:
        virtual ~capability_set() = default;

        virtual std::string take_screenshot(
                std::string_view process_id, const std::optional<std::string>& output_path) = 0;
        virtual window_info get_window_info(std::string_view process_id) = 0;
        virtual void send_keyboard_input(std::string_view process_id, std::string_view keys) = 0;
        virtual void send_mouse_click(std::string_view process_id, int x, int y, mouse_button button) = 0;

        virtual std::string execute_js(std::string_view process_id, std::string_view javascript_code) = 0;
        virtual devtools_info get_devtools_info(std::string_view process_id) = 0;

        virtual std::vector<std::string> list_ipc_handlers(std::string_view process_id) = 0;
        virtual std::string call_ipc_command(
                std::string_view process_id, std::string_view command_name, std::string_view args_json) = 0;
    };

    // Built-in IPC command handlers, the same fixed set for every process.
    class ipc_bridge {
      public:
        std::vector<std::string> list_handlers() const;
        std::string call(std::string_view process_id, std::string_view command_name, std::string_view args_json) const;

        static const std::vector<std::string>& default_handlers();
    };

    /*
     * DevTools bridge and IPC shared by every platform. Desktop operations are left to
     * subclasses.
     */
    class portable_capabilities : public capability_set {
      public:
        portable_capabilities(process_manager& processes, const server_config& cfg);

        std::string execute_js(std::string_view process_id, std::string_view javascript_code) override;
        devtools_info get_devtools_info(std::string_view process_id) override;

        std::vector<std::string> list_ipc_handlers(std::string_view process_id) override;
        std::string call_ipc_command(
                std::string_view process_id, std::string_view command_name, std::string_view args_json) override;

      protected:
        uint16_t find_debug_port() const;

        process_manager& processes_;
        uint16_t port_first_;
        uint16_t port_last_;
        int http_timeout_ms_;
        ipc_bridge ipc_{};
    };

    // Linux desktop through xdotool and ImageMagick `import`.
    class x11_capabilities final : public portable_capabilities {
      public:
        using portable_capabilities::portable_capabilities;

        std::string take_screenshot(
                std::string_view process_id, const std::optional<std::string>& output_path) override;
        window_info get_window_info(std::string_view process_id) override;
        void send_keyboard_input(std::string_view process_id, std::string_view keys) override;
        void send_mouse_click(std::string_view process_id, int x, int y, mouse_button button) override;

      private:
        std::string find_window(std::string_view process_id) const;
    };

    // No display available: desktop operations fail with a capability error.
    class headless_capabilities final : public portable_capabilities {
      public:
        using portable_capabilities::portable_capabilities;

        std::string take_screenshot(
                std::string_view process_id, const std::optional<std::string>& output_path) override;
        window_info get_window_info(std::string_view process_id) override;
        void send_keyboard_input(std::string_view process_id, std::string_view keys) override;
        void send_mouse_click(std::string_view process_id, int x, int y, mouse_button button) override;
    };

    // x11_capabilities on Linux when DISPLAY is set, headless_capabilities otherwise.
    std::unique_ptr<capability_set> make_platform_capabilities(process_manager& processes, const server_config& cfg);

}  // namespace tauri_mcp

#pragma once

#include <string_view>

namespace tauri_mcp::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = TAURI_MCP_PLATFORM_LINUX != 0;
    inline constexpr bool is_macos = TAURI_MCP_PLATFORM_MACOS != 0;

    inline constexpr auto server_name = "tauri-mcp"sv;
    inline constexpr auto server_version = std::string_view{TAURI_MCP_VERSION};
    inline constexpr auto server_description = "MCP server for testing and interacting with Tauri v2 applications"sv;

    inline constexpr auto proc_root = "/proc"sv;

    namespace tool {
        inline constexpr auto xdotool = "xdotool"sv;
        inline constexpr auto import = "import"sv;
    }  // namespace tool

}  // namespace tauri_mcp::internal::platform

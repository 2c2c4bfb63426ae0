#pragma once

#include "tauri_mcp/capabilities.hpp"
#include "tauri_mcp/config.hpp"
#include "tauri_mcp/error.hpp"
#include "tauri_mcp/log_queue.hpp"
#include "tauri_mcp/mcp.hpp"
#include "tauri_mcp/process.hpp"
#include "tauri_mcp/tools.hpp"
#include "tauri_mcp/utils.hpp"

#include <string_view>

namespace tauri_mcp {

    inline constexpr std::string_view version{TAURI_MCP_VERSION};

}  // namespace tauri_mcp

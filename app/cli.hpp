#pragma once

#include "tauri_mcp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tauri_mcp::cli {

    enum class run_mode : uint8_t { serve, tool };

    struct cli_request {
        run_mode mode{run_mode::serve};
        std::string tool_name{};
        std::string tool_arguments{"{}"};
    };

    std::optional<int> parse_cli(int argc, char** argv, server_config& cfg, cli_request& request);
    int run(const server_config& cfg, const cli_request& request);

}  // namespace tauri_mcp::cli

#pragma once

#include "tools.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace tauri_mcp::mcp {

    // "1.0", the known MCP revisions, or any YYYY-MM-DD string
    bool is_supported_protocol_version(std::string_view version);

    /*
     * Protocol Session
     *
     * One JSON-RPC 2.0 message per line in, at most one response per line out. Requests
     * (with an id) always get exactly one response; notifications never do, and their
     * failures are only logged. `initialize` is not required before other calls.
     */
    class mcp_session {
      public:
        mcp_session(process_manager& processes, capability_set& capabilities)
                : dispatcher_{processes, capabilities} {}

        // Returns the serialized response line, or nullopt when nothing is owed.
        std::optional<std::string> handle_line(std::string_view line);

        // Reads until EOF; returns the process exit code.
        int run(std::istream& in, std::ostream& out);

        const std::optional<std::string>& negotiated_version() const { return negotiated_version_; }

      private:
        // Result JSON for `method`; throws tool_error for JSON-RPC level failures.
        std::string dispatch(std::string_view method, const std::string& params);

        std::string handle_initialize(const std::string& params);
        std::string handle_tools_list() const;
        std::string handle_tools_call(const std::string& params);

        tool_dispatcher dispatcher_;
        std::optional<std::string> negotiated_version_{};
    };

    // stdio server; launches cfg.app_path first when set
    int run_mcp_server(const server_config& cfg);

    // One dispatch: result JSON on `out` and 0, or the error message on `err` and 1
    int run_single_tool(
            const server_config& cfg,
            std::string_view name,
            std::string_view arguments,
            std::ostream& out,
            std::ostream& err);

}  // namespace tauri_mcp::mcp

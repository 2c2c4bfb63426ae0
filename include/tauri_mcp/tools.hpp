#pragma once

#include "capabilities.hpp"
#include "process.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tauri_mcp {

    struct tool_context {
        process_manager& processes;
        capability_set& capabilities;
    };

    // Handlers receive validated argument JSON and return the result as serialized JSON.
    using tool_handler = std::string (*)(tool_context& ctx, const std::string& arguments);

    struct tool_spec {
        std::string_view name;
        std::string_view description;
        std::string_view input_schema;
        std::vector<std::string_view> required;
        tool_handler handler;
    };

    // Static catalog served by tools/list and used for dispatch.
    const std::vector<tool_spec>& tool_catalog();

    const tool_spec* find_tool(std::string_view name);

    /*
     * Tool Dispatch Table
     *
     * Routes a tool name and its argument object to the process manager or the capability
     * set. Validation is identical for every entry point:
     *  - unknown name: protocol error (method not found)
     *  - arguments not a JSON object: argument error
     *  - missing or null required key: argument error naming the key
     *  - wrongly typed argument values: argument error
     * Holds no state of its own.
     */
    class tool_dispatcher {
      public:
        tool_dispatcher(process_manager& processes, capability_set& capabilities)
                : ctx_{processes, capabilities} {}

        // `arguments` may be empty or `null`, both meaning `{}`.
        std::string resolve(std::string_view name, std::string_view arguments);

        // Throws the same errors as resolve() without invoking the handler.
        const tool_spec& validate(std::string_view name, std::string_view arguments) const;

      private:
        tool_context ctx_;
    };

}  // namespace tauri_mcp

#pragma once

#include <glaze/ext/jsonrpc.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tauri_mcp {

    using namespace std::string_view_literals;

    enum class error_kind : uint8_t {
        process,
        argument,
        protocol,
        capability,
        config,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::process:
                return "Process error"sv;
            case error_kind::argument:
                return "Argument error"sv;
            case error_kind::protocol:
                return "Protocol error"sv;
            case error_kind::capability:
                return "Capability error"sv;
            case error_kind::config:
                return "Configuration error"sv;
        }
        return "Error"sv;
    }

    /*
     * Failure raised anywhere below the protocol session. The session turns it into a
     * JSON-RPC error object using `code()`; `what()` is the human-readable message.
     */
    class tool_error : public std::runtime_error {
      public:
        tool_error(error_kind kind, std::string_view detail, glz::rpc::error_e code)
                : std::runtime_error{std::string{to_string(kind)} + ": " + std::string{detail}},
                  kind_{kind},
                  code_{code} {}

        error_kind kind() const noexcept { return kind_; }
        glz::rpc::error_e code() const noexcept { return code_; }

      private:
        error_kind kind_;
        glz::rpc::error_e code_;
    };

    inline tool_error process_error(std::string_view detail) {
        return tool_error{error_kind::process, detail, glz::rpc::error_e::invalid_params};
    }

    inline tool_error argument_error(std::string_view detail) {
        return tool_error{error_kind::argument, detail, glz::rpc::error_e::invalid_params};
    }

    inline tool_error protocol_error(std::string_view detail, glz::rpc::error_e code) {
        return tool_error{error_kind::protocol, detail, code};
    }

    inline tool_error capability_error(std::string_view detail) {
        return tool_error{error_kind::capability, detail, glz::rpc::error_e::internal};
    }

    inline tool_error config_error(std::string_view detail) {
        return tool_error{error_kind::config, detail, glz::rpc::error_e::internal};
    }

}  // namespace tauri_mcp

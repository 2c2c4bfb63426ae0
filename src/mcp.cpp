#include "tauri_mcp/mcp.hpp"

#include "tauri_mcp/error.hpp"

#include "internal/platform.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <format>
#include <iostream>
#include <map>

namespace tauri_mcp::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        static constexpr std::string_view known_versions[] = {"1.0"sv, "2024-11-05"sv, "2025-03-26"sv, "2025-06-18"sv};

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::optional<std::string> protocolVersion{};
            std::optional<glz::raw_json> capabilities{};
            std::optional<client_info> clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "clientInfo",
                        &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            std::string description{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version, &T::description);
            };
        };

        struct tools_capability {
            bool listTools{true};
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object("listTools", &T::listTools);
            };
        };

        struct empty_capability {
            struct glaze {
                using T = empty_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            empty_capability resources{};
            empty_capability prompts{};
            empty_capability logging{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools, &T::resources, &T::prompts, &T::logging);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_info serverInfo{};
            server_capabilities capabilities{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "serverInfo",
                        &T::serverInfo,
                        "capabilities",
                        &T::capabilities);
            };
        };

        struct shutdown_result {
            std::string status{"shutdown"};
            struct glaze {
                using T = shutdown_result;
                static constexpr auto value = glz::object(&T::status);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::optional<std::string> name{};
            std::optional<glz::raw_json> arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string to_json(T&& value) {
            std::string json{};
            (void)glz::write_json(std::forward<T>(value), json);
            return json;
        }

        static std::string make_response(const glz::rpc::id_t& id, std::string result_json) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.result = glz::raw_json{std::move(result_json)};
            return to_json(resp);
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            return to_json(resp);
        }

        static bool is_date_version(std::string_view v) {
            if (v.size() != 10U || v[4] != '-' || v[7] != '-') {
                return false;
            }
            for (size_t i = 0; i < v.size(); ++i) {
                if (i == 4U || i == 7U) {
                    continue;
                }
                if (v[i] < '0' || v[i] > '9') {
                    return false;
                }
            }
            return true;
        }

        static std::string supported_versions_text() {
            std::vector<std::string> names{};
            for (auto v : known_versions) {
                names.emplace_back(v);
            }
            return std::format("{} or any YYYY-MM-DD revision", utils::join_with_separator(names, ", "sv));
        }

        static std::string params_or_empty(std::string_view params) {
            auto trimmed = utils::trim_view(params);
            return trimmed.empty() || trimmed == "null"sv ? std::string{"{}"} : std::string{trimmed};
        }

    }  // namespace detail

    bool is_supported_protocol_version(std::string_view version) {
        for (auto v : detail::known_versions) {
            if (v == version) {
                return true;
            }
        }
        return detail::is_date_version(version);
    }

    // ── Handlers ────────────────────────────────────────────────────

    std::string mcp_session::handle_initialize(const std::string& params) {
        detail::initialize_params init{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(init, params)) {
            throw protocol_error(
                    std::format("Invalid initialize params: {}", glz::format_error(ec, params)),
                    glz::rpc::error_e::invalid_params);
        }
        if (!init.protocolVersion) {
            throw protocol_error("Missing required parameter: protocolVersion", glz::rpc::error_e::invalid_params);
        }
        if (!init.capabilities) {
            throw protocol_error("Missing required parameter: capabilities", glz::rpc::error_e::invalid_params);
        }
        if (!is_supported_protocol_version(*init.protocolVersion)) {
            throw protocol_error(
                    std::format(
                            "Unsupported protocol version: {}. Supported versions: {}",
                            *init.protocolVersion,
                            detail::supported_versions_text()),
                    glz::rpc::error_e::invalid_params);
        }

        if (init.clientInfo) {
            info_log("initialize from ", init.clientInfo->name, ' ', init.clientInfo->version,
                     " (protocol ", *init.protocolVersion, ")");
        }
        if (!negotiated_version_) {
            negotiated_version_ = *init.protocolVersion;
        }

        detail::initialize_result result{};
        result.protocolVersion = *init.protocolVersion;
        result.serverInfo = detail::server_info{
                .name = std::string{internal::platform::server_name},
                .version = std::string{internal::platform::server_version},
                .description = std::string{internal::platform::server_description}};
        return detail::to_json(result);
    }

    std::string mcp_session::handle_tools_list() const {
        detail::tools_list_result result{};
        for (const auto& spec : tool_catalog()) {
            result.tools.push_back(
                    detail::tool_definition{
                            .name = std::string{spec.name},
                            .description = std::string{spec.description},
                            .inputSchema = glz::raw_json{std::string{spec.input_schema}},
                    });
        }
        return detail::to_json(result);
    }

    std::string mcp_session::handle_tools_call(const std::string& params) {
        detail::tool_call_params call{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(call, params)) {
            throw protocol_error("Failed to parse tool call params", glz::rpc::error_e::invalid_params);
        }
        if (!call.name) {
            throw protocol_error("Missing required parameter: name", glz::rpc::error_e::invalid_params);
        }

        auto arguments = call.arguments ? call.arguments->str : std::string{};
        detail::tool_call_result result{};
        try {
            result.content.push_back(detail::text_content{.text = dispatcher_.resolve(*call.name, arguments)});
        } catch (const tool_error& e) {
            // bad names and arguments are the caller's fault; anything later is the tool's
            if (e.kind() == error_kind::argument || e.kind() == error_kind::protocol) {
                throw;
            }
            warn_log("tool ", *call.name, " failed: ", e.what());
            result.content.push_back(detail::text_content{.text = e.what()});
            result.isError = true;
        }
        return detail::to_json(result);
    }

    std::string mcp_session::dispatch(std::string_view method, const std::string& params) {
        if (method == "initialize"sv) {
            return handle_initialize(params);
        }
        if (method == "shutdown"sv) {
            info_log("shutdown requested");
            return detail::to_json(detail::shutdown_result{});
        }
        if (method == "tools/list"sv) {
            return handle_tools_list();
        }
        if (method == "tools/call"sv) {
            return handle_tools_call(params);
        }
        if (method.starts_with("notifications/"sv)) {
            info_log("client notification: ", method);
            return "{}";
        }
        if (find_tool(method) != nullptr) {
            return dispatcher_.resolve(method, params);
        }
        throw protocol_error(std::format("Unknown method: {}", method), glz::rpc::error_e::method_not_found);
    }

    std::optional<std::string> mcp_session::handle_line(std::string_view line) {
        auto trimmed = utils::trim_view(line);
        if (trimmed.empty()) {
            return std::nullopt;
        }

        // request fields are views into this buffer
        std::string buffer{trimmed};
        glz::rpc::generic_request_t request{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, buffer)) {
            error_log("unparsable request line: ", glz::format_error(ec, buffer));
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);
        auto method = std::string{request.method};
        auto params = detail::params_or_empty(request.params.str);

        trace_log("<- ", method, is_notification ? " (notification)" : "");

        try {
            auto result = dispatch(method, params);
            if (is_notification) {
                return std::nullopt;
            }
            return detail::make_response(request.id, std::move(result));
        } catch (const tool_error& e) {
            if (is_notification) {
                warn_log("notification ", method, " failed: ", e.what());
                return std::nullopt;
            }
            debug_log("request ", method, " failed: ", e.what());
            return detail::make_error_response(request.id, e.code(), e.what());
        } catch (const std::exception& e) {
            error_log("internal error handling ", method, ": ", e.what());
            if (is_notification) {
                return std::nullopt;
            }
            return detail::make_error_response(request.id, glz::rpc::error_e::internal, e.what());
        }
    }

    int mcp_session::run(std::istream& in, std::ostream& out) {
        std::string line{};
        while (std::getline(in, line)) {
            if (auto response = handle_line(line)) {
                out << *response << '\n';
                out.flush();
            }
        }
        info_log("input closed, session ending");
        return 0;
    }

    // ── Entry points ────────────────────────────────────────────────

    int run_mcp_server(const server_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        process_manager processes{cfg};
        auto capabilities = make_platform_capabilities(processes, cfg);

        if (cfg.app_path) {
            try {
                auto id = processes.launch(*cfg.app_path, cfg.app_args);
                info_log("startup app ", cfg.app_path->string(), " running as process id ", id);
            } catch (const tool_error& e) {
                error_log("failed to launch startup app: ", e.what());
            }
        }

        info_log(internal::platform::server_name, ' ', internal::platform::server_version,
                 " serving JSON-RPC on stdio");
        mcp_session session{processes, *capabilities};
        return session.run(std::cin, std::cout);
    }

    int run_single_tool(
            const server_config& cfg,
            std::string_view name,
            std::string_view arguments,
            std::ostream& out,
            std::ostream& err) {
        process_manager processes{cfg};
        auto capabilities = make_platform_capabilities(processes, cfg);
        tool_dispatcher dispatcher{processes, *capabilities};

        try {
            out << dispatcher.resolve(name, arguments) << '\n';
            out.flush();
            return 0;
        } catch (const tool_error& e) {
            err << e.what() << '\n';
            return 1;
        }
    }

}  // namespace tauri_mcp::mcp

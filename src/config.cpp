#include "tauri_mcp/config.hpp"

#include "tauri_mcp/error.hpp"

#include <glaze/glaze.hpp>

#include <format>
#include <system_error>

namespace fs = std::filesystem;

namespace glz {

    template <>
    struct meta<tauri_mcp::feature_flags> {
        using T = tauri_mcp::feature_flags;
        static constexpr auto value = object(
                &T::auto_discover,
                &T::session_management,
                &T::event_streaming,
                &T::performance_profiling,
                &T::network_interception);
    };

}  // namespace glz

namespace tauri_mcp {

    namespace detail {

        // On-disk shape of the config file; absent keys keep their defaults
        struct feature_overrides {
            std::optional<bool> auto_discover{};
            std::optional<bool> session_management{};
            std::optional<bool> event_streaming{};
            std::optional<bool> performance_profiling{};
            std::optional<bool> network_interception{};
            struct glaze {
                using T = feature_overrides;
                static constexpr auto value = glz::object(
                        &T::auto_discover,
                        &T::session_management,
                        &T::event_streaming,
                        &T::performance_profiling,
                        &T::network_interception);
            };
        };

        struct config_file {
            std::optional<std::string> log_level{};
            std::optional<feature_overrides> features{};
            std::optional<std::size_t> log_capacity{};
            std::optional<int> stop_timeout_ms{};
            std::optional<std::vector<std::string>> discovery_patterns{};
            std::optional<uint16_t> devtools_port_first{};
            std::optional<uint16_t> devtools_port_last{};
            std::optional<int> http_timeout_ms{};
            struct glaze {
                using T = config_file;
                static constexpr auto value = glz::object(
                        &T::log_level,
                        &T::features,
                        &T::log_capacity,
                        &T::stop_timeout_ms,
                        &T::discovery_patterns,
                        &T::devtools_port_first,
                        &T::devtools_port_last,
                        &T::http_timeout_ms);
            };
        };

        struct resolved_config {
            std::string config_path{};
            std::string log_level{};
            std::optional<std::string> app_path{};
            std::vector<std::string> app_args{};
            feature_flags features{};
            std::size_t log_capacity{};
            int stop_timeout_ms{};
            std::vector<std::string> discovery_patterns{};
            uint16_t devtools_port_first{};
            uint16_t devtools_port_last{};
            int http_timeout_ms{};
            struct glaze {
                using T = resolved_config;
                static constexpr auto value = glz::object(
                        &T::config_path,
                        &T::log_level,
                        &T::app_path,
                        &T::app_args,
                        &T::features,
                        &T::log_capacity,
                        &T::stop_timeout_ms,
                        &T::discovery_patterns,
                        &T::devtools_port_first,
                        &T::devtools_port_last,
                        &T::http_timeout_ms);
            };
        };

        template <typename T>
        static void apply(T& target, const std::optional<T>& value) {
            if (value) {
                target = *value;
            }
        }

    }  // namespace detail

    bool load_config_file(server_config& cfg) {
        std::error_code ec{};
        if (!fs::exists(cfg.config_path, ec)) {
            debug_log("no config file at ", cfg.config_path.string(), ", using defaults");
            return false;
        }

        std::string buffer{};
        if (auto read_ec = glz::file_to_buffer(buffer, cfg.config_path.string()); read_ec != glz::error_code::none) {
            throw config_error(std::format("failed to read config file {}", cfg.config_path.string()));
        }

        detail::config_file file{};
        if (auto parse_ec = glz::read_json(file, buffer)) {
            throw config_error(std::format(
                    "invalid config file {}: {}", cfg.config_path.string(), glz::format_error(parse_ec, buffer)));
        }

        if (file.log_level) {
            if (!try_parse_log_level(*file.log_level, cfg.level)) {
                throw config_error(std::format("invalid log_level '{}' in {}", *file.log_level, cfg.config_path.string()));
            }
        }
        if (file.features) {
            detail::apply(cfg.features.auto_discover, file.features->auto_discover);
            detail::apply(cfg.features.session_management, file.features->session_management);
            detail::apply(cfg.features.event_streaming, file.features->event_streaming);
            detail::apply(cfg.features.performance_profiling, file.features->performance_profiling);
            detail::apply(cfg.features.network_interception, file.features->network_interception);
        }
        detail::apply(cfg.log_capacity, file.log_capacity);
        detail::apply(cfg.stop_timeout_ms, file.stop_timeout_ms);
        detail::apply(cfg.discovery_patterns, file.discovery_patterns);
        detail::apply(cfg.devtools_port_first, file.devtools_port_first);
        detail::apply(cfg.devtools_port_last, file.devtools_port_last);
        detail::apply(cfg.http_timeout_ms, file.http_timeout_ms);

        if (cfg.log_capacity == 0U) {
            throw config_error("log_capacity must be at least 1");
        }
        if (cfg.stop_timeout_ms < 0 || cfg.http_timeout_ms <= 0) {
            throw config_error("stop_timeout_ms must be >= 0 and http_timeout_ms must be > 0");
        }
        if (cfg.devtools_port_first > cfg.devtools_port_last) {
            throw config_error(std::format(
                    "devtools port range {}..{} is empty", cfg.devtools_port_first, cfg.devtools_port_last));
        }

        info_log("loaded config file ", cfg.config_path.string());
        return true;
    }

    void print_config(const server_config& cfg, std::ostream& os) {
        detail::resolved_config out{
                .config_path = cfg.config_path.string(),
                .log_level = std::string{to_string(cfg.level)},
                .app_path = cfg.app_path ? std::optional<std::string>{cfg.app_path->string()} : std::nullopt,
                .app_args = cfg.app_args,
                .features = cfg.features,
                .log_capacity = cfg.log_capacity,
                .stop_timeout_ms = cfg.stop_timeout_ms,
                .discovery_patterns = cfg.discovery_patterns,
                .devtools_port_first = cfg.devtools_port_first,
                .devtools_port_last = cfg.devtools_port_last,
                .http_timeout_ms = cfg.http_timeout_ms};

        std::string json{};
        (void)glz::write<glz::opts{.prettify = true}>(out, json);
        os << json << '\n';
    }

}  // namespace tauri_mcp

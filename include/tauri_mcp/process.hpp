#pragma once

#include "config.hpp"

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tauri_mcp {

    struct disk_usage {
        uint64_t read_bytes{};
        uint64_t written_bytes{};
    };

    struct resource_usage {
        double cpu_usage{};
        uint64_t memory_usage{};
        uint64_t virtual_memory{};
        disk_usage disk{};
        std::string status{};
        uint64_t start_time{};
        uint64_t run_time{};
    };

    struct app_candidate {
        int pid{};
        std::string name{};
        std::string cmd{};
        std::string exe{};
    };

    struct log_snapshot {
        std::vector<std::string> logs{};
        uint64_t dropped{};
    };

    struct log_stats {
        std::size_t buffered{};
        uint64_t dropped{};
    };

    namespace detail {
        struct process_record;
    }

    /*
     * Process Lifecycle Manager
     *
     * Owns every launched or attached process, keyed by a server-generated session id.
     * Launch, attach and stop take the registry lock exclusively; log, resource and
     * lookup queries share it. A record leaves the registry only through stop(), and
     * its log multiplexer is cancelled exactly then.
     *
     * Failures are reported as tool_error (error_kind::process).
     */
    class process_manager {
      public:
        explicit process_manager(const server_config& cfg);
        ~process_manager();

        process_manager(const process_manager&) = delete;
        process_manager& operator=(const process_manager&) = delete;

        std::string launch(const std::filesystem::path& app_path, const std::vector<std::string>& args);
        std::string attach(pid_t pid);
        void stop(std::string_view session_id);

        // Destructive read: returns everything buffered, trimmed to the newest `limit` lines.
        log_snapshot get_logs(std::string_view session_id, std::optional<std::size_t> limit);
        log_stats peek_logs(std::string_view session_id) const;

        resource_usage monitor_resources(std::string_view session_id);
        std::vector<app_candidate> find_running_apps() const;

        pid_t pid_of(std::string_view session_id) const;
        bool is_owned(std::string_view session_id) const;
        std::vector<std::string> session_ids() const;

      private:
        using registry_t = std::map<std::string, std::unique_ptr<detail::process_record>, std::less<>>;

        detail::process_record& lookup(std::string_view session_id) const;

        std::size_t log_capacity_;
        int stop_timeout_ms_;
        bool auto_discover_;
        std::vector<std::string> discovery_patterns_;

        mutable std::shared_mutex registry_mutex_{};
        registry_t registry_{};
    };

    bool looks_like_app(std::string_view name, std::string_view cmdline, const std::vector<std::string>& patterns);

}  // namespace tauri_mcp

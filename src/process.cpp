#include "tauri_mcp/process.hpp"

#include "tauri_mcp/error.hpp"
#include "tauri_mcp/log_queue.hpp"

#include "internal/log_multiplexer.hpp"
#include "internal/platform.hpp"
#include "internal/procfs.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

namespace fs = std::filesystem;

namespace tauri_mcp {

    namespace detail {

        struct child_handle {
            pid_t pid{-1};
            bool reaped{false};
        };

        struct cpu_sample {
            uint64_t total_ticks{};
            std::chrono::steady_clock::time_point taken_at{};
        };

        struct process_record {
            std::string id{};
            pid_t pid{-1};
            fs::path app_path{};
            // present only for processes this server spawned
            std::optional<child_handle> handle{};
            std::shared_ptr<log_queue> logs{};
            std::unique_ptr<internal::log_multiplexer> multiplexer{};

            std::mutex sample_mutex{};
            std::optional<cpu_sample> last_sample{};
        };

        struct spawned_child {
            pid_t pid{-1};
            int stdout_fd{-1};
            int stderr_fd{-1};
        };

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static std::string errno_message(int err) {
            return std::string{std::strerror(err)};
        }

        static spawned_child spawn_child(const fs::path& app_path, const std::vector<std::string>& args) {
            int out_pipe[2]{-1, -1};
            int err_pipe[2]{-1, -1};
            int exec_pipe[2]{-1, -1};
            auto close_all = [&] {
                for (int* p : {out_pipe, err_pipe, exec_pipe}) {
                    close_fd(p[0]);
                    close_fd(p[1]);
                }
            };
            if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
                ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
                auto err = errno;
                close_all();
                throw process_error(std::format("Failed to launch app: pipe() failed: {}", errno_message(err)));
            }

            // argv is built before fork; the child only makes async-signal-safe calls
            auto path_str = app_path.string();
            std::vector<char*> argv{};
            argv.reserve(args.size() + 2U);
            argv.push_back(path_str.data());
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            auto pid = ::fork();
            if (pid < 0) {
                auto err = errno;
                close_all();
                throw process_error(std::format("Failed to launch app: fork() failed: {}", errno_message(err)));
            }

            if (pid == 0) {
                int devnull = ::open("/dev/null", O_RDONLY);
                if (devnull >= 0) {
                    ::dup2(devnull, STDIN_FILENO);
                    ::close(devnull);
                }
                ::dup2(out_pipe[1], STDOUT_FILENO);
                ::dup2(err_pipe[1], STDERR_FILENO);
                // the server ignores SIGPIPE; ignored dispositions survive exec
                ::signal(SIGPIPE, SIG_DFL);
                ::execv(argv[0], argv.data());
                int err = errno;
                (void)::write(exec_pipe[1], &err, sizeof(err));
                _exit(127);
            }

            close_fd(out_pipe[1]);
            close_fd(err_pipe[1]);
            close_fd(exec_pipe[1]);

            // the exec pipe closes on successful exec; an errno arrives if exec failed
            int child_errno = 0;
            ssize_t n = 0;
            do {
                n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
            } while (n < 0 && errno == EINTR);
            close_fd(exec_pipe[0]);

            if (n == static_cast<ssize_t>(sizeof(child_errno))) {
                while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
                }
                close_all();
                throw process_error(std::format("Failed to launch app: {}", errno_message(child_errno)));
            }

            return {.pid = pid, .stdout_fd = out_pipe[0], .stderr_fd = err_pipe[0]};
        }

        static bool pid_exists(pid_t pid) {
            if (pid <= 0) {
                return false;
            }
            std::error_code ec{};
            if (fs::exists(fs::path{internal::platform::proc_root} / std::to_string(pid), ec)) {
                return true;
            }
            return ::kill(pid, 0) == 0 || errno == EPERM;
        }

        static bool try_reap(child_handle& child) {
            if (child.reaped) {
                return true;
            }
            int status = 0;
            auto r = ::waitpid(child.pid, &status, WNOHANG);
            if (r == child.pid || (r < 0 && errno == ECHILD)) {
                child.reaped = true;
            }
            return child.reaped;
        }

        static void terminate_child(child_handle& child, int grace_ms) {
            if (try_reap(child)) {
                return;
            }

            if (::kill(child.pid, SIGTERM) != 0) {
                auto err = errno;
                if (err == ESRCH) {
                    try_reap(child);
                    child.reaped = true;
                    return;
                }
                throw process_error(std::format("Failed to kill process: {}", errno_message(err)));
            }

            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
            while (std::chrono::steady_clock::now() < deadline) {
                if (try_reap(child)) {
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }

            warn_log("pid ", child.pid, " ignored SIGTERM for ", grace_ms, "ms, sending SIGKILL");
            if (::kill(child.pid, SIGKILL) != 0 && errno != ESRCH) {
                throw process_error(std::format("Failed to kill process: {}", errno_message(errno)));
            }
            while (::waitpid(child.pid, nullptr, 0) < 0 && errno == EINTR) {
            }
            child.reaped = true;
        }

    }  // namespace detail

    bool looks_like_app(std::string_view name, std::string_view cmdline, const std::vector<std::string>& patterns) {
        for (const auto& pattern : patterns) {
            if (pattern.empty()) {
                continue;
            }
            if (utils::icontains(name, pattern) || utils::icontains(cmdline, pattern)) {
                return true;
            }
        }

        auto tokens = utils::split_whitespace(cmdline);
        if (tokens.empty()) {
            return false;
        }
        auto exe = tokens.front();
        return utils::ends_with_icase(exe, ".AppImage"sv) || utils::ends_with_icase(exe, ".exe"sv) ||
               utils::ends_with_icase(exe, ".app"sv) || exe.find(".app/"sv) != std::string_view::npos;
    }

    process_manager::process_manager(const server_config& cfg)
            : log_capacity_{cfg.log_capacity},
              stop_timeout_ms_{cfg.stop_timeout_ms},
              auto_discover_{cfg.features.auto_discover},
              discovery_patterns_{cfg.discovery_patterns} {}

    process_manager::~process_manager() {
        std::unique_lock lock{registry_mutex_};
        for (const auto& [id, record] : registry_) {
            if (record->handle && !detail::try_reap(*record->handle)) {
                debug_log("leaving launched process ", record->pid, " (", id, ") running at shutdown");
            }
        }
        registry_.clear();
    }

    detail::process_record& process_manager::lookup(std::string_view session_id) const {
        auto it = registry_.find(session_id);
        if (it == registry_.end()) {
            throw process_error(std::format("Process not found: {}", session_id));
        }
        return *it->second;
    }

    std::string process_manager::launch(const fs::path& app_path, const std::vector<std::string>& args) {
        std::error_code ec{};
        if (app_path.empty() || !fs::exists(app_path, ec)) {
            throw process_error(std::format("App path does not exist: {}", app_path.string()));
        }

        info_log("launching app: ", app_path.string(), " with ", args.size(), " argument(s)");

        std::unique_lock lock{registry_mutex_};

        auto child = detail::spawn_child(app_path, args);

        auto id = utils::make_uuid_v4();
        while (registry_.contains(id)) {
            id = utils::make_uuid_v4();
        }

        auto record = std::make_unique<detail::process_record>();
        record->id = id;
        record->pid = child.pid;
        record->app_path = app_path;
        record->handle = detail::child_handle{.pid = child.pid};
        record->logs = std::make_shared<log_queue>(log_capacity_);
        try {
            record->multiplexer =
                    std::make_unique<internal::log_multiplexer>(child.stdout_fd, child.stderr_fd, record->logs);
        } catch (const std::exception& e) {
            ::kill(child.pid, SIGKILL);
            while (::waitpid(child.pid, nullptr, 0) < 0 && errno == EINTR) {
            }
            throw process_error(std::format("Failed to capture app output: {}", e.what()));
        }

        registry_.emplace(id, std::move(record));
        info_log("app launched with process id ", id, " (pid ", child.pid, ")");
        return id;
    }

    std::string process_manager::attach(pid_t pid) {
        if (!detail::pid_exists(pid)) {
            throw process_error(std::format("No running process with pid {}", pid));
        }

        std::unique_lock lock{registry_mutex_};

        auto id = utils::make_uuid_v4();
        while (registry_.contains(id)) {
            id = utils::make_uuid_v4();
        }

        auto record = std::make_unique<detail::process_record>();
        record->id = id;
        record->pid = pid;
        record->logs = std::make_shared<log_queue>(log_capacity_);
        registry_.emplace(id, std::move(record));

        info_log("attached to pid ", pid, " as process id ", id);
        return id;
    }

    void process_manager::stop(std::string_view session_id) {
        std::unique_lock lock{registry_mutex_};
        auto it = registry_.find(session_id);
        if (it == registry_.end()) {
            throw process_error(std::format("Process not found: {}", session_id));
        }

        auto& record = *it->second;
        if (!record.handle) {
            throw process_error(std::format(
                    "Cannot stop externally-owned process {} (pid {}): it was attached, not launched",
                    session_id,
                    record.pid));
        }

        info_log("stopping app with process id ", session_id, " (pid ", record.pid, ")");
        detail::terminate_child(*record.handle, stop_timeout_ms_);

        // destroying the record cancels its log multiplexer
        registry_.erase(it);
    }

    log_snapshot process_manager::get_logs(std::string_view session_id, std::optional<std::size_t> limit) {
        std::shared_lock lock{registry_mutex_};
        auto& record = lookup(session_id);

        log_snapshot out{};
        out.logs = record.logs->drain();
        out.dropped = record.logs->dropped();
        if (limit && out.logs.size() > *limit) {
            out.logs.erase(out.logs.begin(), out.logs.end() - static_cast<std::ptrdiff_t>(*limit));
        }
        return out;
    }

    log_stats process_manager::peek_logs(std::string_view session_id) const {
        std::shared_lock lock{registry_mutex_};
        auto& record = lookup(session_id);
        return {.buffered = record.logs->size(), .dropped = record.logs->dropped()};
    }

    resource_usage process_manager::monitor_resources(std::string_view session_id) {
        std::shared_lock lock{registry_mutex_};
        auto& record = lookup(session_id);

        auto proc_dir = std::format("{}/{}", internal::platform::proc_root, record.pid);
        auto stat_text = internal::procfs::read_text_file(proc_dir + "/stat");
        if (!stat_text) {
            throw process_error(std::format("Failed to get process info: pid {} is no longer running", record.pid));
        }
        auto stat = internal::procfs::parse_stat(*stat_text);
        if (!stat) {
            throw process_error(std::format("Failed to get process info: unreadable stat for pid {}", record.pid));
        }

        auto io = internal::procfs::parse_io(internal::procfs::read_text_file(proc_dir + "/io").value_or(""));
        auto uptime = internal::procfs::parse_uptime(
                internal::procfs::read_text_file(std::format("{}/uptime", internal::platform::proc_root))
                        .value_or(""));
        auto boot_time = internal::procfs::parse_boot_time(
                internal::procfs::read_text_file(std::format("{}/stat", internal::platform::proc_root))
                        .value_or(""));

        auto clk_tck = static_cast<double>(::sysconf(_SC_CLK_TCK));
        auto page_size = static_cast<uint64_t>(::sysconf(_SC_PAGESIZE));
        auto start_secs = static_cast<double>(stat->start_ticks) / clk_tck;
        auto total_ticks = stat->utime_ticks + stat->stime_ticks;
        auto now = std::chrono::steady_clock::now();

        double cpu = 0.0;
        {
            std::lock_guard sample_lock{record.sample_mutex};
            if (record.last_sample) {
                auto elapsed = std::chrono::duration<double>(now - record.last_sample->taken_at).count();
                auto delta = total_ticks >= record.last_sample->total_ticks
                                   ? total_ticks - record.last_sample->total_ticks
                                   : 0U;
                if (elapsed > 0.0) {
                    cpu = (static_cast<double>(delta) / clk_tck) / elapsed * 100.0;
                }
            }
            else if (uptime && *uptime > start_secs) {
                cpu = (static_cast<double>(total_ticks) / clk_tck) / (*uptime - start_secs) * 100.0;
            }
            record.last_sample = detail::cpu_sample{.total_ticks = total_ticks, .taken_at = now};
        }

        resource_usage out{};
        out.cpu_usage = cpu;
        out.memory_usage = stat->rss_pages > 0 ? static_cast<uint64_t>(stat->rss_pages) * page_size : 0U;
        out.virtual_memory = stat->vsize_bytes;
        out.disk = {.read_bytes = io.read_bytes, .written_bytes = io.write_bytes};
        out.status = std::string{internal::procfs::status_name(stat->state)};
        out.start_time = boot_time ? *boot_time + static_cast<uint64_t>(start_secs) : 0U;
        out.run_time = uptime && *uptime > start_secs ? static_cast<uint64_t>(*uptime - start_secs) : 0U;
        return out;
    }

    std::vector<app_candidate> process_manager::find_running_apps() const {
        if (!auto_discover_) {
            throw process_error("Auto-discovery is disabled by configuration");
        }

        auto self = static_cast<int>(::getpid());
        std::vector<app_candidate> out{};
        for (auto pid : internal::procfs::list_pids(internal::platform::proc_root)) {
            if (pid == self) {
                continue;
            }
            auto proc_dir = std::format("{}/{}", internal::platform::proc_root, pid);
            auto comm = internal::procfs::read_text_file(proc_dir + "/comm");
            if (!comm) {
                continue;
            }
            auto name = std::string{utils::trim_view(*comm)};
            auto cmd = internal::procfs::parse_cmdline(internal::procfs::read_text_file(proc_dir + "/cmdline").value_or(""));
            if (!looks_like_app(name, cmd, discovery_patterns_)) {
                continue;
            }

            std::error_code ec{};
            auto exe = fs::read_symlink(proc_dir + "/exe", ec);
            out.push_back(app_candidate{
                    .pid = pid, .name = std::move(name), .cmd = std::move(cmd), .exe = ec ? std::string{} : exe.string()});
        }

        std::ranges::sort(out, {}, &app_candidate::pid);
        debug_log("find_running_apps matched ", out.size(), " process(es)");
        return out;
    }

    pid_t process_manager::pid_of(std::string_view session_id) const {
        std::shared_lock lock{registry_mutex_};
        return lookup(session_id).pid;
    }

    bool process_manager::is_owned(std::string_view session_id) const {
        std::shared_lock lock{registry_mutex_};
        return lookup(session_id).handle.has_value();
    }

    std::vector<std::string> process_manager::session_ids() const {
        std::shared_lock lock{registry_mutex_};
        std::vector<std::string> out{};
        out.reserve(registry_.size());
        for (const auto& [id, record] : registry_) {
            out.push_back(id);
        }
        return out;
    }

}  // namespace tauri_mcp

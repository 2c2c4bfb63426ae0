#include "subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>

namespace tauri_mcp::internal {

    namespace {

        struct pipe_pair {
            int read_end{-1};
            int write_end{-1};

            bool open() {
                int fds[2]{};
                if (::pipe2(fds, O_CLOEXEC) != 0) {
                    return false;
                }
                read_end = fds[0];
                write_end = fds[1];
                return true;
            }

            void close_read() {
                if (read_end >= 0) {
                    ::close(read_end);
                    read_end = -1;
                }
            }

            void close_write() {
                if (write_end >= 0) {
                    ::close(write_end);
                    write_end = -1;
                }
            }
        };

        [[noreturn]] void exec_child(const std::vector<std::string>& args, int stdout_fd, int stderr_fd) {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
                ::close(devnull);
            }
            ::dup2(stdout_fd, STDOUT_FILENO);
            ::dup2(stderr_fd, STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        // Reads both streams until EOF or the deadline; returns false on timeout
        bool collect_output(pipe_pair& out, pipe_pair& err, subprocess_result& result, int timeout_ms) {
            std::array<pollfd, 2> fds{{
                    {.fd = out.read_end, .events = POLLIN, .revents = 0},
                    {.fd = err.read_end, .events = POLLIN, .revents = 0},
            }};
            std::array<std::string*, 2> sinks{&result.stdout_output, &result.stderr_output};
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

            auto open_streams = [&] { return (fds[0].fd >= 0 ? 1 : 0) + (fds[1].fd >= 0 ? 1 : 0); };
            while (open_streams() > 0) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                         deadline - std::chrono::steady_clock::now())
                                         .count();
                if (remaining <= 0) {
                    return false;
                }

                int ret = ::poll(fds.data(), fds.size(), static_cast<int>(remaining));
                if (ret < 0 && errno == EINTR) {
                    continue;
                }
                if (ret < 0) {
                    break;
                }
                if (ret == 0) {
                    return false;
                }

                char chunk[4096]{};
                for (size_t i = 0; i < fds.size(); ++i) {
                    if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                        continue;
                    }
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        sinks[i]->append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                    }
                }
            }
            return true;
        }

        int exit_code_of(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace

    subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms) {
        if (args.empty()) {
            return {.exit_code = 127, .stderr_output = "empty command"};
        }

        pipe_pair out{};
        pipe_pair err{};
        if (!out.open() || !err.open()) {
            out.close_read();
            out.close_write();
            return {.exit_code = 1, .stderr_output = "pipe() failed"};
        }

        auto pid = ::fork();
        if (pid < 0) {
            for (auto* p : {&out, &err}) {
                p->close_read();
                p->close_write();
            }
            return {.exit_code = 1, .stderr_output = "fork() failed"};
        }
        if (pid == 0) {
            exec_child(args, out.write_end, err.write_end);
        }

        out.close_write();
        err.close_write();

        subprocess_result result{};
        if (!collect_output(out, err, result, timeout_ms)) {
            ::kill(pid, SIGKILL);
            result.timed_out = true;
        }
        out.close_read();
        err.close_read();

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }

        if (result.timed_out) {
            result.exit_code = 1;
            result.stderr_output = "subprocess timed out";
            return result;
        }
        result.exit_code = exit_code_of(status);
        return result;
    }

}  // namespace tauri_mcp::internal

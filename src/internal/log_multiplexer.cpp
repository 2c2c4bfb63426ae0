#include "log_multiplexer.hpp"

#include "tauri_mcp/utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace tauri_mcp::internal {

    using namespace std::string_view_literals;

    void line_splitter::feed(std::string_view bytes) {
        pending_.append(bytes);
        size_t start = 0U;
        for (;;) {
            auto eol = pending_.find('\n', start);
            if (eol == std::string::npos) {
                break;
            }
            emit(std::string_view{pending_}.substr(start, eol - start));
            start = eol + 1U;
        }
        pending_.erase(0U, start);
    }

    void line_splitter::finish() {
        if (!pending_.empty()) {
            emit(pending_);
            pending_.clear();
        }
    }

    void line_splitter::emit(std::string_view line) {
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1U);
        }
        std::string tagged{};
        tagged.reserve(tag_.size() + 3U + line.size());
        tagged.push_back('[');
        tagged.append(tag_);
        tagged.append("] ");
        tagged.append(line);
        queue_->push(std::move(tagged));
    }

    log_multiplexer::log_multiplexer(int stdout_fd, int stderr_fd, std::shared_ptr<log_queue> queue)
            : stdout_fd_{stdout_fd}, stderr_fd_{stderr_fd}, queue_{std::move(queue)} {
        if (::pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) != 0) {
            auto err = errno;
            ::close(stdout_fd_);
            ::close(stderr_fd_);
            throw std::runtime_error("failed to create log wake pipe: " + std::string{std::strerror(err)});
        }
        worker_ = std::jthread{[this](std::stop_token stop) { run(stop); }};
    }

    log_multiplexer::~log_multiplexer() {
        cancel();
        for (int fd : {stdout_fd_, stderr_fd_, wake_pipe_[0], wake_pipe_[1]}) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }

    void log_multiplexer::cancel() {
        if (!worker_.joinable()) {
            return;
        }
        worker_.request_stop();
        char byte = 1;
        (void)::write(wake_pipe_[1], &byte, 1U);
        worker_.join();
    }

    void log_multiplexer::run(std::stop_token stop) {
        line_splitter out_lines{"stdout"sv, queue_};
        line_splitter err_lines{"stderr"sv, queue_};

        pollfd fds[3]{};
        fds[0] = {.fd = stdout_fd_, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_fd_, .events = POLLIN, .revents = 0};
        fds[2] = {.fd = wake_pipe_[0], .events = POLLIN, .revents = 0};
        int fds_open = 2;

        while (fds_open > 0 && !stop.stop_requested()) {
            int ret = ::poll(fds, 3, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                warn_log("log multiplexer poll failed: ", std::strerror(errno));
                break;
            }
            if ((fds[2].revents & POLLIN) != 0) {
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                auto& splitter = i == 0 ? out_lines : err_lines;
                auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                if (n > 0) {
                    splitter.feed(std::string_view{chunk, static_cast<size_t>(n)});
                    continue;
                }
                if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                    continue;
                }
                splitter.finish();
                ::close(fds[i].fd);
                (i == 0 ? stdout_fd_ : stderr_fd_) = -1;
                fds[i].fd = -1;
                --fds_open;
            }
        }

        finished_.store(true, std::memory_order_release);
        trace_log("log multiplexer exiting, open streams: ", fds_open);
    }

}  // namespace tauri_mcp::internal

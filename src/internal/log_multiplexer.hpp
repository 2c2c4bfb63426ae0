#pragma once

#include "tauri_mcp/log_queue.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace tauri_mcp::internal {

    // Splits a byte stream into lines and pushes each one, tagged with its origin, into a log_queue.
    class line_splitter {
      public:
        line_splitter(std::string_view tag, std::shared_ptr<log_queue> queue) : tag_{tag}, queue_{std::move(queue)} {}

        void feed(std::string_view bytes);
        void finish();

      private:
        void emit(std::string_view line);

        std::string tag_;
        std::shared_ptr<log_queue> queue_;
        std::string pending_{};
    };

    /*
     * Drains a child's stdout and stderr pipes into one log_queue on a background thread.
     * Lines keep their order within a stream; the two streams interleave in arrival order.
     * The thread ends when both pipes hit EOF, or when the multiplexer is cancelled or
     * destroyed. Takes ownership of both descriptors.
     */
    class log_multiplexer {
      public:
        log_multiplexer(int stdout_fd, int stderr_fd, std::shared_ptr<log_queue> queue);
        ~log_multiplexer();

        log_multiplexer(const log_multiplexer&) = delete;
        log_multiplexer& operator=(const log_multiplexer&) = delete;

        void cancel();
        bool finished() const { return finished_.load(std::memory_order_acquire); }

      private:
        void run(std::stop_token stop);

        int stdout_fd_;
        int stderr_fd_;
        int wake_pipe_[2]{-1, -1};
        std::shared_ptr<log_queue> queue_;
        std::atomic<bool> finished_{false};
        std::jthread worker_{};
    };

}  // namespace tauri_mcp::internal

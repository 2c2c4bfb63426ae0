#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace tauri_mcp {

    /*
     * Bounded FIFO of tagged log lines shared between a log multiplexer (producer) and
     * get_app_logs (consumer). Full queues discard their oldest line to admit a new one;
     * producers never block.
     */
    class log_queue {
      public:
        explicit log_queue(std::size_t capacity) : capacity_{capacity == 0 ? 1U : capacity} {}

        log_queue(const log_queue&) = delete;
        log_queue& operator=(const log_queue&) = delete;

        void push(std::string line) {
            std::lock_guard lock{mutex_};
            if (lines_.size() == capacity_) {
                lines_.pop_front();
                ++dropped_;
            }
            lines_.push_back(std::move(line));
        }

        // Removes and returns every buffered line, oldest first.
        std::vector<std::string> drain() {
            std::lock_guard lock{mutex_};
            std::vector<std::string> out{};
            out.reserve(lines_.size());
            for (auto& line : lines_) {
                out.push_back(std::move(line));
            }
            lines_.clear();
            return out;
        }

        std::size_t size() const {
            std::lock_guard lock{mutex_};
            return lines_.size();
        }

        std::size_t capacity() const { return capacity_; }

        // Total lines discarded on overflow since construction.
        uint64_t dropped() const {
            std::lock_guard lock{mutex_};
            return dropped_;
        }

      private:
        mutable std::mutex mutex_{};
        std::deque<std::string> lines_{};
        std::size_t capacity_;
        uint64_t dropped_{0};
    };

}  // namespace tauri_mcp

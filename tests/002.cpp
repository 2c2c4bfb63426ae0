#include "utils.hpp"

namespace tauri_mcp::test {
    using namespace std::string_view_literals;

    TEST_CASE("002: log queue drops oldest lines on overflow", "[002][logs]") {
        log_queue queue{3};
        for (int i = 0; i < 5; ++i) {
            queue.push("line " + std::to_string(i));
        }

        CHECK(queue.size() == 3U);
        CHECK(queue.dropped() == 2U);

        auto lines = queue.drain();
        REQUIRE(lines.size() == 3U);
        CHECK(lines.front() == "line 2");
        CHECK(lines.back() == "line 4");

        CHECK(queue.size() == 0U);
        CHECK(queue.drain().empty());
        CHECK(queue.dropped() == 2U);
    }

    TEST_CASE("002: zero capacity queue still holds one line", "[002][logs]") {
        log_queue queue{0};
        CHECK(queue.capacity() == 1U);
        queue.push("a");
        queue.push("b");
        auto lines = queue.drain();
        REQUIRE(lines.size() == 1U);
        CHECK(lines[0] == "b");
    }

    TEST_CASE("002: line splitter tags lines and handles partial input", "[002][logs]") {
        auto queue = std::make_shared<log_queue>(16);
        internal::line_splitter splitter{"stdout"sv, queue};

        splitter.feed("hello\r\nwor"sv);
        CHECK(queue->size() == 1U);
        splitter.feed("ld\n\ntail"sv);
        CHECK(queue->size() == 3U);
        splitter.finish();

        auto lines = queue->drain();
        REQUIRE(lines.size() == 4U);
        CHECK(lines[0] == "[stdout] hello");
        CHECK(lines[1] == "[stdout] world");
        CHECK(lines[2] == "[stdout] ");
        CHECK(lines[3] == "[stdout] tail");

        splitter.finish();
        CHECK(queue->size() == 0U);
    }

    TEST_CASE("002: log multiplexer collects both pipes until EOF", "[002][logs]") {
        int out_pipe[2]{};
        int err_pipe[2]{};
        REQUIRE(::pipe2(out_pipe, O_CLOEXEC) == 0);
        REQUIRE(::pipe2(err_pipe, O_CLOEXEC) == 0);

        auto queue = std::make_shared<log_queue>(64);
        internal::log_multiplexer mux{out_pipe[0], err_pipe[0], queue};

        auto write_all = [](int fd, std::string_view text) {
            REQUIRE(::write(fd, text.data(), text.size()) == static_cast<ssize_t>(text.size()));
        };
        write_all(out_pipe[1], "first\nsecond\n"sv);
        write_all(err_pipe[1], "oops\n"sv);
        write_all(out_pipe[1], "no newline"sv);
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);

        REQUIRE(detail::wait_until([&] { return mux.finished(); }));

        auto lines = queue->drain();
        REQUIRE(lines.size() == 4U);

        std::vector<std::string> stdout_lines{};
        std::vector<std::string> stderr_lines{};
        for (const auto& line : lines) {
            (line.starts_with("[stdout] ") ? stdout_lines : stderr_lines).push_back(line);
        }
        CHECK(stdout_lines == std::vector<std::string>{"[stdout] first", "[stdout] second", "[stdout] no newline"});
        CHECK(stderr_lines == std::vector<std::string>{"[stderr] oops"});
    }

    TEST_CASE("002: cancelling a multiplexer with open pipes returns promptly", "[002][logs]") {
        int out_pipe[2]{};
        int err_pipe[2]{};
        REQUIRE(::pipe2(out_pipe, O_CLOEXEC) == 0);
        REQUIRE(::pipe2(err_pipe, O_CLOEXEC) == 0);

        auto queue = std::make_shared<log_queue>(8);
        {
            internal::log_multiplexer mux{out_pipe[0], err_pipe[0], queue};
            REQUIRE(::write(out_pipe[1], "x\n", 2) == 2);
            REQUIRE(detail::wait_until([&] { return queue->size() == 1U; }));
            CHECK_FALSE(mux.finished());
            mux.cancel();
            CHECK(mux.finished());
        }
        ::close(out_pipe[1]);
        ::close(err_pipe[1]);

        auto lines = queue->drain();
        REQUIRE(lines.size() == 1U);
        CHECK(lines[0] == "[stdout] x");
    }
}  // namespace tauri_mcp::test

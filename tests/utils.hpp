#pragma once

#include "tauri_mcp.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "internal/desktop.hpp"
#include "internal/log_multiplexer.hpp"
#include "internal/procfs.hpp"
#include "internal/subprocess.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace tauri_mcp::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
        REQUIRE(out.good());
    }

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

    // Polls `done` every 10ms until it holds or `timeout_ms` passes
    inline bool wait_until(const std::function<bool()>& done, int timeout_ms = 5000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (done()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return done();
    }

    // Config that never scans real DevTools ports and keeps stop() fast
    inline server_config test_config() {
        server_config cfg{};
        cfg.config_path = "/nonexistent/tauri-mcp.json";
        cfg.level = log_level::warn;
        cfg.stop_timeout_ms = 2000;
        cfg.devtools_port_first = 1;
        cfg.devtools_port_last = 1;
        cfg.http_timeout_ms = 200;
        return cfg;
    }

    // what() of the tool_error thrown by `fn`, or empty when nothing was thrown
    inline std::string error_message(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const tool_error& e) {
            return e.what();
        }
        return {};
    }

    // Extracts the string value of the first `"key":"..."` occurrence
    inline std::string json_string_field(std::string_view json, std::string_view key) {
        auto marker = std::string{"\""} + std::string{key} + "\":\"";
        auto pos = json.find(marker);
        if (pos == std::string_view::npos) {
            return {};
        }
        pos += marker.size();
        auto end = json.find('"', pos);
        return std::string{json.substr(pos, end - pos)};
    }

    // Ignores SIGPIPE for the scope, as the stdio server does
    struct sigpipe_ignored {
        sigpipe_ignored() : previous{::signal(SIGPIPE, SIG_IGN)} {}
        ~sigpipe_ignored() { ::signal(SIGPIPE, previous); }
        sigpipe_ignored(const sigpipe_ignored&) = delete;
        sigpipe_ignored& operator=(const sigpipe_ignored&) = delete;

        void (*previous)(int);
    };

    // Mask from a "SigIgn:\t<hex>" line of /proc/<pid>/status
    inline uint64_t sigign_mask(std::string_view line) {
        auto pos = line.find("SigIgn:");
        REQUIRE(pos != std::string_view::npos);
        return std::stoull(std::string{line.substr(pos + 7U)}, nullptr, 16);
    }

    inline constexpr uint64_t sigpipe_bit = uint64_t{1} << (SIGPIPE - 1);
}  // namespace tauri_mcp::test::detail

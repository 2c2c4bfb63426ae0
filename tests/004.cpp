#include "utils.hpp"

namespace tauri_mcp::test {
    using namespace std::string_view_literals;

    TEST_CASE("004: launched process output is captured and drained", "[004][process]") {
        process_manager processes{detail::test_config()};

        auto id = processes.launch("/bin/sh", {"-c", "echo out; echo err 1>&2"});
        CHECK(processes.is_owned(id));
        CHECK(processes.pid_of(id) > 0);

        REQUIRE(detail::wait_until([&] { return processes.peek_logs(id).buffered >= 2U; }));

        auto first = processes.get_logs(id, std::nullopt);
        CHECK(std::ranges::find(first.logs, "[stdout] out"sv) != first.logs.end());
        CHECK(std::ranges::find(first.logs, "[stderr] err"sv) != first.logs.end());
        CHECK(first.dropped == 0U);

        auto second = processes.get_logs(id, std::nullopt);
        CHECK(second.logs.empty());

        processes.stop(id);
        CHECK_THROWS_AS(processes.get_logs(id, std::nullopt), tool_error);
    }

    TEST_CASE("004: log line limit keeps the newest lines", "[004][process]") {
        process_manager processes{detail::test_config()};

        auto id = processes.launch("/bin/sh", {"-c", "for i in 1 2 3 4 5; do echo line$i; done"});
        REQUIRE(detail::wait_until([&] { return processes.peek_logs(id).buffered >= 5U; }));

        auto snapshot = processes.get_logs(id, std::size_t{2});
        CHECK(snapshot.logs == std::vector<std::string>{"[stdout] line4", "[stdout] line5"});
        CHECK(processes.get_logs(id, std::nullopt).logs.empty());

        processes.stop(id);
    }

    TEST_CASE("004: bounded log buffer reports dropped lines", "[004][process]") {
        auto cfg = detail::test_config();
        cfg.log_capacity = 3;
        process_manager processes{cfg};

        auto id = processes.launch("/bin/sh", {"-c", "for i in 1 2 3 4 5 6; do echo n$i; done"});
        REQUIRE(detail::wait_until([&] { return processes.peek_logs(id).dropped >= 3U; }));

        auto snapshot = processes.get_logs(id, std::nullopt);
        CHECK(snapshot.dropped == 3U);
        CHECK(snapshot.logs == std::vector<std::string>{"[stdout] n4", "[stdout] n5", "[stdout] n6"});

        processes.stop(id);
    }

    TEST_CASE("004: launched apps start with default SIGPIPE handling", "[004][process]") {
        detail::sigpipe_ignored ignored{};
        process_manager processes{detail::test_config()};

        auto id = processes.launch("/bin/sh", {"-c", "grep SigIgn /proc/self/status"});
        REQUIRE(detail::wait_until([&] { return processes.peek_logs(id).buffered >= 1U; }));

        auto snapshot = processes.get_logs(id, std::nullopt);
        REQUIRE(snapshot.logs.size() == 1U);
        CHECK(snapshot.logs.front().starts_with("[stdout] SigIgn:"));
        CHECK((detail::sigign_mask(snapshot.logs.front()) & detail::sigpipe_bit) == 0U);

        processes.stop(id);
    }

    TEST_CASE("004: launches get distinct ids", "[004][process]") {
        process_manager processes{detail::test_config()};

        auto a = processes.launch("/bin/true", {});
        auto b = processes.launch("/bin/true", {});
        CHECK(a != b);

        auto ids = processes.session_ids();
        CHECK(ids.size() == 2U);

        processes.stop(a);
        processes.stop(b);
        CHECK(processes.session_ids().empty());
    }

    TEST_CASE("004: stop terminates a long running child", "[004][process]") {
        process_manager processes{detail::test_config()};

        auto id = processes.launch("/bin/sleep", {"30"});
        auto pid = processes.pid_of(id);
        REQUIRE(::kill(pid, 0) == 0);

        auto started = std::chrono::steady_clock::now();
        processes.stop(id);
        auto elapsed = std::chrono::steady_clock::now() - started;

        CHECK(elapsed < std::chrono::seconds(2));
        CHECK(::kill(pid, 0) != 0);
        CHECK_THROWS_AS(processes.stop(id), tool_error);
    }

    TEST_CASE("004: stop escalates to SIGKILL when SIGTERM is ignored", "[004][process]") {
        auto cfg = detail::test_config();
        cfg.stop_timeout_ms = 100;
        process_manager processes{cfg};

        auto id = processes.launch("/bin/sh", {"-c", "trap '' TERM; echo ready; while true; do sleep 1; done"});
        REQUIRE(detail::wait_until([&] { return processes.peek_logs(id).buffered >= 1U; }));

        auto pid = processes.pid_of(id);
        processes.stop(id);
        CHECK(::kill(pid, 0) != 0);
    }

    TEST_CASE("004: launch failures", "[004][process]") {
        process_manager processes{detail::test_config()};

        try {
            processes.launch("/nonexistent/tauri-app", {});
            FAIL("launch should fail for a missing path");
        } catch (const tool_error& e) {
            CHECK(e.kind() == error_kind::process);
            CHECK(detail::contains(e.what(), "App path does not exist: /nonexistent/tauri-app"));
        }

        detail::temp_dir temp{"tauri_mcp_noexec"};
        auto script = temp.path / "not-executable";
        detail::write_file(script, "#!/bin/sh\necho hi\n");
        try {
            processes.launch(script, {});
            FAIL("launch should fail for a non-executable file");
        } catch (const tool_error& e) {
            CHECK(detail::contains(e.what(), "Failed to launch app"));
        }

        CHECK(processes.session_ids().empty());
    }

    TEST_CASE("004: attached processes are observed but never stopped", "[004][process]") {
        process_manager processes{detail::test_config()};

        auto id = processes.attach(::getpid());
        CHECK_FALSE(processes.is_owned(id));
        CHECK(processes.pid_of(id) == ::getpid());

        try {
            processes.stop(id);
            FAIL("stop should refuse an attached process");
        } catch (const tool_error& e) {
            CHECK(detail::contains(e.what(), "externally-owned"));
        }
        CHECK(processes.session_ids() == std::vector<std::string>{id});

        auto logs = processes.get_logs(id, std::nullopt);
        CHECK(logs.logs.empty());

        CHECK_THROWS_AS(processes.attach(99999999), tool_error);
        CHECK_THROWS_AS(processes.attach(0), tool_error);
    }

    TEST_CASE("004: resource usage of a tracked process", "[004][process]") {
        process_manager processes{detail::test_config()};

        auto self = processes.attach(::getpid());
        auto usage = processes.monitor_resources(self);
        CHECK(usage.memory_usage > 0U);
        CHECK(usage.virtual_memory >= usage.memory_usage);
        CHECK(usage.cpu_usage >= 0.0);
        CHECK((usage.status == "Run" || usage.status == "Sleep"));
        CHECK(usage.start_time > 0U);

        auto again = processes.monitor_resources(self);
        CHECK(again.cpu_usage >= 0.0);

        auto id = processes.launch("/bin/true", {});
        auto pid = processes.pid_of(id);
        processes.stop(id);
        CHECK_THROWS_AS(processes.monitor_resources(id), tool_error);
        CHECK(::kill(pid, 0) != 0);
    }

    TEST_CASE("004: discovery matches configured patterns", "[004][process]") {
        auto cfg = detail::test_config();
        cfg.discovery_patterns = {"tauri-probe-xyz"};
        process_manager processes{cfg};

        auto id = processes.launch("/bin/sh", {"-c", "sleep 5; true", "tauri-probe-xyz"});
        auto pid = processes.pid_of(id);

        std::vector<app_candidate> apps{};
        REQUIRE(detail::wait_until([&] {
            apps = processes.find_running_apps();
            return std::ranges::any_of(apps, [&](const app_candidate& a) { return a.pid == pid; });
        }));
        CHECK(std::ranges::is_sorted(apps, {}, &app_candidate::pid));
        CHECK(std::ranges::none_of(apps, [](const app_candidate& a) { return a.pid == ::getpid(); }));

        auto it = std::ranges::find(apps, pid, &app_candidate::pid);
        REQUIRE(it != apps.end());
        CHECK(detail::contains(it->cmd, "tauri-probe-xyz"));
        CHECK(it->name == "sh");

        processes.stop(id);
    }

    TEST_CASE("004: discovery can be disabled", "[004][process]") {
        auto cfg = detail::test_config();
        cfg.features.auto_discover = false;
        process_manager processes{cfg};

        CHECK_THROWS_AS(processes.find_running_apps(), tool_error);
    }

    TEST_CASE("004: app heuristics", "[004][process]") {
        std::vector<std::string> patterns{"tauri"};
        CHECK(looks_like_app("my-tauri-app", "", patterns));
        CHECK(looks_like_app("app", "/opt/Tauri/app --x", patterns));
        CHECK(looks_like_app("notes", "/home/me/Notes.AppImage --no-sandbox", patterns));
        CHECK(looks_like_app("Notes", "/Applications/Notes.app/Contents/MacOS/Notes", patterns));
        CHECK(looks_like_app("notes", "C:\\Apps\\notes.exe", patterns));
        CHECK_FALSE(looks_like_app("bash", "/bin/bash -l", patterns));
        CHECK_FALSE(looks_like_app("kworker/0:1", "", patterns));
        CHECK_FALSE(looks_like_app("bash", "/bin/bash", {}));
    }
}  // namespace tauri_mcp::test

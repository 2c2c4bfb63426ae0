#include "utils.hpp"

namespace tauri_mcp::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: procfs stat parsing tolerates spaces in comm", "[003][procfs]") {
        auto text =
                "4242 (my app (dev)) S 1 4242 4242 0 -1 4194560 1000 0 0 0 "
                "150 30 0 0 20 0 8 0 123456 987654321 2048 18446744073709551615\n"sv;

        auto stat = internal::procfs::parse_stat(text);
        REQUIRE(stat);
        CHECK(stat->comm == "my app (dev)");
        CHECK(stat->state == 'S');
        CHECK(stat->utime_ticks == 150U);
        CHECK(stat->stime_ticks == 30U);
        CHECK(stat->start_ticks == 123456U);
        CHECK(stat->vsize_bytes == 987654321U);
        CHECK(stat->rss_pages == 2048);

        CHECK_FALSE(internal::procfs::parse_stat("4242 (short) S 1 2 3"sv));
        CHECK_FALSE(internal::procfs::parse_stat("garbage"sv));
    }

    TEST_CASE("003: procfs io, uptime, btime and cmdline", "[003][procfs]") {
        auto io = internal::procfs::parse_io(
                "rchar: 100\nwchar: 200\nsyscr: 3\nread_bytes: 4096\nwrite_bytes: 8192\ncancelled_write_bytes: 0\n"sv);
        CHECK(io.read_bytes == 4096U);
        CHECK(io.write_bytes == 8192U);

        auto uptime = internal::procfs::parse_uptime("12345.67 54321.00\n"sv);
        REQUIRE(uptime);
        CHECK(*uptime > 12345.6);
        CHECK(*uptime < 12345.7);
        CHECK_FALSE(internal::procfs::parse_uptime(""sv));

        auto btime = internal::procfs::parse_boot_time("cpu  1 2 3\nintr 5\nbtime 1700000000\nprocesses 99\n"sv);
        REQUIRE(btime);
        CHECK(*btime == 1700000000U);
        CHECK_FALSE(internal::procfs::parse_boot_time("cpu 1 2 3\n"sv));

        auto raw = std::string{"/usr/bin/app\0--flag\0value\0", 26};
        CHECK(internal::procfs::parse_cmdline(raw) == "/usr/bin/app --flag value");

        CHECK(internal::procfs::status_name('R') == "Run"sv);
        CHECK(internal::procfs::status_name('Z') == "Zombie"sv);
        CHECK(internal::procfs::status_name('?') == "Unknown"sv);
    }

    TEST_CASE("003: live procfs lists the current process", "[003][procfs]") {
        auto pids = internal::procfs::list_pids();
        CHECK(std::ranges::find(pids, static_cast<int>(::getpid())) != pids.end());

        auto text = internal::procfs::read_text_file("/proc/self/stat");
        REQUIRE(text);
        auto stat = internal::procfs::parse_stat(*text);
        REQUIRE(stat);
        CHECK(stat->state != '?');
    }

    TEST_CASE("003: window geometry parsing", "[003][desktop]") {
        auto geom = internal::desktop::parse_window_geometry(
                "WINDOW=12345\nX=-10\nY=40\nWIDTH=1280\nHEIGHT=720\nSCREEN=0\n"sv);
        REQUIRE(geom);
        CHECK(geom->x == -10);
        CHECK(geom->y == 40);
        CHECK(geom->width == 1280U);
        CHECK(geom->height == 720U);

        CHECK_FALSE(internal::desktop::parse_window_geometry("WINDOW=1\nX=0\nY=0\n"sv));
    }

    TEST_CASE("003: key chords translate to xdotool keysyms", "[003][desktop]") {
        using internal::desktop::is_key_chord;
        using internal::desktop::translate_key_chord;

        CHECK(is_key_chord("ctrl+c"sv));
        CHECK(is_key_chord("cmd+shift+p"sv));
        CHECK_FALSE(is_key_chord("hello world"sv));
        CHECK_FALSE(is_key_chord("shift+a"sv));

        CHECK(translate_key_chord("ctrl+c"sv) == "ctrl+c");
        CHECK(translate_key_chord("cmd+Shift+P"sv) == "super+shift+p");
        CHECK(translate_key_chord("ctrl+alt+delete"sv) == "ctrl+alt+Delete");
        CHECK(translate_key_chord("ctrl+enter"sv) == "ctrl+Return");
        CHECK(translate_key_chord("cmd+f5"sv) == "super+F5");

        CHECK_THROWS_AS(translate_key_chord("ctrl"sv), tool_error);
        CHECK_THROWS_AS(translate_key_chord("ctrl+hyper+a"sv), tool_error);
        CHECK_THROWS_AS(translate_key_chord("ctrl+f13"sv), tool_error);
        CHECK_THROWS_AS(translate_key_chord("ctrl+!"sv), tool_error);
    }
}  // namespace tauri_mcp::test

#pragma once

#include "tauri_mcp/utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tauri_mcp::internal::procfs {

    using namespace std::string_view_literals;

    // Fields of /proc/<pid>/stat used by resource monitoring (see proc(5)).
    struct stat_fields {
        std::string comm{};
        char state{'?'};
        uint64_t utime_ticks{};
        uint64_t stime_ticks{};
        uint64_t start_ticks{};
        uint64_t vsize_bytes{};
        int64_t rss_pages{};
    };

    struct io_fields {
        uint64_t read_bytes{};
        uint64_t write_bytes{};
    };

    inline std::optional<std::string> read_text_file(const std::string& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return std::nullopt;
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (in.bad()) {
            return std::nullopt;
        }
        return ss.str();
    }

    // comm may contain spaces and parentheses, so fields are counted from the last ')'
    inline std::optional<stat_fields> parse_stat(std::string_view text) {
        auto open = text.find('(');
        auto close = text.rfind(')');
        if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
            return std::nullopt;
        }

        stat_fields out{};
        out.comm = std::string{text.substr(open + 1U, close - open - 1U)};

        auto rest = utils::split_whitespace(text.substr(close + 1U));
        // rest[0] is field 3 (state); field N lives at rest[N - 3]
        static constexpr size_t utime_idx = 14U - 3U;
        static constexpr size_t stime_idx = 15U - 3U;
        static constexpr size_t start_idx = 22U - 3U;
        static constexpr size_t vsize_idx = 23U - 3U;
        static constexpr size_t rss_idx = 24U - 3U;
        if (rest.size() <= rss_idx || rest[0].size() != 1U) {
            return std::nullopt;
        }
        out.state = rest[0][0];

        auto utime = utils::parse_arithmetic<uint64_t>(rest[utime_idx]);
        auto stime = utils::parse_arithmetic<uint64_t>(rest[stime_idx]);
        auto start = utils::parse_arithmetic<uint64_t>(rest[start_idx]);
        auto vsize = utils::parse_arithmetic<uint64_t>(rest[vsize_idx]);
        auto rss = utils::parse_arithmetic<int64_t>(rest[rss_idx]);
        if (!utime || !stime || !start || !vsize || !rss) {
            return std::nullopt;
        }
        out.utime_ticks = *utime;
        out.stime_ticks = *stime;
        out.start_ticks = *start;
        out.vsize_bytes = *vsize;
        out.rss_pages = *rss;
        return out;
    }

    inline io_fields parse_io(std::string_view text) {
        io_fields out{};
        size_t pos = 0U;
        while (pos < text.size()) {
            auto eol = text.find('\n', pos);
            auto line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
            pos = eol == std::string_view::npos ? text.size() : eol + 1U;

            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            auto key = line.substr(0U, colon);
            auto value = utils::parse_arithmetic<uint64_t>(utils::trim_view(line.substr(colon + 1U)));
            if (!value) {
                continue;
            }
            if (key == "read_bytes"sv) {
                out.read_bytes = *value;
            }
            else if (key == "write_bytes"sv) {
                out.write_bytes = *value;
            }
        }
        return out;
    }

    // First field of /proc/uptime, in seconds
    inline std::optional<double> parse_uptime(std::string_view text) {
        auto fields = utils::split_whitespace(utils::trim_view(text));
        if (fields.empty()) {
            return std::nullopt;
        }
        return utils::parse_arithmetic<double>(fields[0]);
    }

    // "btime" line of /proc/stat: boot time in unix seconds
    inline std::optional<uint64_t> parse_boot_time(std::string_view text) {
        static constexpr auto key = "btime "sv;
        auto pos = text.starts_with(key) ? 0U : text.find("\nbtime "sv);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        if (text[pos] == '\n') {
            ++pos;
        }
        auto eol = text.find('\n', pos);
        auto start = pos + key.size();
        auto line = text.substr(start, eol == std::string_view::npos ? std::string_view::npos : eol - start);
        return utils::parse_arithmetic<uint64_t>(utils::trim_view(line));
    }

    // /proc/<pid>/cmdline is NUL separated
    inline std::string parse_cmdline(std::string_view raw) {
        std::string out{raw};
        while (!out.empty() && out.back() == '\0') {
            out.pop_back();
        }
        for (auto& c : out) {
            if (c == '\0') {
                c = ' ';
            }
        }
        return out;
    }

    inline std::string_view status_name(char state) {
        switch (state) {
            case 'R':
                return "Run"sv;
            case 'S':
                return "Sleep"sv;
            case 'D':
                return "UninterruptibleDiskSleep"sv;
            case 'Z':
                return "Zombie"sv;
            case 'T':
                return "Stop"sv;
            case 't':
                return "Tracing"sv;
            case 'X':
            case 'x':
                return "Dead"sv;
            case 'K':
                return "Wakekill"sv;
            case 'W':
                return "Waking"sv;
            case 'P':
                return "Parked"sv;
            case 'I':
                return "Idle"sv;
            default:
                return "Unknown"sv;
        }
    }

    inline std::vector<int> list_pids(std::string_view root = "/proc"sv) {
        std::vector<int> pids{};
        std::error_code ec{};
        for (const auto& entry : std::filesystem::directory_iterator(std::filesystem::path{root}, ec)) {
            auto name = entry.path().filename().string();
            if (auto pid = utils::parse_arithmetic<int>(name)) {
                pids.push_back(*pid);
            }
        }
        return pids;
    }

}  // namespace tauri_mcp::internal::procfs

#pragma once

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <concepts>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace tauri_mcp {

    using namespace std::string_view_literals;

    enum class log_level : uint8_t { trace, debug, info, warn, error, off };

    inline constexpr std::string_view to_string(log_level level) {
        switch (level) {
            case log_level::trace:
                return "trace"sv;
            case log_level::debug:
                return "debug"sv;
            case log_level::info:
                return "info"sv;
            case log_level::warn:
                return "warn"sv;
            case log_level::error:
                return "error"sv;
            case log_level::off:
                return "off"sv;
        }
        return "info"sv;
    }

    namespace detail {
        inline std::atomic<log_level> log_threshold{log_level::info};

        inline std::mutex& log_mutex() {
            static std::mutex m{};
            return m;
        }

        constexpr std::string_view sloc_fname(const std::source_location& loc) {
            std::string_view sv{loc.file_name()};
            if (auto p = sv.rfind('/'); p != sv.npos)
                sv.remove_prefix(p + 1);
            return sv;
        }

        inline void prepend_header(std::ostream& os, log_level level, const std::source_location& loc) {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            ::localtime_r(&now, &tm);
            os << std::put_time(&tm, "%H:%M:%S") << ' ' << to_string(level) << " [" << sloc_fname(loc) << ':'
               << loc.line() << "] ";
        }

        template <typename... Args>
        void emit_log(log_level level, const std::source_location& loc, Args&&... args) {
            if (level < log_threshold.load(std::memory_order_relaxed)) {
                return;
            }
            std::lock_guard lock{log_mutex()};
            prepend_header(std::cerr, level, loc);
            (std::cerr << ... << std::forward<Args>(args)) << '\n';
        }
    }  // namespace detail

    inline void set_log_level(log_level level) {
        detail::log_threshold.store(level, std::memory_order_relaxed);
    }

    inline log_level current_log_level() {
        return detail::log_threshold.load(std::memory_order_relaxed);
    }

    // Leveled loggers; all output goes to stderr since stdout carries protocol traffic
    template <typename... Args>
    struct trace_log {
        explicit trace_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::trace, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct debug_log {
        explicit debug_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::debug, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct info_log {
        explicit info_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::info, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct warn_log {
        explicit warn_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::warn, loc, std::forward<Args>(args)...);
        }
    };

    template <typename... Args>
    struct error_log {
        explicit error_log(Args&&... args, const std::source_location& loc = std::source_location::current()) {
            detail::emit_log(log_level::error, loc, std::forward<Args>(args)...);
        }
    };

    // deduction guides
    template <typename... Args>
    trace_log(Args&&...) -> trace_log<Args...>;
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;
    template <typename... Args>
    info_log(Args&&...) -> info_log<Args...>;
    template <typename... Args>
    warn_log(Args&&...) -> warn_log<Args...>;
    template <typename... Args>
    error_log(Args&&...) -> error_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string to_lower(std::string_view input) {
            return input | std::views::transform(char_tolower) | std::ranges::to<std::string>();
        }

        inline bool icontains(std::string_view haystack, std::string_view needle) {
            if (needle.empty()) {
                return true;
            }
            return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
        }

        inline bool ends_with_icase(std::string_view value, std::string_view suffix) {
            return value.size() >= suffix.size() && str_case_eq(value.substr(value.size() - suffix.size()), suffix);
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        inline std::vector<std::string_view> split_whitespace(std::string_view input) {
            std::vector<std::string_view> out{};
            for (auto word : input | std::views::split(' ')) {
                std::string_view token{word.begin(), word.end()};
                token = trim_view(token);
                if (!token.empty()) {
                    out.push_back(token);
                }
            }
            return out;
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        // RFC 4122 version 4 identifier
        inline std::string make_uuid_v4() {
            thread_local std::mt19937_64 engine{std::random_device{}()};
            std::uniform_int_distribution<uint64_t> dist{};
            uint64_t hi = dist(engine);
            uint64_t lo = dist(engine);
            hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
            lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

            static constexpr auto hex = "0123456789abcdef"sv;
            std::string out{};
            out.reserve(36);
            auto put = [&](uint64_t value, int nibbles) {
                for (int i = nibbles - 1; i >= 0; --i) {
                    out.push_back(hex[(value >> (i * 4)) & 0xfU]);
                }
            };
            put(hi >> 32, 8);
            out.push_back('-');
            put((hi >> 16) & 0xffffU, 4);
            out.push_back('-');
            put(hi & 0xffffU, 4);
            out.push_back('-');
            put(lo >> 48, 4);
            out.push_back('-');
            put(lo & 0xffffffffffffULL, 12);
            return out;
        }

    }  // namespace utils

}  // namespace tauri_mcp

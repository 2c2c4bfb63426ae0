#pragma once

#include "tauri_mcp/error.hpp"
#include "tauri_mcp/utils.hpp"

#include <cstdint>
#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace tauri_mcp::internal::desktop {

    using namespace std::string_view_literals;

    struct geometry {
        int x{};
        int y{};
        uint32_t width{};
        uint32_t height{};
    };

    // `xdotool getwindowgeometry --shell` prints WINDOW=, X=, Y=, WIDTH=, HEIGHT=, SCREEN= lines
    inline std::optional<geometry> parse_window_geometry(std::string_view text) {
        std::optional<int> x{}, y{};
        std::optional<uint32_t> w{}, h{};
        size_t pos = 0U;
        while (pos < text.size()) {
            auto eol = text.find('\n', pos);
            auto line = utils::trim_view(
                    text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos));
            pos = eol == std::string_view::npos ? text.size() : eol + 1U;

            auto eq = line.find('=');
            if (eq == std::string_view::npos) {
                continue;
            }
            auto key = line.substr(0U, eq);
            auto value = line.substr(eq + 1U);
            if (key == "X"sv) {
                x = utils::parse_arithmetic<int>(value);
            }
            else if (key == "Y"sv) {
                y = utils::parse_arithmetic<int>(value);
            }
            else if (key == "WIDTH"sv) {
                w = utils::parse_arithmetic<uint32_t>(value);
            }
            else if (key == "HEIGHT"sv) {
                h = utils::parse_arithmetic<uint32_t>(value);
            }
        }
        if (!x || !y || !w || !h) {
            return std::nullopt;
        }
        return geometry{.x = *x, .y = *y, .width = *w, .height = *h};
    }

    // "cmd+..." and "ctrl+..." are chords; anything else is literal text to type
    inline bool is_key_chord(std::string_view keys) {
        return keys.starts_with("cmd+"sv) || keys.starts_with("ctrl+"sv);
    }

    inline std::string_view xdotool_modifier(std::string_view name) {
        if (name == "cmd"sv || name == "meta"sv) {
            return "super"sv;
        }
        if (name == "ctrl"sv || name == "control"sv) {
            return "ctrl"sv;
        }
        if (name == "alt"sv || name == "option"sv) {
            return "alt"sv;
        }
        if (name == "shift"sv) {
            return "shift"sv;
        }
        return {};
    }

    inline std::optional<std::string> xdotool_key(std::string_view name) {
        if (name.size() == 1U) {
            auto c = name[0];
            if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
                return std::string{name};
            }
            return std::nullopt;
        }

        struct named_key {
            std::string_view name;
            std::string_view keysym;
        };
        static constexpr named_key keys[] = {
                {"enter"sv, "Return"sv},
                {"return"sv, "Return"sv},
                {"tab"sv, "Tab"sv},
                {"space"sv, "space"sv},
                {"backspace"sv, "BackSpace"sv},
                {"escape"sv, "Escape"sv},
                {"esc"sv, "Escape"sv},
                {"delete"sv, "Delete"sv},
                {"del"sv, "Delete"sv},
                {"home"sv, "Home"sv},
                {"end"sv, "End"sv},
                {"pageup"sv, "Page_Up"sv},
                {"pagedown"sv, "Page_Down"sv},
                {"left"sv, "Left"sv},
                {"right"sv, "Right"sv},
                {"up"sv, "Up"sv},
                {"down"sv, "Down"sv},
        };
        for (const auto& k : keys) {
            if (k.name == name) {
                return std::string{k.keysym};
            }
        }

        if (name.size() >= 2U && name[0] == 'f') {
            if (auto n = utils::parse_arithmetic<int>(name.substr(1U)); n && *n >= 1 && *n <= 12) {
                return std::format("F{}", *n);
            }
        }
        return std::nullopt;
    }

    // "ctrl+shift+t" -> "ctrl+shift+t" in xdotool keysym syntax; throws argument_error
    inline std::string translate_key_chord(std::string_view chord) {
        std::vector<std::string> parts{};
        for (auto part : chord | std::views::split('+')) {
            parts.push_back(utils::to_lower(utils::trim_view(std::string_view{part.begin(), part.end()})));
        }
        if (parts.size() < 2U) {
            throw argument_error(std::format("Invalid key combination: {}", chord));
        }

        std::vector<std::string> out{};
        for (size_t i = 0; i + 1U < parts.size(); ++i) {
            auto mod = xdotool_modifier(parts[i]);
            if (mod.empty()) {
                throw argument_error(std::format("Unknown modifier key: {}", parts[i]));
            }
            out.emplace_back(mod);
        }
        auto key = xdotool_key(parts.back());
        if (!key) {
            throw argument_error(std::format("Unknown key: {}", parts.back()));
        }
        out.push_back(std::move(*key));
        return utils::join_with_separator(out, "+"sv);
    }

}  // namespace tauri_mcp::internal::desktop

#ifndef GLINT_CORE_UTF8_HPP
#define GLINT_CORE_UTF8_HPP

#include "config.hpp"
#include <array>
#include <cstdint>
#include <string_view>

namespace glint::core::utf8 {
    static constexpr std::array<std::uint8_t, 16> lookup {
        1, 1, 1, 1, 1, 1, 1, 1,
        1, 1, 1, 1, 2, 2, 3, 4
    };

    constexpr auto get_length(char c) noexcept -> std::uint8_t {
        auto const byte = static_cast<std::uint8_t>(c);
        return lookup[byte >> 4];
    }

    constexpr auto is_continuation(char c) noexcept -> bool {
        return (static_cast<std::uint8_t>(c) & 0xC0) == 0x80;
    }

    constexpr auto is_char_boundary(std::string_view str, std::size_t index) noexcept -> bool {
        if (index == 0 || index >= str.size()) return index <= str.size();
        return !is_continuation(str[index]);
    }

    struct DecodedChar {
        char32_t code_point{};
        std::uint8_t len{};
    };

    // NOTE: Assumes valid utf-8 string. A sequence cut short by the end of the
    //       string decodes the bytes that are present.
    constexpr auto decode(std::string_view str, std::size_t index) noexcept -> DecodedChar {
        auto const lead = static_cast<std::uint8_t>(str[index]);
        auto len = get_length(str[index]);
        if (index + len > str.size()) len = static_cast<std::uint8_t>(str.size() - index);
        GLINT_ASSUME(len <= 4);

        char32_t cp{};
        switch (len) {
            case 1: cp = lead; break;
            case 2: cp = lead & 0x1F; break;
            case 3: cp = lead & 0x0F; break;
            default: cp = lead & 0x07; break;
        }
        for (auto i = 1u; i < len; ++i) {
            cp = (cp << 6) | (static_cast<std::uint8_t>(str[index + i]) & 0x3F);
        }
        return { .code_point = cp, .len = len };
    }

    // Approximate East Asian width: 0 for control and combining characters,
    // 2 for wide CJK, Hangul, fullwidth forms and emoji, 1 otherwise.
    constexpr auto display_width(char32_t cp) noexcept -> unsigned {
        if (cp == 0) return 0;
        if (cp < 32 || (cp >= 0x7F && cp < 0xA0)) return 0;

        if ((cp >= 0x0300 && cp <= 0x036F) || (cp >= 0x1AB0 && cp <= 0x1AFF) ||
            (cp >= 0x1DC0 && cp <= 0x1DFF) || (cp >= 0x20D0 && cp <= 0x20FF) ||
            (cp >= 0xFE00 && cp <= 0xFE0F) || (cp >= 0xFE20 && cp <= 0xFE2F) ||
            cp == 0x200B || cp == 0x200C || cp == 0x200D) {
            return 0;
        }

        if ((cp >= 0x1100 && cp <= 0x115F) ||
            (cp >= 0x2329 && cp <= 0x232A) ||
            (cp >= 0x2E80 && cp <= 0x303E) ||
            (cp >= 0x3041 && cp <= 0xA4CF) ||
            (cp >= 0xAC00 && cp <= 0xD7A3) ||
            (cp >= 0xF900 && cp <= 0xFAFF) ||
            (cp >= 0xFE10 && cp <= 0xFE19) ||
            (cp >= 0xFE30 && cp <= 0xFE6F) ||
            (cp >= 0xFF00 && cp <= 0xFF60) ||
            (cp >= 0xFFE0 && cp <= 0xFFE6) ||
            (cp >= 0x1F300 && cp <= 0x1F64F) ||
            (cp >= 0x1F900 && cp <= 0x1F9FF) ||
            (cp >= 0x20000 && cp <= 0x3FFFD)) {
            return 2;
        }

        return 1;
    }

    constexpr auto display_width(std::string_view str) noexcept -> std::size_t {
        auto width = std::size_t{};
        for (auto i = 0zu; i < str.size();) {
            auto [cp, len] = decode(str, i);
            width += display_width(cp);
            i += len;
        }
        return width;
    }
} // namespace glint::core::utf8

#endif // GLINT_CORE_UTF8_HPP

#ifndef GLINT_CORE_STRING_UTILS_HPP
#define GLINT_CORE_STRING_UTILS_HPP

#include "utf8.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace glint::core::utils {

    static constexpr auto ltrim(std::string_view str, std::string_view chars = " \t\n\r\f\v") noexcept -> std::string_view {
        auto const it = str.find_first_not_of(chars);
        if (it == std::string_view::npos) return {};
        return str.substr(it);
    }

    static constexpr auto rtrim(std::string_view str, std::string_view chars = " \t\n\r\f\v") noexcept -> std::string_view {
        auto const it = str.find_last_not_of(chars);
        if (it == std::string_view::npos) return {};
        return str.substr(0, it + 1);
    }

    static constexpr auto trim(std::string_view str, std::string_view chars = " \t\n\r\f\v") noexcept -> std::string_view {
        return ltrim(rtrim(str, chars), chars);
    }

    /**
     * @brief Length of the line terminator at `index`; `\r\n` is a single terminator.
     * @return 0 if there is no terminator at `index`.
     */
    static constexpr auto line_terminator_length(std::string_view str, std::size_t index) noexcept -> std::size_t {
        if (index >= str.size()) return 0;
        if (str[index] == '\n') return 1;
        if (str[index] == '\r' && index + 1 < str.size() && str[index + 1] == '\n') return 2;
        return 0;
    }

    static constexpr auto strip_line_terminator(std::string_view line) noexcept -> std::string_view {
        if (line.ends_with("\r\n")) return line.substr(0, line.size() - 2);
        if (line.ends_with('\n')) return line.substr(0, line.size() - 1);
        return line;
    }

    static inline auto repeat(std::string_view s, std::size_t count) -> std::string {
        auto res = std::string();
        res.reserve(s.size() * count);
        for (auto i = 0zu; i < count; ++i) res += s;
        return res;
    }

    /**
     * @brief Replaces every tab with spaces up to the next tab stop.
     * @param start_column display column at which `str` begins.
     */
    static inline auto expand_tabs(std::string_view str, unsigned tab_width, std::size_t start_column = 0) -> std::string {
        auto res = std::string();
        res.reserve(str.size());
        auto column = start_column;
        for (auto i = 0zu; i < str.size();) {
            if (str[i] == '\t' && tab_width != 0) {
                auto const spaces = tab_width - (column % tab_width);
                res.append(spaces, ' ');
                column += spaces;
                ++i;
                continue;
            }

            auto [cp, len] = utf8::decode(str, i);
            res.append(str.substr(i, len));
            column += (cp == '\t') ? 1 : utf8::display_width(cp);
            i += len;
        }
        return res;
    }

    // Splits on '\n', dropping a '\r' that precedes it.
    static inline auto split_lines(std::string_view str) -> std::vector<std::string_view> {
        auto res = std::vector<std::string_view>{};
        auto start = 0zu;
        while (true) {
            auto pos = str.find('\n', start);
            if (pos == std::string_view::npos) {
                res.push_back(str.substr(start));
                break;
            }
            auto line = str.substr(start, pos - start);
            if (line.ends_with('\r')) line.remove_suffix(1);
            res.push_back(line);
            start = pos + 1;
        }
        return res;
    }

} // namespace glint::core::utils

#endif // GLINT_CORE_STRING_UTILS_HPP

#ifndef GLINT_LINE_HPP
#define GLINT_LINE_HPP

#include "core/config.hpp"
#include "core/string_utils.hpp"
#include "core/utf8.hpp"
#include "source.hpp"
#include "span.hpp"
#include <algorithm>
#include <format>
#include <span>
#include <string_view>
#include <vector>

namespace glint {

    struct Line {
        dsize_t line_number{};  // 1-based, global to the source
        dsize_t offset{};       // byte offset of the line start in the source
        dsize_t length{};       // bytes, terminator included
        std::string_view text{}; // terminator included
        bool at_end_of_file{false};

        constexpr auto end() const noexcept -> dsize_t { return offset + length; }

        constexpr auto content() const noexcept -> std::string_view {
            return core::utils::strip_line_terminator(text);
        }

        constexpr auto operator==(Line const&) const noexcept -> bool = default;
    };

    /**
     * @brief Splits the extracted window into lines.
     *
     * Numbering continues from `contents.line`, so lines of different windows
     * over the same source agree. Only the last line of a window that reaches
     * the end of the source and does not end in a terminator is flagged
     * `at_end_of_file`.
     */
    static inline auto scan_lines(SpanContents const& contents) -> std::vector<Line> {
        auto res = std::vector<Line>{};
        auto const data = contents.data;
        if (data.empty()) return res;

        auto line_start = 0zu;
        auto number = contents.line + 1;
        auto i = 0zu;

        auto close_line = [&](dsize_t end) {
            res.push_back(Line {
                .line_number = number++,
                .offset = contents.span.offset() + line_start,
                .length = end - line_start,
                .text = data.substr(line_start, end - line_start)
            });
            line_start = end;
        };

        while (i < data.size()) {
            if (data[i] == '\n') {
                close_line(++i);
                continue;
            }

            if (data[i] == '\r' && i + 1 < data.size() && data[i + 1] == '\n') {
                i += 2;
                close_line(i);
                continue;
            }

            i += core::utf8::decode(data, i).len;
        }

        if (line_start < data.size()) {
            close_line(data.size());
            res.back().at_end_of_file = contents.reaches_end;
        }

        return res;
    }

    /**
     * @brief Lines of a window that shows `labels`.
     *
     * A point label at the very end of a source that is empty or ends in a
     * terminator lies past every line. When the window reaches that end, an
     * empty last line flagged `at_end_of_file` is added to carry the point.
     */
    static inline auto scan_lines(SpanContents const& contents, std::span<LabeledSpan const> labels) -> std::vector<Line> {
        auto res = scan_lines(contents);
        if (!contents.reaches_end) return res;
        if (!res.empty() && res.back().at_end_of_file) return res;

        auto const eof = contents.span.end();
        auto const has_eof_point = std::ranges::any_of(labels, [eof](LabeledSpan const& l) {
            return l.span.empty() && l.offset() == eof;
        });
        if (!has_eof_point) return res;

        res.push_back(Line {
            .line_number = res.empty() ? contents.line + 1 : res.back().line_number + 1,
            .offset = eof,
            .text = contents.data.substr(contents.data.size()),
            .at_end_of_file = true
        });
        return res;
    }

} // namespace glint

template <>
struct std::formatter<glint::Line> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(glint::Line const& l, auto& ctx) const {
        return std::format_to(
            ctx.out(), "Line(number={}, offset={}, length={}, eof={})",
            l.line_number, l.offset, l.length, l.at_end_of_file
        );
    }
};

#endif // GLINT_LINE_HPP

#ifndef GLINT_SOURCE_HPP
#define GLINT_SOURCE_HPP

#include "core/config.hpp"
#include "core/string_utils.hpp"
#include "error.hpp"
#include "span.hpp"
#include <deque>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace glint {

    /**
     * @brief Context extracted around a span.
     *
     * `line` and `column` (both 0-based, column in bytes) locate the first
     * extracted byte. With no context lines before the span this is the span
     * start itself; otherwise the window begins on a line boundary and the
     * column is 0.
     */
    struct SpanContents {
        std::string_view data{};
        SourceSpan span{};
        dsize_t line{};
        dsize_t column{};
        dsize_t line_count{1};
        bool reaches_end{false};

        constexpr auto operator==(SpanContents const&) const noexcept -> bool = default;
    };

    namespace detail {
        // Line index and line start of `offset`. A `\r\n` pair is only a
        // boundary when it lies completely before `offset`.
        struct LineStart {
            dsize_t line{};
            dsize_t start{};
        };

        static inline auto count_lines(std::string_view window) noexcept -> dsize_t {
            auto count = dsize_t{1};
            for (auto i = 0zu; i < window.size();) {
                auto const term = core::utils::line_terminator_length(window, i);
                if (term == 0) {
                    ++i;
                    continue;
                }
                i += term;
                if (i < window.size()) ++count;
            }
            return count;
        }

        // Advances past the rest of the line containing `pos`, terminator included.
        static inline auto skip_line(std::string_view text, dsize_t pos) noexcept -> dsize_t {
            while (pos < text.size()) {
                auto const term = core::utils::line_terminator_length(text, pos);
                if (term != 0) return pos + term;
                ++pos;
            }
            return pos;
        }
    } // namespace detail

    /**
     * @brief Resolves `span` over `text` and extracts it together with up to
     *        `context_before` lines before and `context_after` lines after it.
     *
     * With `context_after == 0` the window ends exactly at the span end,
     * otherwise it runs to the end of the span's last line and then over the
     * requested number of following lines.
     *
     * @return SpanError::OutOfBounds if the span overflows or ends past the
     *         end of `text`. A point at `text.size()` is in bounds.
     */
    static inline auto resolve_span(
        std::string_view text,
        SourceSpan span,
        dsize_t context_before,
        dsize_t context_after
    ) -> std::expected<SpanContents, SpanError> {
        if (span.overflows() || span.end() > text.size()) {
            return std::unexpected(SpanError::OutOfBounds);
        }

        auto const offset = span.offset();
        auto current = detail::LineStart{};
        auto preceding = std::deque<dsize_t>{};

        for (auto i = 0zu; i < offset;) {
            auto const term = core::utils::line_terminator_length(text, i);
            if (term == 0 || i + term > offset) {
                ++i;
                continue;
            }

            if (context_before != 0) {
                preceding.push_back(current.start);
                if (preceding.size() > context_before) preceding.pop_front();
            }
            i += term;
            current = { .line = current.line + 1, .start = i };
        }

        auto res = SpanContents{};
        auto start = offset;
        if (context_before == 0) {
            res.line = current.line;
            res.column = offset - current.start;
        } else {
            start = preceding.empty() ? current.start : preceding.front();
            res.line = current.line - preceding.size();
            res.column = 0;
        }

        auto end = span.end();
        if (context_after != 0) {
            auto const last = span.empty() ? offset : end - 1;
            end = detail::skip_line(text, last);
            for (auto n = 0zu; n < context_after && end < text.size(); ++n) {
                end = detail::skip_line(text, end);
            }
        }

        res.data = text.substr(start, end - start);
        res.span = SourceSpan::from_range(start, end);
        res.line_count = detail::count_lines(res.data);
        res.reaches_end = end == text.size();
        return res;
    }

    /**
     * @brief Widens `contents` so it begins at the start of its first line and
     *        ends after the terminator of its last line.
     */
    static inline auto expand_to_lines(std::string_view text, SpanContents contents) noexcept -> SpanContents {
        auto start = contents.span.offset() - contents.column;
        auto end = contents.span.end();
        auto const on_boundary = end != start && text[end - 1] == '\n';
        if (!on_boundary && end < text.size()) {
            end = detail::skip_line(text, end);
        }

        contents.data = text.substr(start, end - start);
        contents.span = SourceSpan::from_range(start, end);
        contents.column = 0;
        contents.line_count = detail::count_lines(contents.data);
        contents.reaches_end = end == text.size();
        return contents;
    }

    /**
     * @brief Source text with an optional display name. An empty name marks
     *        an anonymous source.
     */
    struct Source {
        std::string name{};
        std::string text{};

        auto read_span(
            SourceSpan span,
            dsize_t context_before,
            dsize_t context_after
        ) const -> std::expected<SpanContents, SpanError> {
            return resolve_span(text, span, context_before, context_after);
        }

        constexpr auto is_anonymous() const noexcept -> bool { return name.empty(); }

        auto operator==(Source const&) const -> bool = default;
    };

} // namespace glint

template <>
struct std::formatter<glint::SpanContents> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(glint::SpanContents const& c, auto& ctx) const {
        return std::format_to(
            ctx.out(), "SpanContents(line={}, column={}, line_count={}, {})",
            c.line, c.column, c.line_count, c.span
        );
    }
};

#endif // GLINT_SOURCE_HPP

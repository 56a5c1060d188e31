#ifndef GLINT_LAYOUT_HPP
#define GLINT_LAYOUT_HPP

#include "core/config.hpp"
#include "line.hpp"
#include "span.hpp"
#include <algorithm>
#include <cstdint>
#include <format>
#include <span>
#include <string_view>
#include <utility>

namespace glint {

    enum class SpanRelation: std::uint8_t {
        None,
        Contained,  // starts and ends on the line; a zero-length span is a point
        Starts,     // first line of a multi-line span
        Ends,       // last line of a multi-line span
        Flyby       // line lies strictly inside a multi-line span
    };

    constexpr auto to_string(SpanRelation r) noexcept -> std::string_view {
        switch (r) {
            case SpanRelation::None: return "None";
            case SpanRelation::Contained: return "Contained";
            case SpanRelation::Starts: return "Starts";
            case SpanRelation::Ends: return "Ends";
            case SpanRelation::Flyby: return "Flyby";
        }
        std::unreachable();
    }

    // Multi-line relations occupy a gutter column.
    constexpr auto uses_gutter(SpanRelation r) noexcept -> bool {
        return r == SpanRelation::Starts || r == SpanRelation::Ends || r == SpanRelation::Flyby;
    }

    constexpr auto classify(Line const& line, SourceSpan span) noexcept -> SpanRelation {
        auto const start = span.offset();
        auto const end = span.end();
        auto const line_start = line.offset;
        auto const line_end = line.end();

        auto const starts_here = (start >= line_start && start < line_end)
            || (start == line_end && line.at_end_of_file);

        if (starts_here) {
            return end <= line_end ? SpanRelation::Contained : SpanRelation::Starts;
        }

        if (start < line_start) {
            if (end > line_end) return SpanRelation::Flyby;
            if (end > line_start) return SpanRelation::Ends;
        }

        return SpanRelation::None;
    }

    constexpr auto classify(Line const& line, LabeledSpan const& span) noexcept -> SpanRelation {
        return classify(line, span.span);
    }

    constexpr auto gutter_depth(Line const& line, std::span<LabeledSpan const> spans) noexcept -> dsize_t {
        return static_cast<dsize_t>(std::ranges::count_if(spans, [&line](LabeledSpan const& s) {
            return uses_gutter(classify(line, s));
        }));
    }

    /**
     * @brief Width of the connector gutter shared by every line of a window:
     *        the largest number of multi-line spans touching a single line.
     */
    constexpr auto max_gutter(std::span<Line const> lines, std::span<LabeledSpan const> spans) noexcept -> dsize_t {
        auto res = dsize_t{};
        for (auto const& line: lines) res = std::max(res, gutter_depth(line, spans));
        return res;
    }

} // namespace glint

template <>
struct std::formatter<glint::SpanRelation> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(glint::SpanRelation const& r, auto& ctx) const {
        return std::format_to(ctx.out(), "{}", glint::to_string(r));
    }
};

#endif // GLINT_LAYOUT_HPP

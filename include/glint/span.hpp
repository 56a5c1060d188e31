#ifndef GLINT_SPAN_HPP
#define GLINT_SPAN_HPP

#include "core/config.hpp"
#include <algorithm>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace glint {

    /**
     * @brief Half-open byte range `[offset, offset + length)` over a source.
     *        A zero length denotes a point.
     */
    struct SourceSpan {
        using size_type = dsize_t;
        constexpr SourceSpan() noexcept = default;
        constexpr SourceSpan(SourceSpan const&) noexcept = default;
        constexpr SourceSpan(SourceSpan &&) noexcept = default;
        constexpr SourceSpan& operator=(SourceSpan const&) noexcept = default;
        constexpr SourceSpan& operator=(SourceSpan &&) noexcept = default;
        constexpr ~SourceSpan() noexcept = default;

        constexpr SourceSpan(size_type offset, size_type length) noexcept
            : m_offset(offset)
            , m_length(length)
        {}

        static constexpr auto from_range(size_type start, size_type end) noexcept -> SourceSpan {
            return SourceSpan(start, std::max(start, end) - start);
        }

        static constexpr auto point(size_type offset) noexcept -> SourceSpan {
            return SourceSpan(offset, 0);
        }

        constexpr auto offset() const noexcept -> size_type { return m_offset; }
        constexpr auto length() const noexcept -> size_type { return m_length; }
        constexpr auto empty() const noexcept -> bool { return m_length == 0; }

        // Saturates instead of wrapping; see `overflows`.
        constexpr auto end() const noexcept -> size_type {
            if (overflows()) return std::numeric_limits<size_type>::max();
            return m_offset + m_length;
        }

        constexpr auto overflows() const noexcept -> bool {
            return m_length > std::numeric_limits<size_type>::max() - m_offset;
        }

        constexpr auto force_merge(SourceSpan other) const noexcept -> SourceSpan {
            // [-----------)
            //                [---------)
            //       |
            //       V
            // [------------------------)
            return from_range(
                std::min(offset(), other.offset()),
                std::max(end(), other.end())
            );
        }

        constexpr auto operator==(SourceSpan const& other) const noexcept -> bool = default;
    private:
        size_type m_offset{};
        size_type m_length{};
    };

    struct LabeledSpan {
        SourceSpan span{};
        std::optional<std::string> label{};
        bool primary{false};

        static auto labeled(SourceSpan span, std::string label) -> LabeledSpan {
            return { .span = span, .label = std::move(label) };
        }

        static auto underline(SourceSpan span) -> LabeledSpan {
            return { .span = span };
        }

        static auto primary_labeled(SourceSpan span, std::string label) -> LabeledSpan {
            return { .span = span, .label = std::move(label), .primary = true };
        }

        constexpr auto offset() const noexcept -> dsize_t { return span.offset(); }
        constexpr auto length() const noexcept -> dsize_t { return span.length(); }
        constexpr auto has_label() const noexcept -> bool { return label.has_value(); }

        auto label_or_none() const -> std::string_view {
            return label ? std::string_view(*label) : std::string_view("<none>");
        }

        auto operator==(LabeledSpan const& other) const -> bool = default;
    };

} // namespace glint

template <>
struct std::formatter<glint::SourceSpan> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(glint::SourceSpan const& s, auto& ctx) const {
        return std::format_to(ctx.out(), "SourceSpan(offset={}, length={})", s.offset(), s.length());
    }
};

#endif // GLINT_SPAN_HPP

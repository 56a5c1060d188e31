#ifndef GLINT_COLUMN_HPP
#define GLINT_COLUMN_HPP

#include "core/config.hpp"
#include "core/utf8.hpp"
#include <string_view>

namespace glint {

    /**
     * @brief Display columns of byte offsets within a line.
     *
     * Starts are 1-based inclusive, ends 1-based exclusive, so for a span
     * covering `n` columns `end - start + 1 == n`. Tabs advance to the next
     * multiple of `tab_width`; a zero tab width counts a tab as one column.
     */
    struct ColumnMeasure {
        unsigned tab_width{4};

        /**
         * @brief Width of everything in `text` before `byte_offset`.
         *
         * An offset inside a multi-byte character counts that character. An
         * offset past the end of `text` (the line terminator) adds one column.
         */
        constexpr auto width_before(std::string_view text, dsize_t byte_offset) const noexcept -> dsize_t {
            auto column = dsize_t{};
            auto i = 0zu;
            while (i < text.size() && i < byte_offset) {
                auto const [cp, len] = core::utf8::decode(text, i);
                if (cp == '\t') {
                    column += tab_width == 0 ? 1 : tab_width - (column % tab_width);
                } else {
                    column += core::utf8::display_width(cp);
                }
                i += len;
            }
            if (byte_offset > text.size()) ++column;
            return column;
        }

        constexpr auto column(std::string_view text, dsize_t byte_offset, bool is_start) const noexcept -> dsize_t {
            auto const width = width_before(text, byte_offset);
            return is_start ? width + 1 : width;
        }

        constexpr auto start_column(std::string_view text, dsize_t byte_offset) const noexcept -> dsize_t {
            return column(text, byte_offset, true);
        }

        constexpr auto end_column(std::string_view text, dsize_t byte_offset) const noexcept -> dsize_t {
            return column(text, byte_offset, false);
        }
    };

} // namespace glint

#endif // GLINT_COLUMN_HPP

#ifndef GLINT_CORE_TERM_GLYPHS_HPP
#define GLINT_CORE_TERM_GLYPHS_HPP

#include <string_view>

namespace glint::core::term {

    struct GlyphSet {
        std::string_view hbar;
        std::string_view vbar;
        std::string_view vbar_break;  // gutter separator on rows without a line number
        std::string_view uarrow;      // point marker
        std::string_view rarrow;
        std::string_view ltop;
        std::string_view lbot;
        std::string_view lcross;
        std::string_view underbar;    // tee in an underline where a label hangs
        std::string_view underline;
        std::string_view error;
        std::string_view warning;
        std::string_view advice;

        constexpr auto operator==(GlyphSet const&) const noexcept -> bool = default;
    };

    namespace glyphs {
        static constexpr auto unicode = GlyphSet {
            .hbar = "─",
            .vbar = "│",
            .vbar_break = "·",
            .uarrow = "▲",
            .rarrow = "▶",
            .ltop = "╭",
            .lbot = "╰",
            .lcross = "├",
            .underbar = "┬",
            .underline = "─",
            .error = "×",
            .warning = "⚠",
            .advice = "☞"
        };

        static constexpr auto ascii = GlyphSet {
            .hbar = "-",
            .vbar = "|",
            .vbar_break = ":",
            .uarrow = "^",
            .rarrow = ">",
            .ltop = ",",
            .lbot = "`",
            .lcross = "|",
            .underbar = "|",
            .underline = "^",
            .error = "x",
            .warning = "!",
            .advice = ">"
        };
    } // namespace glyphs
} // namespace glint::core::term

#endif // GLINT_CORE_TERM_GLYPHS_HPP

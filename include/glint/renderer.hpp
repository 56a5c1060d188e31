#ifndef GLINT_RENDERER_HPP
#define GLINT_RENDERER_HPP

#include "column.hpp"
#include "core/config.hpp"
#include "core/string_utils.hpp"
#include "core/term/config.hpp"
#include "core/term/glyphs.hpp"
#include "core/term/terminal.hpp"
#include "layout.hpp"
#include "line.hpp"
#include "merger.hpp"
#include "source.hpp"
#include "span.hpp"
#include <algorithm>
#include <cstdio>
#include <format>
#include <glog/logging.h>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace glint {

    using core::term::GlyphSet;

    struct RenderConfig {
        GlyphSet glyphs{ core::term::glyphs::unicode };
        dsize_t context_lines_before{1};
        dsize_t context_lines_after{1};
        dsize_t terminal_width{80};
        unsigned tab_width{4};
        bool linkify_code{false};
        std::optional<std::string> footer{};
        dsize_t max_related_depth{16};

        // Glyphs follow the locale, width follows the terminal `handle` is attached to.
        static auto from_terminal(FILE* handle) -> RenderConfig {
            auto res = RenderConfig{};
            res.glyphs = core::term::supports_utf8() ? core::term::glyphs::unicode : core::term::glyphs::ascii;
            if (auto cols = core::term::get_columns(handle); cols != 0) res.terminal_width = cols;
            return res;
        }
    };

    static inline auto out_of_bounds_notice(LabeledSpan const& label, SpanError error) -> std::string {
        return std::format(
            "Failed to read contents for label '{}' (offset: {}, length: {}): {}",
            label.label_or_none(), label.offset(), label.length(), error
        );
    }

    /**
     * @brief Draws snippet blocks for a set of labels over one source.
     *
     * Every merged window becomes one block:
     *
     *    ╭─[file.txt:2:3]
     *  1 │ source
     *  2 │   text
     *    ·   ──┬─
     *    ·     ╰── label
     *  3 │     here
     *    ╰────
     *
     * Labels that cannot be read produce an inline notice after the blocks.
     */
    struct SnippetRenderer {
        RenderConfig const& config;

        template <typename T>
        auto render(Terminal<T>& term, Source const& source, std::span<LabeledSpan const> labels) const -> void {
            auto merged = merge_windows(
                source.text, labels,
                config.context_lines_before, config.context_lines_after
            );

            for (auto const& window: merged.windows) {
                term.write(render_window(source, window));
            }

            for (auto const& failure: merged.failures) {
                term.write("  {}\n", out_of_bounds_notice(failure.label, failure.error));
            }
        }

        auto render_to_string(Source const& source, std::span<LabeledSpan const> labels) const -> std::string {
            auto res = std::string();
            {
                auto term = Terminal(Writer<std::string>(res));
                render(term, source, labels);
            }
            return res;
        }

        auto render_window(Source const& source, Window const& window) const -> std::string {
            auto const contents = expand_to_lines(source.text, window.contents);
            auto const lines = scan_lines(contents, window.labels);
            if (lines.empty()) {
                VLOG(1) << "glint: window at offset " << window.span.offset() << " has no lines to draw";
                return {};
            }

            auto const& glyphs = config.glyphs;
            auto const& labels = window.labels;
            auto const gutter = max_gutter(lines, labels);
            auto const linum_width = std::formatted_size("{}", lines.back().line_number);

            auto out = std::string();
            auto const pad = std::string(linum_width + 2, ' ');

            out += pad;
            out += glyphs.ltop;
            out += glyphs.hbar;
            out += '[';
            if (!source.is_anonymous()) {
                out += source.name;
                out += ':';
            }
            auto const [line, column] = anchor_position(source, window);
            std::format_to(std::back_inserter(out), "{}:{}]\n", line + 1, column + 1);

            auto ended = std::vector<bool>(labels.size(), false);

            for (auto const& l: lines) {
                auto const text = l.content();
                auto const on_gutter = gutter_spans(l, labels);

                std::format_to(std::back_inserter(out), " {:>{}} {} ", l.line_number, linum_width, glyphs.vbar);
                write_line_gutter(out, gutter, l, labels, on_gutter);
                out += core::utils::expand_tabs(text, config.tab_width);
                out += '\n';

                write_single_line_spans(out, linum_width, gutter, l, labels, on_gutter, ended);
                write_multi_line_ends(out, linum_width, gutter, l, labels, on_gutter, ended);
            }

            out += pad;
            out += glyphs.lbot;
            out += core::utils::repeat(glyphs.hbar, 4);
            out += '\n';
            return out;
        }

    private:
        struct Position {
            dsize_t line{};
            dsize_t column{};
        };

        auto anchor_position(Source const& source, Window const& window) const -> Position {
            auto anchor = resolve_span(source.text, window.anchor_label().span, 0, 0);
            if (!anchor) return { window.contents.line, window.contents.column };
            return { anchor->line, anchor->column };
        }

        static auto gutter_spans(Line const& line, std::span<LabeledSpan const> labels) -> std::vector<dsize_t> {
            auto res = std::vector<dsize_t>{};
            for (auto i = 0zu; i < labels.size(); ++i) {
                if (uses_gutter(classify(line, labels[i]))) res.push_back(i);
            }
            return res;
        }

        auto write_no_linum(std::string& out, dsize_t linum_width) const -> void {
            out += ' ';
            out.append(linum_width, ' ');
            out += ' ';
            out += config.glyphs.vbar_break;
            out += ' ';
        }

        // Connector cells on a numbered line; the first span starting or
        // ending here draws the arrow.
        auto write_line_gutter(
            std::string& out,
            dsize_t max_gutter,
            Line const& line,
            std::span<LabeledSpan const> labels,
            std::span<dsize_t const> on_gutter
        ) const -> void {
            if (max_gutter == 0) return;
            auto const& glyphs = config.glyphs;

            auto cells = dsize_t{};
            auto arrow = false;
            for (auto i = 0zu; i < on_gutter.size(); ++i) {
                auto const& label = labels[on_gutter[i]];
                auto const relation = classify(line, label);

                if (relation == SpanRelation::Flyby) {
                    out += glyphs.vbar;
                    ++cells;
                    continue;
                }

                if (relation == SpanRelation::Starts) {
                    out += glyphs.ltop;
                } else {
                    out += label.has_label() ? glyphs.lcross : glyphs.lbot;
                }
                out += core::utils::repeat(glyphs.hbar, max_gutter - i);
                out += glyphs.rarrow;
                cells += max_gutter - i + 2;
                arrow = true;
                break;
            }

            auto const fill = (arrow ? 1zu : 3zu) + (max_gutter > cells ? max_gutter - cells : 0);
            out.append(fill, ' ');
        }

        // Connector cells on an unnumbered row. `target` draws the elbow that
        // leads to its end label.
        auto write_highlight_gutter(
            std::string& out,
            dsize_t max_gutter,
            Line const& line,
            std::span<LabeledSpan const> labels,
            std::span<dsize_t const> on_gutter,
            std::vector<bool> const& ended,
            std::optional<dsize_t> target = std::nullopt
        ) const -> void {
            if (max_gutter == 0) return;
            auto const& glyphs = config.glyphs;

            auto cells = dsize_t{};
            for (auto i = 0zu; i < on_gutter.size(); ++i) {
                auto const index = on_gutter[i];
                auto const& label = labels[index];

                if (target && *target == index) {
                    out += glyphs.lbot;
                    out += core::utils::repeat(glyphs.hbar, max_gutter - i + 2);
                    cells += max_gutter - i + 3;
                    break;
                }

                auto const finished = classify(line, label) == SpanRelation::Ends
                    && (!label.has_label() || ended[index]);
                if (finished) {
                    out += ' ';
                } else {
                    out += glyphs.vbar;
                }
                ++cells;
            }

            if (cells < max_gutter + 1) out.append(max_gutter + 1 - cells, ' ');
        }

        auto write_single_line_spans(
            std::string& out,
            dsize_t linum_width,
            dsize_t max_gutter,
            Line const& line,
            std::span<LabeledSpan const> labels,
            std::span<dsize_t const> on_gutter,
            std::vector<bool> const& ended
        ) const -> void {
            auto const& glyphs = config.glyphs;
            auto const measure = ColumnMeasure{ .tab_width = config.tab_width };
            auto const text = line.content();

            struct Marker {
                dsize_t index;
                dsize_t vbar_offset;
            };

            auto contained = std::vector<dsize_t>{};
            for (auto i = 0zu; i < labels.size(); ++i) {
                if (classify(line, labels[i]) == SpanRelation::Contained) contained.push_back(i);
            }
            if (contained.empty()) return;

            // One glyph per display column. Runs never overwrite a column an
            // earlier run claimed; markers are placed afterwards so a nested
            // span keeps its tee or point even inside an enclosing run.
            auto cells = std::vector<std::string_view>{};
            auto markers = std::vector<Marker>{};
            auto highest = dsize_t{};

            for (auto index: contained) {
                auto const& label = labels[index];
                auto const local = measure.start_column(text, label.offset() - line.offset) - 1;
                auto const end_column = measure.end_column(text, label.span.end() - line.offset);
                auto const hl_len = std::max<dsize_t>(1, end_column > local ? end_column - local : 0);
                auto const vbar_offset = local + hl_len / 2;
                auto const end = local + hl_len;

                if (cells.size() < end) cells.resize(end, " ");
                for (auto c = std::max(local, highest); c < end; ++c) {
                    cells[c] = glyphs.underline;
                }
                highest = std::max(highest, end);

                if (label.span.empty() || label.has_label()) markers.push_back({ index, vbar_offset });
            }

            for (auto const& marker: markers) {
                cells[marker.vbar_offset] = labels[marker.index].span.empty() ? glyphs.uarrow : glyphs.underbar;
            }

            write_no_linum(out, linum_width);
            write_highlight_gutter(out, max_gutter, line, labels, on_gutter, ended);
            for (auto cell: cells) out += cell;
            out += '\n';

            std::erase_if(markers, [&labels](Marker const& m) { return !labels[m.index].has_label(); });
            std::ranges::stable_sort(markers, {}, &Marker::vbar_offset);

            // Rightmost label first; every row keeps a bar for the labels to its left.
            for (auto it = markers.rbegin(); it != markers.rend(); ++it) {
                auto const label_lines = core::utils::split_lines(*labels[it->index].label);
                for (auto n = 0zu; n < label_lines.size(); ++n) {
                    write_no_linum(out, linum_width);
                    write_highlight_gutter(out, max_gutter, line, labels, on_gutter, ended);

                    auto column = dsize_t{};
                    for (auto const& marker: markers) {
                        if (marker.vbar_offset >= it->vbar_offset) break;
                        if (column > marker.vbar_offset) continue;
                        out.append(marker.vbar_offset - column, ' ');
                        out += glyphs.vbar;
                        column = marker.vbar_offset + 1;
                    }

                    out.append(it->vbar_offset - column, ' ');
                    if (n == 0) {
                        out += glyphs.lbot;
                        out += core::utils::repeat(glyphs.hbar, 2);
                        out += ' ';
                    } else {
                        out += glyphs.vbar;
                        out += "   ";
                    }
                    out += label_lines[n];
                    out += '\n';
                }
            }
        }

        // Rows closing labeled multi-line spans that end on `line`.
        auto write_multi_line_ends(
            std::string& out,
            dsize_t linum_width,
            dsize_t max_gutter,
            Line const& line,
            std::span<LabeledSpan const> labels,
            std::span<dsize_t const> on_gutter,
            std::vector<bool>& ended
        ) const -> void {
            auto const& glyphs = config.glyphs;
            for (auto index: on_gutter) {
                auto const& label = labels[index];
                if (!label.has_label() || classify(line, label) != SpanRelation::Ends) continue;

                auto const label_lines = core::utils::split_lines(*label.label);
                write_no_linum(out, linum_width);
                write_highlight_gutter(out, max_gutter, line, labels, on_gutter, ended, index);
                out += glyphs.hbar;
                out += ' ';
                out += label_lines.front();
                out += '\n';
                ended[index] = true;

                for (auto n = 1zu; n < label_lines.size(); ++n) {
                    write_no_linum(out, linum_width);
                    write_highlight_gutter(out, max_gutter, line, labels, on_gutter, ended);
                    out += "    ";
                    out += label_lines[n];
                    out += '\n';
                }
            }
        }
    };

    template <typename T>
    static inline auto render_snippets(
        Terminal<T>& term,
        Source const& source,
        std::span<LabeledSpan const> labels,
        RenderConfig const& config = {}
    ) -> void {
        SnippetRenderer{ config }.render(term, source, labels);
    }

} // namespace glint

#endif // GLINT_RENDERER_HPP

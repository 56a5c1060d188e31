#ifndef GLINT_PRINTER_HPP
#define GLINT_PRINTER_HPP

#include "core/string_utils.hpp"
#include "core/term/terminal.hpp"
#include "core/wrap.hpp"
#include "diagnostic.hpp"
#include "renderer.hpp"
#include "source.hpp"
#include <format>
#include <glog/logging.h>
#include <string>
#include <string_view>

namespace glint {

    /**
     * @brief Assembles a full report around the snippet blocks:
     *
     *   oops::my::bad (https://example.com)
     *
     *     × oops!
     *     ├─▶ first cause
     *     ╰─▶ root cause
     *      ╭─[file.txt:2:3]
     *      ...
     *      ╰────
     *     help: try doing it better next time?
     *
     * Related diagnostics follow, each introduced by its severity, and inherit
     * the parent's source when they carry none.
     */
    struct GraphicalReportHandler {
        RenderConfig config{};

        template <typename T>
        auto render_report(Terminal<T>& term, Diagnostic const& diagnostic) const -> void {
            render_report_impl(term, diagnostic, nullptr, 0);
        }

        auto render_to_string(Diagnostic const& diagnostic) const -> std::string {
            auto res = std::string();
            {
                auto term = Terminal(Writer<std::string>(res));
                render_report(term, diagnostic);
            }
            return res;
        }

    private:
        template <typename T>
        auto render_report_impl(
            Terminal<T>& term,
            Diagnostic const& diagnostic,
            Source const* inherited,
            dsize_t depth
        ) const -> void {
            render_header(term, diagnostic);
            render_causes(term, diagnostic);

            auto const* source = diagnostic.source ? &*diagnostic.source : inherited;
            if (source != nullptr && !diagnostic.labels.empty()) {
                SnippetRenderer{ config }.render(term, *source, diagnostic.labels);
            }

            render_footer(term, diagnostic);

            if (diagnostic.related.empty()) return;
            if (depth + 1 > config.max_related_depth) {
                VLOG(1) << "glint: related diagnostics below depth " << depth << " are not rendered";
                return;
            }

            for (auto const& related: diagnostic.related) {
                term.write("\n{}: ", related.severity);
                if (!related.code && !related.url) term.newline();
                render_report_impl(term, related, source, depth + 1);
            }
        }

        template <typename T>
        auto render_header(Terminal<T>& term, Diagnostic const& diagnostic) const -> void {
            if (!diagnostic.code && !diagnostic.url) return;
            auto const code = diagnostic.code ? std::string_view(*diagnostic.code) : std::string_view();

            if (config.linkify_code && diagnostic.url) {
                auto text = code.empty() ? std::string("(link)") : std::format("{} (link)", code);
                term.write("\x1b]8;;{}\x1b\\{}\x1b]8;;\x1b\\\n\n", *diagnostic.url, text);
                return;
            }

            if (diagnostic.url) {
                if (code.empty()) term.write("({})\n\n", *diagnostic.url);
                else term.write("{} ({})\n\n", code, *diagnostic.url);
                return;
            }

            term.write("{}\n\n", code);
        }

        template <typename T>
        auto render_causes(Terminal<T>& term, Diagnostic const& diagnostic) const -> void {
            auto const& glyphs = config.glyphs;
            auto const width = config.terminal_width > 2 ? config.terminal_width - 2 : 1;

            auto const initial = std::format("  {} ", severity_icon(diagnostic.severity, glyphs));
            auto const rest = std::format("  {} ", glyphs.vbar);
            term.write("{}\n", core::fill_text(diagnostic.message, {
                .width = width,
                .initial_indent = initial,
                .subsequent_indent = rest
            }));

            for (auto i = 0zu; i < diagnostic.causes.size(); ++i) {
                auto const last = i + 1 == diagnostic.causes.size();
                auto const cause_initial = std::format(
                    "  {}{}{} ", last ? glyphs.lbot : glyphs.lcross, glyphs.hbar, glyphs.rarrow
                );
                auto const cause_rest = last ? std::string("      ") : std::format("  {}   ", glyphs.vbar);
                term.write("{}\n", core::fill_text(diagnostic.causes[i], {
                    .width = width,
                    .initial_indent = cause_initial,
                    .subsequent_indent = cause_rest
                }));
            }
        }

        template <typename T>
        auto render_footer(Terminal<T>& term, Diagnostic const& diagnostic) const -> void {
            auto const width = config.terminal_width > 4 ? config.terminal_width - 4 : 1;
            if (diagnostic.help) {
                term.write("{}\n", core::fill_text(*diagnostic.help, {
                    .width = width,
                    .initial_indent = "  help: ",
                    .subsequent_indent = "        "
                }));
            }

            if (config.footer) {
                term.write("\n{}\n", core::fill_text(*config.footer, {
                    .width = width,
                    .initial_indent = "  ",
                    .subsequent_indent = "  "
                }));
            }
        }
    };

    template <typename T>
    static inline auto render_diagnostic(
        Terminal<T>& term,
        Diagnostic const& diagnostic,
        GraphicalReportHandler const& handler = {}
    ) -> void {
        handler.render_report(term, diagnostic);
    }

} // namespace glint

#endif // GLINT_PRINTER_HPP

#ifndef GLINT_NARRATABLE_HPP
#define GLINT_NARRATABLE_HPP

#include "core/term/terminal.hpp"
#include "diagnostic.hpp"
#include "layout.hpp"
#include "line.hpp"
#include "merger.hpp"
#include "renderer.hpp"
#include "source.hpp"
#include <cctype>
#include <string>
#include <string_view>

namespace glint {

    /**
     * @brief Plain text rendering without drawing characters, meant for
     *        screen readers and other non-graphical consumers.
     */
    struct NarratableReportHandler {
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
        static auto severity_name(Severity severity) -> std::string {
            auto res = std::string(to_string(severity));
            for (auto& c: res) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return res;
        }

        template <typename T>
        auto render_report_impl(
            Terminal<T>& term,
            Diagnostic const& diagnostic,
            Source const* inherited,
            dsize_t depth
        ) const -> void {
            term.write("{}\n", diagnostic.message);
            term.write("    Diagnostic severity: {}\n", severity_name(diagnostic.severity));
            for (auto const& cause: diagnostic.causes) {
                term.write("    Caused by: {}\n", cause);
            }

            auto const* source = diagnostic.source ? &*diagnostic.source : inherited;
            if (source != nullptr && !diagnostic.labels.empty()) {
                render_snippets(term, *source, diagnostic);
            }

            if (diagnostic.help) term.write("diagnostic help: {}\n", *diagnostic.help);
            if (diagnostic.code) term.write("diagnostic code: {}\n", *diagnostic.code);
            if (diagnostic.url) term.write("For more details, see {}\n", *diagnostic.url);

            if (depth + 1 > config.max_related_depth) return;
            for (auto const& related: diagnostic.related) {
                term.newline();
                render_report_impl(term, related, source, depth + 1);
            }
        }

        template <typename T>
        auto render_snippets(Terminal<T>& term, Source const& source, Diagnostic const& diagnostic) const -> void {
            auto merged = merge_windows(
                source.text, diagnostic.labels,
                config.context_lines_before, config.context_lines_after
            );

            for (auto const& window: merged.windows) {
                auto const contents = expand_to_lines(source.text, window.contents);
                auto const lines = scan_lines(contents, window.labels);

                term.newline();
                term.write("Begin snippet");
                if (!source.is_anonymous()) term.write(" for {}", source.name);
                term.write(" starting at line {}, column {}\n\n", contents.line + 1, contents.column + 1);

                for (auto const& line: lines) {
                    term.write("snippet line {}: {}\n", line.line_number, line.content());
                    for (auto const& label: window.labels) {
                        auto const relation = classify(line, label);
                        if (relation != SpanRelation::Contained && relation != SpanRelation::Starts) continue;

                        auto position = resolve_span(source.text, label.span, 0, 0);
                        if (!position) continue;
                        term.write("    label at line {}, column {}", position->line + 1, position->column + 1);
                        if (label.label) term.write(": {}", *label.label);
                        term.newline();
                    }
                }
                term.newline();
            }

            for (auto const& failure: merged.failures) {
                term.write("{}\n", out_of_bounds_notice(failure.label, failure.error));
            }
        }
    };

} // namespace glint

#endif // GLINT_NARRATABLE_HPP

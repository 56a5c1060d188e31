#ifndef GLINT_MERGER_HPP
#define GLINT_MERGER_HPP

#include "core/config.hpp"
#include "error.hpp"
#include "source.hpp"
#include "span.hpp"
#include <algorithm>
#include <glog/logging.h>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace glint {

    /**
     * @brief One snippet block: the labels it shows, the union of their spans
     *        and the context extracted around that union.
     */
    struct Window {
        std::vector<LabeledSpan> labels{};
        SourceSpan span{};
        SpanContents contents{};
        dsize_t anchor{}; // index into `labels`

        auto anchor_label() const noexcept -> LabeledSpan const& { return labels[anchor]; }

        auto first_line() const noexcept -> dsize_t { return contents.line; }
        auto end_line() const noexcept -> dsize_t { return contents.line + contents.line_count; }
    };

    struct FailedLabel {
        LabeledSpan label{};
        SpanError error{SpanError::OutOfBounds};
    };

    struct MergedWindows {
        std::vector<Window> windows{};
        std::vector<FailedLabel> failures{};

        constexpr auto empty() const noexcept -> bool { return windows.empty() && failures.empty(); }
    };

    namespace detail {
        // Smallest offset anchors a window; at equal offsets a primary label wins.
        static inline auto is_better_anchor(LabeledSpan const& candidate, LabeledSpan const& current) noexcept -> bool {
            if (candidate.offset() != current.offset()) return candidate.offset() < current.offset();
            return candidate.primary && !current.primary;
        }

        static inline auto start_window(LabeledSpan label, SpanContents contents) -> Window {
            auto span = label.span;
            auto res = Window { .span = span, .contents = contents };
            res.labels.push_back(std::move(label));
            return res;
        }
    } // namespace detail

    /**
     * @brief Groups `labels` into display windows.
     *
     * Labels are sorted by offset and each one is resolved on its own. A label
     * joins the current window when its context starts on or before the line
     * following the window; the union of both spans is then resolved again and
     * replaces the window. A failed re-resolution starts a new window instead.
     * Labels that cannot be resolved at all are reported as failures and never
     * take part in a window.
     */
    static inline auto merge_windows(
        std::string_view text,
        std::span<LabeledSpan const> labels,
        dsize_t context_before,
        dsize_t context_after
    ) -> MergedWindows {
        auto sorted = std::vector<LabeledSpan>(labels.begin(), labels.end());
        std::ranges::stable_sort(sorted, [](LabeledSpan const& l, LabeledSpan const& r) {
            return l.offset() < r.offset();
        });

        auto res = MergedWindows{};
        auto current = std::optional<Window>{};

        for (auto& label: sorted) {
            auto contents = resolve_span(text, label.span, context_before, context_after);
            if (!contents) {
                VLOG(1) << "glint: cannot resolve label '" << label.label_or_none()
                    << "' at offset " << label.offset() << " with length " << label.length()
                    << ": " << to_string(contents.error());
                res.failures.push_back({ .label = std::move(label), .error = contents.error() });
                continue;
            }

            if (!current) {
                current = detail::start_window(std::move(label), *contents);
                continue;
            }

            if (contents->line > current->end_line()) {
                VLOG(2) << "glint: window for lines [" << current->first_line() << ", "
                    << current->end_line() << ") closed before line " << contents->line;
                res.windows.push_back(std::move(*current));
                current = detail::start_window(std::move(label), *contents);
                continue;
            }

            auto const merged_span = current->span.force_merge(label.span);
            auto merged = resolve_span(text, merged_span, context_before, context_after);
            if (!merged) {
                VLOG(1) << "glint: abandoned merge of " << current->span.offset() << ".."
                    << current->span.end() << " with label at offset " << label.offset()
                    << ": " << to_string(merged.error());
                res.windows.push_back(std::move(*current));
                current = detail::start_window(std::move(label), *contents);
                continue;
            }

            VLOG(2) << "glint: merged label at offset " << label.offset() << " into window starting at line "
                << merged->line;
            current->span = merged_span;
            current->contents = *merged;
            if (detail::is_better_anchor(label, current->anchor_label())) {
                current->anchor = current->labels.size();
            }
            current->labels.push_back(std::move(label));
        }

        if (current) res.windows.push_back(std::move(*current));
        return res;
    }

} // namespace glint

#endif // GLINT_MERGER_HPP

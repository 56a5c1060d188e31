#ifndef GLINT_DIAGNOSTIC_HPP
#define GLINT_DIAGNOSTIC_HPP

#include "core/config.hpp"
#include "core/term/glyphs.hpp"
#include "source.hpp"
#include "span.hpp"
#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace glint {

    enum class Severity: std::uint8_t {
        Advice = 0,
        Warning,
        Error
    };

    [[nodiscard]] static inline constexpr auto to_string(Severity severity) noexcept -> std::string_view {
        switch (severity) {
            case Severity::Advice: return "Advice";
            case Severity::Warning: return "Warning";
            case Severity::Error: return "Error";
        }
        std::unreachable();
    }

    [[nodiscard]] static inline constexpr auto severity_icon(Severity severity, core::term::GlyphSet const& glyphs) noexcept -> std::string_view {
        switch (severity) {
            case Severity::Advice: return glyphs.advice;
            case Severity::Warning: return glyphs.warning;
            case Severity::Error: return glyphs.error;
        }
        std::unreachable();
    }

    struct Diagnostic {
        Severity severity{Severity::Error};
        std::string message{};
        std::optional<std::string> code{};
        std::optional<std::string> url{};
        std::optional<std::string> help{};
        std::optional<Source> source{};
        std::vector<LabeledSpan> labels{};
        // Underlying causes, outermost first.
        std::vector<std::string> causes{};
        std::vector<Diagnostic> related{};

        auto with_label(LabeledSpan label) && -> Diagnostic&& {
            labels.push_back(std::move(label));
            return std::move(*this);
        }

        auto with_cause(std::string cause) && -> Diagnostic&& {
            causes.push_back(std::move(cause));
            return std::move(*this);
        }

        auto with_related(Diagnostic diagnostic) && -> Diagnostic&& {
            related.push_back(std::move(diagnostic));
            return std::move(*this);
        }

        // Smallest label offset, used to order diagnostics within a source.
        auto first_offset() const noexcept -> std::optional<dsize_t> {
            if (labels.empty()) return {};
            return std::ranges::min(labels, {}, &LabeledSpan::offset).offset();
        }

        auto source_name() const noexcept -> std::string_view {
            return source ? std::string_view(source->name) : std::string_view();
        }
    };

} // namespace glint

template <>
struct std::formatter<glint::Severity> {
    constexpr auto parse(auto& ctx) {
        auto it = ctx.begin();
        while (it != ctx.end()) {
            if (*it == '}') break;
            ++it;
        }
        return it;
    }

    auto format(glint::Severity const& s, auto& ctx) const {
        return std::format_to(ctx.out(), "{}", glint::to_string(s));
    }
};

#endif // GLINT_DIAGNOSTIC_HPP

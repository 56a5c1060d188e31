#ifndef GLINT_CONSUMER_HPP
#define GLINT_CONSUMER_HPP

#include "core/term/terminal.hpp"
#include "diagnostic.hpp"
#include "printer.hpp"
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <utility>
#include <vector>

namespace glint {

    struct DiagnosticConsumer {
        virtual ~DiagnosticConsumer() = default;
        virtual auto consume(Diagnostic&& diagnostic) -> void = 0;
        virtual auto flush() -> void {}
    };

    /**
     * @brief Renders every diagnostic it receives through `Handler` into a
     *        terminal. Reports are separated by a blank line.
     */
    template <typename Handler = GraphicalReportHandler, typename T = FILE*>
    struct StreamDiagnosticConsumer: DiagnosticConsumer {
        StreamDiagnosticConsumer(Terminal<T> term, Handler handler = {})
            : m_term(std::move(term))
            , m_handler(std::move(handler))
        {}
        StreamDiagnosticConsumer(StreamDiagnosticConsumer const&) = default;
        StreamDiagnosticConsumer(StreamDiagnosticConsumer &&) = default;
        StreamDiagnosticConsumer& operator=(StreamDiagnosticConsumer const&) = default;
        StreamDiagnosticConsumer& operator=(StreamDiagnosticConsumer &&) = default;
        ~StreamDiagnosticConsumer() override = default;

        auto consume(Diagnostic&& d) -> void override {
            if (m_has_printed) m_term.newline();
            m_handler.render_report(m_term, d);
            m_has_printed = true;
        }

        auto flush() -> void override { m_term.flush(); }

        constexpr auto reset() noexcept -> void { m_has_printed = false; }

        constexpr auto handler() const noexcept -> Handler const& { return m_handler; }

    private:
        Terminal<T> m_term;
        Handler m_handler;
        bool m_has_printed{false};
    };

    template <typename Handler, typename T>
    StreamDiagnosticConsumer(Terminal<T>, Handler) -> StreamDiagnosticConsumer<Handler, T>;

    template <typename T>
    StreamDiagnosticConsumer(Terminal<T>) -> StreamDiagnosticConsumer<GraphicalReportHandler, T>;

    struct ErrorTrackingDiagnosticConsumer: DiagnosticConsumer {
        explicit constexpr ErrorTrackingDiagnosticConsumer(DiagnosticConsumer* consumer) noexcept
            : m_consumer(consumer)
        {}
        constexpr ErrorTrackingDiagnosticConsumer(ErrorTrackingDiagnosticConsumer const&) noexcept = default;
        constexpr ErrorTrackingDiagnosticConsumer(ErrorTrackingDiagnosticConsumer &&) noexcept = default;
        constexpr ErrorTrackingDiagnosticConsumer& operator=(ErrorTrackingDiagnosticConsumer const&) noexcept = default;
        constexpr ErrorTrackingDiagnosticConsumer& operator=(ErrorTrackingDiagnosticConsumer &&) noexcept = default;
        ~ErrorTrackingDiagnosticConsumer() noexcept override = default;

        auto consume(Diagnostic&& d) -> void override {
            m_seen_error |= d.severity == Severity::Error;
            m_consumer->consume(std::move(d));
        }

        auto flush() -> void override { m_consumer->flush(); }

        [[nodiscard]] constexpr auto seen_error() const noexcept -> bool { return m_seen_error; }

        constexpr auto reset() noexcept -> void {
            m_seen_error = false;
        }
    private:
        DiagnosticConsumer* m_consumer;
        bool m_seen_error{false};
    };

    // Holds diagnostics until `flush`, then forwards them ordered by source
    // name and first label offset. Diagnostics without labels keep their
    // relative order and come first within their source.
    struct SortingDiagnosticConsumer: DiagnosticConsumer {
        explicit SortingDiagnosticConsumer(DiagnosticConsumer* consumer) noexcept
            : m_consumer(consumer)
        {}
        SortingDiagnosticConsumer(SortingDiagnosticConsumer const&) = default;
        SortingDiagnosticConsumer(SortingDiagnosticConsumer &&) = default;
        SortingDiagnosticConsumer& operator=(SortingDiagnosticConsumer const&) = default;
        SortingDiagnosticConsumer& operator=(SortingDiagnosticConsumer &&) = default;

        #ifdef NDEBUG
        ~SortingDiagnosticConsumer() noexcept override = default;
        #else
        ~SortingDiagnosticConsumer() noexcept override {
            assert(m_diagnostics.empty() && "Diagnostics are not flushed");
        }
        #endif

        auto consume(Diagnostic&& d) -> void override {
            m_diagnostics.push_back(std::move(d));
        }

        auto flush() -> void override {
            std::ranges::stable_sort(m_diagnostics, [](Diagnostic const& l, Diagnostic const& r) {
                if (l.source_name() != r.source_name()) return l.source_name() < r.source_name();
                return l.first_offset() < r.first_offset();
            });

            for (auto& diag: m_diagnostics) m_consumer->consume(std::move(diag));
            m_diagnostics.clear();
            m_consumer->flush();
        }

        constexpr auto size() const noexcept -> std::size_t { return m_diagnostics.size(); }

    private:
        DiagnosticConsumer* m_consumer;
        std::vector<Diagnostic> m_diagnostics{};
    };

} // namespace glint

#endif // GLINT_CONSUMER_HPP

#ifndef GLINT_CORE_TERM_TERMINAL_HPP
#define GLINT_CORE_TERM_TERMINAL_HPP

#include "config.hpp"
#include "writer.hpp"
#include <cstdio>
#include <format>
#include <string_view>

namespace glint {

    template <typename T>
    struct Terminal {
        using writer_t = Writer<T>;

        Terminal(FILE* handle) noexcept requires (detail::WriterHasHandle<T>)
            : m_writer(handle)
        {}

        Terminal(Writer<T> writer) noexcept
            : m_writer(std::move(writer))
        {}

        constexpr Terminal(Terminal const&) noexcept = default;
        constexpr Terminal(Terminal &&) noexcept = default;
        constexpr Terminal& operator=(Terminal const&) noexcept = default;
        constexpr Terminal& operator=(Terminal &&) noexcept = default;

        constexpr auto get_handle() noexcept -> FILE* requires (detail::WriterHasHandle<T>) {
            return m_writer.get_handle();
        }

        auto write(std::string_view str) -> Terminal& {
            m_writer.write(str);
            return *this;
        }

        template <typename... Args>
        auto write(std::format_string<Args...> fmt, Args&&... args) -> Terminal& {
            if constexpr (requires {
                { m_writer.write(fmt, std::forward<Args>(args)...) } -> std::same_as<void>;
            }) {
                m_writer.write(fmt, std::forward<Args>(args)...);
            } else {
                auto tmp = std::format(fmt, std::forward<Args>(args)...);
                write(std::string_view(tmp));
            }
            return *this;
        }

        auto newline() -> Terminal& {
            return write(std::string_view("\n"));
        }

        auto flush() noexcept {
            m_writer.flush();
        }

        ~Terminal() noexcept {
            flush();
        }

    private:
        writer_t m_writer;
    };

    Terminal(FILE* handle) noexcept -> Terminal<FILE*>;

    template <typename T>
    Terminal(Writer<T> writer) noexcept -> Terminal<T>;
} // namespace glint

#endif // GLINT_CORE_TERM_TERMINAL_HPP

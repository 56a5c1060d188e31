#ifndef GLINT_CORE_TERM_WRITER_HPP
#define GLINT_CORE_TERM_WRITER_HPP

#include <concepts>
#include <cstdio>
#include <format>
#include <iterator>
#include <print>
#include <string>
#include <utility>

namespace glint {
    template <typename C>
    struct Writer;

    template <>
    struct Writer<FILE*> {
        constexpr Writer(FILE* handle) noexcept
            : m_handle(handle)
        {}

        constexpr auto get_handle() const noexcept -> FILE* {
            return m_handle;
        }

        auto write(std::string_view str) -> void {
            std::print(m_handle, "{}", str);
        }

        template <typename... Args>
        auto write(std::format_string<Args...> fmt, Args&&... args) -> void {
            std::print(m_handle, fmt, std::forward<Args>(args)...);
        }

        auto flush() noexcept -> void {
            std::fflush(m_handle);
        }

    private:
        FILE* m_handle;
    };

    // Appends everything to a caller-owned string.
    template <>
    struct Writer<std::string> {
        constexpr Writer(std::string& out) noexcept
            : m_out(&out)
        {}

        auto write(std::string_view str) -> void {
            m_out->append(str);
        }

        template <typename... Args>
        auto write(std::format_string<Args...> fmt, Args&&... args) -> void {
            std::format_to(std::back_inserter(*m_out), fmt, std::forward<Args>(args)...);
        }

        constexpr auto flush() noexcept -> void {}

    private:
        std::string* m_out;
    };

    namespace detail {
        template <typename T>
        concept WriterHasHandle = requires (Writer<T> const& w) {
            { w.get_handle() } -> std::same_as<FILE*>;
        };
    }
} // namespace glint

#endif // GLINT_CORE_TERM_WRITER_HPP

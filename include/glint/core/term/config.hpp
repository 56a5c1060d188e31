#ifndef GLINT_CORE_TERM_CONFIG_HPP
#define GLINT_CORE_TERM_CONFIG_HPP

#include "../config.hpp"
#include <cstdio>
#include <cstdlib>
#include <string_view>

#ifdef GLINT_OS_UNIX
    #include <unistd.h>
    #include <sys/ioctl.h>
#elif defined(GLINT_OS_WIN)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <windows.h>
    #include <io.h>
#else
    #error "Unsupported platform"
#endif

namespace glint::core::term {

    namespace detail {
        static inline auto get_env(char const* name) noexcept -> std::string_view {
            auto const* value = std::getenv(name);
            return value == nullptr ? std::string_view{} : std::string_view(value);
        }

        static inline auto get_fd_from_handle(FILE* handle) noexcept -> int {
            #ifdef GLINT_OS_UNIX
                return fileno(handle);
            #else
                return _fileno(handle);
            #endif
        }

        static inline auto get_columns_impl([[maybe_unused]] int fd) noexcept -> std::size_t {
            #ifdef GLINT_OS_UNIX
                if (auto cols_str = get_env("COLUMNS"); !cols_str.empty()) {
                    int cols = std::atoi(cols_str.data());
                    if (cols > 0) return static_cast<std::size_t>(cols);
                }
                winsize win{};
                if (ioctl(fd, TIOCGWINSZ, &win) >= 0) {
                    return win.ws_col;
                }
                return 0zu;
            #else
                HANDLE handle = reinterpret_cast<HANDLE>(_get_osfhandle(fd));
                CONSOLE_SCREEN_BUFFER_INFO csbi;
                if (GetConsoleScreenBufferInfo(handle, &csbi)) return static_cast<std::size_t>(csbi.dwSize.X);
                return 0zu;
            #endif
        }
    } // namespace detail

    static inline auto is_displayed(int fd) noexcept -> bool {
        #ifdef GLINT_OS_UNIX
            return isatty(fd);
        #else
            DWORD mode;
            return (GetConsoleMode(reinterpret_cast<HANDLE>(_get_osfhandle(fd)), &mode) != 0);
        #endif
    }

    static inline auto get_columns(FILE* handle) noexcept -> std::size_t {
        auto fd = detail::get_fd_from_handle(handle);
        if (!is_displayed(fd)) return 0zu;
        return detail::get_columns_impl(fd);
    }

    static inline auto supports_utf8() noexcept -> bool {
        auto tmp = detail::get_env("LC_ALL");
        if (tmp.empty()) tmp = detail::get_env("LC_CTYPE");
        if (tmp.empty()) tmp = detail::get_env("LANG");

        if (tmp.empty()) return false;
        return tmp.contains("UTF-8") || tmp.contains("utf-8") || tmp.contains("UTF8") || tmp.contains("utf8");
    }
} // namespace glint::core::term

#endif // GLINT_CORE_TERM_CONFIG_HPP

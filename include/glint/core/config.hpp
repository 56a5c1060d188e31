#ifndef GLINT_CORE_CONFIG_HPP
#define GLINT_CORE_CONFIG_HPP

#include <cstddef>

#if !defined(GLINT_OS_WIN) && !defined(GLINT_OS_UNIX) && !defined(GLINT_OS_MAC)

    #ifdef __APPLE__
        #include <TargetConditionals.h>
    #endif

    #if defined(_WIN32) || defined(__SYMBIAN32__)
        #define GLINT_OS_WIN
    #elif defined(linux) || defined(__linux) || defined(__linux__)
        #define GLINT_OS_LINUX
        #define GLINT_OS_UNIX
    #elif defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__) || \
          defined(__DragonFly__)
        #define GLINT_OS_BSD
        #define GLINT_OS_UNIX
    #elif defined(__Fuchsia__) || defined(__GLIBC__) || defined(__GNU__) || defined(__unix__)
        #define GLINT_OS_UNIX
    #else
        #define GLINT_OS_MAC
        #define GLINT_OS_UNIX
    #endif
#endif

#if defined(_MSC_VER)
    #define GLINT_COMPILER_MSVC
#elif defined(__clang__)
    #define GLINT_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
    #define GLINT_COMPILER_GCC
#endif

#if defined(GLINT_COMPILER_CLANG)
    #define GLINT_ASSUME(expr) __builtin_assume(expr)
#elif defined(GLINT_COMPILER_GCC)
    #define GLINT_ASSUME(expr) if (expr) {} else { __builtin_unreachable(); }
#elif defined(GLINT_COMPILER_MSVC)
    #define GLINT_ASSUME(expr) __assume(expr)
#else
    #define GLINT_ASSUME(expr)
#endif

namespace glint {
#ifndef GLINT_SIZE_TYPE
    using dsize_t = std::size_t;
#else
    using dsize_t = GLINT_SIZE_TYPE;
#endif
} // namespace glint

#endif // GLINT_CORE_CONFIG_HPP

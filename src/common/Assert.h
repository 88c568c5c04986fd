#ifndef JSTREAM_COMMON_ASSERT_H
#define JSTREAM_COMMON_ASSERT_H

#include <cstdio>
#include <cstdlib>

#if defined(__cpp_lib_stacktrace)
#include <iostream>
#include <stacktrace>
#endif

namespace jstream::common {

inline void print_stacktrace() {
#if defined(__cpp_lib_stacktrace)
    std::fprintf(stderr, "stacktrace:\n");
    std::cerr << std::stacktrace::current() << '\n';
#else
    std::fprintf(stderr, "stacktrace: unavailable\n");
#endif
    std::fflush(stderr);
}

[[noreturn]] inline void panic_assert(const char *expr, const char *file, int line, const char *func) {
    std::fprintf(stderr, "JSTREAM_ASSERT failed: %s\n  at %s:%d (%s)\n", expr, file, line, func);
    print_stacktrace();
    std::abort();
}

[[noreturn]] inline void panic_assert_msg(const char *expr,
                                          const char *message,
                                          const char *file,
                                          int line,
                                          const char *func) {
    std::fprintf(stderr,
                 "JSTREAM_ASSERT failed: %s\n  message: %s\n  at %s:%d (%s)\n",
                 expr,
                 message,
                 file,
                 line,
                 func);
    print_stacktrace();
    std::abort();
}

[[noreturn]] inline void panic_message(const char *message, const char *file, int line, const char *func) {
    std::fprintf(stderr, "JSTREAM_PANIC: %s\n  at %s:%d (%s)\n", message, file, line, func);
    print_stacktrace();
    std::abort();
}

} // namespace jstream::common

#define JSTREAM_ASSERT(expr) \
    do { \
        if (!(expr)) { \
            ::jstream::common::panic_assert(#expr, __FILE__, __LINE__, __func__); \
        } \
    } while (false)

#define JSTREAM_ASSERT_MSG(expr, message) \
    do { \
        if (!(expr)) { \
            ::jstream::common::panic_assert_msg(#expr, (message), __FILE__, __LINE__, __func__); \
        } \
    } while (false)

#define JSTREAM_PANIC(message) \
    do { \
        ::jstream::common::panic_message((message), __FILE__, __LINE__, __func__); \
    } while (false)

#endif // JSTREAM_COMMON_ASSERT_H

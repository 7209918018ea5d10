// ============================================================================
// handoff/core/check.hpp - Always-On Precondition Checks
// ============================================================================
//
// HANDOFF_CHECK(cond, msg) guards preconditions whose violation is a bug in
// the caller and has no meaningful error to return: joining a ScopedThread
// from inside its own body, detaching a thread that was never started.
// It is not compiled out in Release builds.
//
// On failure it writes the condition, the message and the source location
// to stderr and calls std::abort().
//
// Recoverable misuse of a channel (double commit, double retrieval) is NOT
// checked here: those operations return Errc codes instead.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace handoff::detail {

// Writes the decimal digits of value ending at buf_end, returns the first.
inline char* UintToStr(unsigned int value, char* buf_end) {
    char* p = buf_end;
    do {
        *--p = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    return p;
}

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    char line_buf[12];
    char* line_end = line_buf + sizeof(line_buf);
    char* line_str = UintToStr(loc.line(), line_end);

    std::fputs("HANDOFF_CHECK(", stderr);
    std::fputs(cond_str, stderr);
    std::fputs(") failed: ", stderr);
    std::fputs(msg, stderr);
    std::fputs("\n  in ", stderr);
    std::fputs(loc.function_name(), stderr);
    std::fputs(" (", stderr);
    std::fputs(loc.file_name(), stderr);
    std::fputs(":", stderr);
    std::fwrite(line_str, 1, static_cast<size_t>(line_end - line_str), stderr);
    std::fputs(")\n", stderr);
    std::fflush(stderr);
    std::abort();
}

}  // namespace handoff::detail

#define HANDOFF_CHECK(cond, msg)                                                       \
    do {                                                                               \
        if (!(cond)) [[unlikely]] {                                                    \
            ::handoff::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                              \
    } while (0)

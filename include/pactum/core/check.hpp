// ============================================================================
// pactum/core/check.hpp - Always-On Assertions
// ============================================================================
//
// PACTUM_CHECK(cond, msg) guards against programming errors in the host's
// wiring, such as constructing a TaskRegistry directly from a config that
// TaskRegistry::Create would have rejected. It is never compiled out.
// Caller mistakes such as a bad task id or a missing role are NOT checked
// here: they are returned as Errc values.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace pactum::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fprintf(stderr, "PACTUM_CHECK(%s) failed: %s\n  in %s (%s:%u)\n", cond_str, msg,
                 loc.function_name(), loc.file_name(), static_cast<unsigned>(loc.line()));
    std::abort();
}

}  // namespace pactum::detail

#define PACTUM_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::pactum::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)

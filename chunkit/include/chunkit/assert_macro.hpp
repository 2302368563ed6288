#pragma once

// Assertions are compiled in only if CHUNKIT_HAVE_ASSERTIONS is defined,
// which the build sets when configured with CHUNKIT_WITH_ASSERTIONS=ON.
// Include <chunkit/assert.hpp> rather than this file.

#ifdef CHUNKIT_HAVE_ASSERTIONS

#define chunkit_assert(condition) \
    (void)((condition) || \
       (chunkit::global_failed_assertion_handler(#condition, __FILE__, __LINE__, __func__), 0))

#else

#define chunkit_assert(condition) \
    (void)(false && (condition))

#endif // def CHUNKIT_HAVE_ASSERTIONS

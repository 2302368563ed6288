#pragma once

#include <chunkit/version.hpp>

namespace chunkit {
namespace config {

// has_assertions
//     Internal invariants are checked with chunkit_assert.
//     * true:  a failed check calls global_failed_assertion_handler
//     * false: checks compile to nothing
//
// has_trace
//     Drivers report drains and exhaustion through CHUNKIT_TRACE
//     on std::cerr.

#ifdef CHUNKIT_HAVE_ASSERTIONS
constexpr bool has_assertions = true;
#else
constexpr bool has_assertions = false;
#endif

#ifdef CHUNKIT_HAVE_TRACE
constexpr bool has_trace = true;
#else
constexpr bool has_trace = false;
#endif

} // namespace config
} // namespace chunkit

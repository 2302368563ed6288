#pragma once

/*
 * Debug tracing to std::cerr.
 *
 * CHUNKIT_TRACE(a, b, ...) emits one line of the form
 *
 *     file.hpp:123 [0001712345678.123456] a, b: <a>, <b>
 *
 * when the library is built with CHUNKIT_HAVE_TRACE, and expands to
 * nothing otherwise. Lines from different threads are not interleaved.
 */

#include <iostream>
#include <mutex>
#include <sstream>

namespace chunkit {
namespace util {

std::ostream& debug_emit_trace_leader(std::ostream& out, const char* file, int line, const char* varlist);

inline void debug_emit(std::ostream& out) {
    out << "\n";
}

template <typename Head, typename... Tail>
void debug_emit(std::ostream& out, const Head& head, const Tail&... tail) {
    out << head;
    if (sizeof...(tail)) {
        out << ", ";
    }
    debug_emit(out, tail...);
}

extern std::mutex global_debug_cerr_mutex;

template <typename... Args>
void debug_emit_trace(const char* file, int line, const char* varlist, const Args&... args) {
    std::stringstream buffer;
    buffer.precision(17);

    debug_emit_trace_leader(buffer, file, line, varlist);
    debug_emit(buffer, args...);

    std::lock_guard<std::mutex> guard(global_debug_cerr_mutex);
    std::cerr << buffer.rdbuf();
    std::cerr.flush();
}

} // namespace util
} // namespace chunkit

#ifdef CHUNKIT_HAVE_TRACE
    #define CHUNKIT_TRACE(...) chunkit::util::debug_emit_trace(__FILE__, __LINE__, #__VA_ARGS__, __VA_ARGS__)
#else
    #define CHUNKIT_TRACE(...)
#endif

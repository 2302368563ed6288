#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>

#include <chunkit/trace.hpp>

#include "util/ioutil.hpp"

namespace chunkit {
namespace util {

std::mutex global_debug_cerr_mutex;

std::ostream& debug_emit_trace_leader(std::ostream& out, const char* file,
                                      int line, const char* varlist)
{
    iosfmt_guard _(out);

    const char* leaf = std::strrchr(file, '/');
    out << (leaf?leaf+1:file) << ':' << line << " ";

    using namespace std::chrono;
    auto tstamp = system_clock::now().time_since_epoch();
    auto tstamp_usec = duration_cast<microseconds>(tstamp).count();

    out << std::right << '[';
    out << std::setw(11) << std::setfill('0') << (tstamp_usec/1000000) << '.';
    out << std::setw(6)  << std::setfill('0') << (tstamp_usec%1000000) << ']';

    if (varlist && *varlist) {
        out << ' ' << varlist << ": ";
    }
    return out;
}

} // namespace util
} // namespace chunkit

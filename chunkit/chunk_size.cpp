#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <limits>
#include <string>

#include <chunkit/chunk_size.hpp>
#include <chunkit/chunkexcept.hpp>

namespace chunkit {

std::size_t parse_chunk_size(const std::string& text) {
    // strtoull accepts leading whitespace and a sign; reject both.
    if (text.empty() || !(text[0]>='0' && text[0]<='9')) {
        throw invalid_chunk_size(text);
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(text.c_str(), &end, 10);

    if (errno==ERANGE || *end || n==0 || n>std::numeric_limits<std::size_t>::max()) {
        throw invalid_chunk_size(text);
    }
    return static_cast<std::size_t>(n);
}

} // namespace chunkit

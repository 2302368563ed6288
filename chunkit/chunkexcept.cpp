#include <string>

#include <chunkit/chunkexcept.hpp>

#include "util/strprintf.hpp"

namespace chunkit {

using util::pprintf;

chunkit_exception::chunkit_exception(const std::string& what):
    std::runtime_error{what}
{}

zero_chunk_size::zero_chunk_size():
    chunkit_exception("chunk size must be greater than zero")
{}

invalid_chunk_size::invalid_chunk_size(const std::string& text):
    chunkit_exception(pprintf("invalid chunk size '{}': expected a positive integer", text)),
    text(text)
{}

} // namespace chunkit

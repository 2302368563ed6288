#pragma once

#include <cstddef>
#include <string>

namespace chunkit {

// Parse a decimal chunk size. Throws invalid_chunk_size unless the
// whole of `text` is a positive integer representable as std::size_t.
std::size_t parse_chunk_size(const std::string& text);

} // namespace chunkit

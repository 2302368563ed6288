#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// Chunkit-specific exception hierarchy.

namespace chunkit {

// Common base-class for chunkit run-time errors.

struct chunkit_exception: std::runtime_error {
    chunkit_exception(const std::string&);
};

// Usage errors

// A driver was requested with a chunk size of zero.
struct zero_chunk_size: chunkit_exception {
    zero_chunk_size();
};

// Textual chunk size that is not a positive integer, e.g. "0" or "-3".
struct invalid_chunk_size: chunkit_exception {
    invalid_chunk_size(const std::string& text);
    std::string text;
};

} // namespace chunkit

#pragma once

#include <iostream>

namespace chunkit {
namespace util {

// Restore the formatting state of a stream on scope exit.

class iosfmt_guard {
public:
    explicit iosfmt_guard(std::ios& stream) :
        save_(nullptr), stream_(stream)
    {
        save_.copyfmt(stream_);
    }

    ~iosfmt_guard() {
        stream_.copyfmt(save_);
    }

private:
    std::ios save_;
    std::ios& stream_;
};

} // namespace util
} // namespace chunkit

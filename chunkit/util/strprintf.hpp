#pragma once

// printf-like routines that return std::string.

#include <string>
#include <utility>

#include <fmt/format.h>

namespace chunkit {
namespace util {

// Substitute instances of '{}' in the format string with the following
// parameters, formatted by fmt.

template <typename... Args>
std::string pprintf(fmt::format_string<Args...> s, Args&&... args) {
    return fmt::format(s, std::forward<Args>(args)...);
}

} // namespace util
} // namespace chunkit

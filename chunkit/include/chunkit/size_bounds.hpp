#pragma once

/*
 * Advisory bounds on the number of items (or chunks) remaining in a
 * sequence.
 *
 * A `size_bounds` value {lower, upper} promises that the true count
 * n satisfies lower <= n, and n <= *upper when upper is present.
 * Bounds never participate in correctness: a source that reports
 * nothing is described by `unknown_size()`.
 */

#include <algorithm>
#include <cstddef>
#include <limits>
#include <optional>
#include <ostream>

namespace chunkit {

struct size_bounds {
    std::size_t lower = 0;
    std::optional<std::size_t> upper;

    bool is_exact() const { return upper && *upper==lower; }

    bool operator==(const size_bounds& x) const {
        return lower==x.lower && upper==x.upper;
    }

    bool operator!=(const size_bounds& x) const { return !(*this==x); }

    friend std::ostream& operator<<(std::ostream& o, const size_bounds& b) {
        o << '(' << b.lower << ", ";
        if (b.upper) o << *b.upper; else o << "none";
        return o << ')';
    }
};

inline size_bounds exact(std::size_t n) {
    return {n, n};
}

inline size_bounds unknown_size() {
    return {0, std::nullopt};
}

// Restrict both bounds to at most n; an absent upper bound becomes n.
inline size_bounds clamp_to(const size_bounds& b, std::size_t n) {
    return {std::min(b.lower, n), b.upper? std::min(*b.upper, n): n};
}

// Add n to both bounds, saturating the lower bound and dropping
// an upper bound that would overflow.
inline size_bounds add(const size_bounds& b, std::size_t n) {
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();

    size_bounds r;
    r.lower = b.lower>max-n? max: b.lower+n;
    if (b.upper && *b.upper<=max-n) r.upper = *b.upper+n;
    return r;
}

// Remove n items from the front, saturating at zero.
inline size_bounds subtract(const size_bounds& b, std::size_t n) {
    size_bounds r;
    r.lower = b.lower>n? b.lower-n: 0;
    if (b.upper) r.upper = *b.upper>n? *b.upper-n: 0;
    return r;
}

// Number of groups of k needed to hold the items, rounding up.
// Requires k>0.
inline size_bounds div_ceil(const size_bounds& b, std::size_t k) {
    auto dc = [k](std::size_t n) { return n/k + (n%k!=0); };

    size_bounds r;
    r.lower = dc(b.lower);
    if (b.upper) r.upper = dc(*b.upper);
    return r;
}

} // namespace chunkit

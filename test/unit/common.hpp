#pragma once

/*
 * Convenience functions, structs used across
 * more than one unit test.
 */

#include <cstddef>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <chunkit/size_bounds.hpp>

namespace testing {

// Sentinel for C-style strings, for use with source-related tests.

struct null_terminated_t {
    bool operator==(null_terminated_t) const { return true; }
    bool operator!=(null_terminated_t) const { return false; }

    bool operator==(const char *p) const { return !*p; }
    bool operator!=(const char *p) const { return !!*p; }

    friend bool operator==(const char *p, null_terminated_t x) {
        return x==p;
    }

    friend bool operator!=(const char *p, null_terminated_t x) {
        return x!=p;
    }

    constexpr null_terminated_t() {}
};

constexpr null_terminated_t null_terminated;

template <typename... A>
struct matches_cvref_impl: std::false_type {};

template <typename X>
struct matches_cvref_impl<X, X>: std::true_type {};

template <typename... A>
using matches_cvref = matches_cvref_impl<std::remove_cv_t<std::remove_reference_t<A>>...>;

// Wrap a value type, with copy operations disabled.

template <typename V>
struct nocopy {
    V value;

    template <typename... A>
    using is_self = matches_cvref<nocopy, A...>;

    template <typename... A, typename = std::enable_if_t<!is_self<A...>::value>>
    nocopy(A&&... a): value(std::forward<A>(a)...) {}

    nocopy(nocopy& n) = delete;
    nocopy(const nocopy& n) = delete;

    nocopy(nocopy&& n): value(std::move(n.value)) {
        n.value = V{};
        ++move_ctor_count;
    }

    nocopy& operator=(const nocopy& n) = delete;
    nocopy& operator=(nocopy&& n) {
        value = std::move(n.value);
        n.value = V{};
        ++move_assign_count;
        return *this;
    }

    bool operator==(const nocopy& them) const { return them.value==value; }
    bool operator!=(const nocopy& them) const { return !(*this==them); }

    static int move_ctor_count;
    static int move_assign_count;
    static void reset_counts() {
        move_ctor_count = 0;
        move_assign_count = 0;
    }
};

template <typename V>
int nocopy<V>::move_ctor_count;

template <typename V>
int nocopy<V>::move_assign_count;

// Source over the integers [0, n) that records how often it was asked
// for an item, including requests after it reported its end.

struct counting_source {
    int n = 0;
    int pos = 0;
    int* calls = nullptr;

    counting_source(int n, int* calls): n(n), calls(calls) {}

    std::optional<int> next() {
        ++*calls;
        if (pos>=n) return std::nullopt;
        return pos++;
    }

    chunkit::size_bounds size_hint() const {
        return chunkit::exact(pos<n? std::size_t(n-pos): 0u);
    }
};

// Source over a fixed list of items whose size hint is only exact for
// the first `exact_prefix` items, as for a sequence followed by a
// filtered sequence: lower bound counts the prefix, upper bound all
// remaining items.

struct hinted_source {
    std::vector<int> items;
    std::size_t exact_prefix = 0;
    std::size_t pos = 0;

    hinted_source(std::vector<int> items, std::size_t exact_prefix):
        items(std::move(items)), exact_prefix(exact_prefix) {}

    std::optional<int> next() {
        if (pos>=items.size()) return std::nullopt;
        return items[pos++];
    }

    chunkit::size_bounds size_hint() const {
        std::size_t lower = exact_prefix>pos? exact_prefix-pos: 0;
        return {lower, items.size()-pos};
    }
};

// Counter source that reports its end on every multiple of `period`,
// and carries on counting if asked again.

struct resumable_source {
    int period;
    int i = 0;

    explicit resumable_source(int period): period(period) {}

    std::optional<int> next() {
        ++i;
        if (i%period==0) return std::nullopt;
        return i;
    }
};

// Drain a chunk (or any source) into a vector.

template <typename C>
auto collect(C& c) {
    std::vector<std::decay_t<decltype(*c.next())>> out;
    while (auto v = c.next()) {
        out.push_back(std::move(*v));
    }
    return out;
}

// Google Test assertion-returning predicates:

template <typename Seq1, typename Seq2>
::testing::AssertionResult seq_eq(Seq1&& seq1, Seq2&& seq2) {
    using std::begin;
    using std::end;

    auto i1 = begin(seq1);
    auto i2 = begin(seq2);

    auto e1 = end(seq1);
    auto e2 = end(seq2);

    for (std::size_t j = 0; i1!=e1 && i2!=e2; ++i1, ++i2, ++j) {
        auto v1 = *i1;
        auto v2 = *i2;

        if (!(v1==v2)) {
            return ::testing::AssertionFailure() << "values " << v1 << " and " << v2 << " differ at index " << j;
        }
    }

    if (i1!=e1 || i2!=e2) {
        return ::testing::AssertionFailure() << "sequences differ in length";
    }
    return ::testing::AssertionSuccess();
}

} // namespace testing

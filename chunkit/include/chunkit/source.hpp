#pragma once

/*
 * Sources: the sequential producers that a chunk driver consumes.
 *
 * A source is any object `s` for which `s.next()` returns a
 * `std::optional<T>`; an empty optional marks the end of the sequence.
 * A source may additionally provide
 *
 *     size_bounds size_hint() const;
 *
 * describing how many items remain. Sources without one are treated as
 * having unknown size.
 *
 * Three adaptors are provided:
 *
 *     iterator_source<I, S>   items copied (or moved, with std::move_iterator)
 *                             from an iterator/sentinel pair;
 *     owning_source<C>        items moved out of an owned container with
 *                             random access iterators;
 *     generator_source<F>     items produced by a callable returning
 *                             std::optional<T>.
 */

#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include <chunkit/size_bounds.hpp>
#include <chunkit/util/meta.hpp>

namespace chunkit {

// Source detection and associated types.

template <typename S, typename = void>
struct is_source: std::false_type {};

template <typename S>
struct is_source<S, std::void_t<decltype(std::declval<S&>().next())>>:
    util::is_optional<std::decay_t<decltype(std::declval<S&>().next())>> {};

template <typename S>
inline constexpr bool is_source_v = is_source<S>::value;

template <typename S>
using source_value_t =
    typename util::optional_value<std::decay_t<decltype(std::declval<S&>().next())>>::type;

template <typename S, typename = void>
struct has_size_hint: std::false_type {};

template <typename S>
struct has_size_hint<S, std::void_t<decltype(std::declval<const S&>().size_hint())>>:
    std::is_convertible<decltype(std::declval<const S&>().size_hint()), size_bounds> {};

template <typename S>
size_bounds source_size_hint(const S& s) {
    if constexpr (has_size_hint<S>::value) {
        return s.size_hint();
    }
    else {
        return unknown_size();
    }
}

template <typename I, typename S = I>
class iterator_source {
    I inner_;
    S end_;

public:
    using value_type = typename std::iterator_traits<I>::value_type;

    iterator_source(I first, S last):
        inner_(std::move(first)), end_(std::move(last))
    {}

    std::optional<value_type> next() {
        if (inner_==end_) return std::nullopt;

        std::optional<value_type> v(*inner_);
        ++inner_;
        return v;
    }

    size_bounds size_hint() const {
        if constexpr (util::has_end_distance_v<I, S>) {
            auto d = end_-inner_;
            return exact(d>0? static_cast<std::size_t>(d): 0u);
        }
        else {
            return unknown_size();
        }
    }
};

template <typename I, typename S>
iterator_source<I, S> make_source(I first, S last) {
    return iterator_source<I, S>(std::move(first), std::move(last));
}

template <typename C>
class owning_source {
    using traits = util::sequence_traits<C>;

    static_assert(util::is_random_access_iterator_v<typename traits::iterator>,
        "owning_source requires a container with random access iterators");

    C seq_;
    std::size_t pos_ = 0;

    auto position() {
        using std::begin;
        return begin(seq_)+static_cast<typename traits::difference_type>(pos_);
    }

public:
    using value_type = typename traits::value_type;

    explicit owning_source(C seq): seq_(std::move(seq)) {}

    std::optional<value_type> next() {
        using std::end;

        auto i = position();
        if (i==end(seq_)) return std::nullopt;

        ++pos_;
        return std::optional<value_type>(std::move(*i));
    }

    size_bounds size_hint() const {
        using std::begin;
        using std::end;

        auto n = static_cast<std::size_t>(end(seq_)-begin(seq_));
        return exact(n-pos_);
    }
};

template <typename F>
class generator_source {
    using result_type = std::decay_t<std::invoke_result_t<F&>>;

    static_assert(util::is_optional_v<result_type>,
        "generator_source requires a callable returning std::optional");

    F f_;

public:
    using value_type = typename util::optional_value<result_type>::type;

    explicit generator_source(F f): f_(std::move(f)) {}

    std::optional<value_type> next() {
        return f_();
    }
};

template <typename F>
generator_source<std::decay_t<F>> source_from(F&& f) {
    return generator_source<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace chunkit

#pragma once

/* Type utilities and convenience expressions.  */

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>
#include <type_traits>

namespace chunkit {
namespace util {

// Types associated with a container or sequence

namespace impl_seqtrait {
    using std::begin;

    template <typename Seq>
    struct sequence_traits {
        using iterator = decltype(begin(std::declval<Seq&>()));
        using value_type = typename std::iterator_traits<iterator>::value_type;
        using difference_type = typename std::iterator_traits<iterator>::difference_type;
    };
}

template <typename Seq>
using sequence_traits = impl_seqtrait::sequence_traits<Seq>;

// Random access iterator test

template <typename T, typename = void>
struct is_random_access_iterator: public std::false_type {};

template <typename T>
struct is_random_access_iterator<T, std::enable_if_t<
        std::is_same<
            std::random_access_iterator_tag,
            typename std::iterator_traits<T>::iterator_category>::value
    >> : public std::true_type {};

template <typename T>
inline constexpr bool is_random_access_iterator_v = is_random_access_iterator<T>::value;

// Test for a well-formed `s - i` giving the distance from an
// iterator to its end marker: true for random access iterators
// and for sentinels that supply the difference themselves.

template <typename I, typename S, typename = void>
struct has_end_distance: std::false_type {};

template <typename I, typename S>
struct has_end_distance<I, S, std::void_t<decltype(std::declval<const S&>()-std::declval<const I&>())>>:
    std::is_convertible<
        decltype(std::declval<const S&>()-std::declval<const I&>()),
        typename std::iterator_traits<I>::difference_type> {};

template <typename I, typename S>
inline constexpr bool has_end_distance_v = has_end_distance<I, S>::value;

// Unwrap std::optional<T>.

template <typename X>
struct optional_value {};

template <typename T>
struct optional_value<std::optional<T>> {
    using type = T;
};

template <typename X>
struct is_optional: std::false_type {};

template <typename T>
struct is_optional<std::optional<T>>: std::true_type {};

template <typename X>
inline constexpr bool is_optional_v = is_optional<X>::value;

} // namespace util
} // namespace chunkit

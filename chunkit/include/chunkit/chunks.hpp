#pragma once

/*
 * Split a source into consecutive chunks of a fixed size.
 *
 * A driver `chunked<Source>` owns a source and hands out one chunk view
 * at a time. A view `chunk<Source>` borrows the driver and yields up to
 * `chunk_size()` items taken directly from the source; the last view may
 * be shorter. Views must be used before the next call to the driver's
 * `next()`:
 *
 *     auto cs = chunkit::chunks(std::move(src), 3);
 *     while (auto c = cs.next()) {
 *         for (auto& v: *c) { ... }
 *     }
 *
 * A view may be dropped before it is used up. The items it did not
 * deliver are skipped when the driver is next asked for a chunk, so that
 * chunk boundaries always fall on multiples of the chunk size.
 *
 * The driver is not itself a range: a chunk view depends on the driver's
 * state, so two views cannot be held at once. Iterate with `next()` or
 * `for_each()`.
 */

#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

#include <chunkit/assert.hpp>
#include <chunkit/chunkexcept.hpp>
#include <chunkit/size_bounds.hpp>
#include <chunkit/source.hpp>
#include <chunkit/trace.hpp>

namespace chunkit {

template <typename Source>
class chunked;

template <typename Source>
class chunk;

// End marker for iteration over a chunk.

struct chunk_end_t {
    constexpr chunk_end_t() {}
};

constexpr chunk_end_t chunk_end;

// Single-pass input iterator over the items of a chunk. The iterator
// holds the current item; incrementing pulls the next one.

template <typename Source>
class chunk_iterator {
public:
    using value_type = source_value_t<Source>;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;
    using iterator_category = std::input_iterator_tag;

    chunk_iterator() = default;

    explicit chunk_iterator(chunk<Source>& c):
        chunk_(&c), current_(c.next())
    {}

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }

    // Holds the item that was current before a post-increment.
    class postinc_proxy {
    public:
        explicit postinc_proxy(std::optional<value_type>&& v): v_(std::move(v)) {}
        value_type& operator*() { return *v_; }

    private:
        std::optional<value_type> v_;
    };

    chunk_iterator& operator++() {
        current_ = chunk_->next();
        return *this;
    }

    postinc_proxy operator++(int) {
        postinc_proxy p(std::move(current_));
        ++*this;
        return p;
    }

    friend bool operator==(const chunk_iterator& i, chunk_end_t) { return !i.current_; }
    friend bool operator==(chunk_end_t, const chunk_iterator& i) { return !i.current_; }
    friend bool operator!=(const chunk_iterator& i, chunk_end_t) { return !!i.current_; }
    friend bool operator!=(chunk_end_t, const chunk_iterator& i) { return !!i.current_; }

private:
    chunk<Source>* chunk_ = nullptr;
    mutable std::optional<value_type> current_;
};

// A view of one chunk. Created only by chunked<Source>::next().
//
// A chunk can be moved but not copied or assigned; a moved-from chunk
// is empty. The chunk must not outlive its driver, and must not be used
// after the driver has handed out a later chunk.

template <typename Source>
class chunk {
public:
    using value_type = source_value_t<Source>;
    using iterator = chunk_iterator<Source>;
    using sentinel = chunk_end_t;

    chunk(const chunk&) = delete;
    chunk& operator=(const chunk&) = delete;
    chunk& operator=(chunk&&) = delete;

    chunk(chunk&& other) noexcept(std::is_nothrow_move_constructible<value_type>::value):
        parent_(std::exchange(other.parent_, nullptr)),
        first_(std::move(other.first_)),
        generation_(other.generation_)
    {
        other.first_.reset();
    }

    // Next item of this chunk, or nothing once the chunk boundary or
    // the end of the source has been reached.
    std::optional<value_type> next() {
        if (!parent_) return std::nullopt;
        chunkit_assert(generation_==parent_->generation_);

        if (first_) {
            std::optional<value_type> v(std::move(first_));
            first_.reset();
            return v;
        }

        if (parent_->pending_==0) return std::nullopt;

        --parent_->pending_;
        auto v = parent_->pull();
        if (!v) {
            // Source ended inside the chunk: this chunk is finished, and
            // the driver has recorded the exhaustion.
            parent_->pending_ = 0;
        }
        return v;
    }

    // Bounds on the number of items this chunk has yet to yield.
    size_bounds size_hint() const {
        if (!parent_) return exact(0);

        std::size_t held = first_? 1: 0;
        if (parent_->exhausted_) return exact(held);

        auto b = clamp_to(source_size_hint(parent_->source_), parent_->pending_);
        return add(b, held);
    }

    iterator begin() { return iterator(*this); }
    sentinel end() const { return chunk_end; }

private:
    friend class chunked<Source>;

    chunk(chunked<Source>& parent, value_type&& first):
        parent_(&parent),
        first_(std::move(first)),
        generation_(parent.generation_)
    {}

    chunked<Source>* parent_;
    std::optional<value_type> first_;
    std::size_t generation_;
};

template <typename Source>
class chunked {
    static_assert(is_source_v<Source>,
        "chunked requires a source: a type with next() returning std::optional");

public:
    using source_type = Source;
    using value_type = source_value_t<Source>;
    using chunk_type = chunk<Source>;

    // Throws zero_chunk_size if n is zero; the source is not touched.
    chunked(Source src, std::size_t n):
        source_(std::move(src)), n_(n)
    {
        if (n_==0) throw zero_chunk_size();
    }

    chunked(chunked&&) = default;
    chunked& operator=(chunked&&) = default;

    chunked(const chunked&) = delete;
    chunked& operator=(const chunked&) = delete;

    // Next chunk, or nothing once the source is exhausted. Items left
    // over from a previous, partially consumed chunk are discarded first.
    // After the first empty result, every call returns nothing and the
    // source is not consulted again.
    std::optional<chunk_type> next() {
        if (exhausted_) return std::nullopt;

        drain();
        if (exhausted_) return std::nullopt;

        auto first = pull();
        if (!first) return std::nullopt;

        pending_ = n_-1;
        ++generation_;
        return chunk_type(*this, std::move(*first));
    }

    // Call f with each remaining chunk in turn. f receives a chunk_type&.
    template <typename F>
    void for_each(F&& f) {
        while (auto c = next()) {
            f(*c);
        }
    }

    // Bounds on the number of chunks still to be handed out.
    size_bounds size_hint() const {
        if (exhausted_) return exact(0);
        return div_ceil(subtract(source_size_hint(source_), pending_), n_);
    }

    std::size_t chunk_size() const { return n_; }

    bool exhausted() const { return exhausted_; }

private:
    friend class chunk<Source>;

    Source source_;
    std::size_t n_;

    // Items owed to the open chunk; 0 when no chunk is open.
    std::size_t pending_ = 0;

    // Set once the source has signalled its end; never cleared.
    bool exhausted_ = false;

    // Incremented for each chunk handed out, so that a stale view
    // can be detected.
    std::size_t generation_ = 0;

    std::optional<value_type> pull() {
        chunkit_assert(!exhausted_);

        auto v = source_.next();
        if (!v) {
            exhausted_ = true;
            CHUNKIT_TRACE(generation_, exhausted_);
        }
        return v;
    }

    // Skip the rest of an abandoned chunk.
    void drain() {
        chunkit_assert(pending_<n_);

        if (pending_) {
            CHUNKIT_TRACE(generation_, pending_);
        }
        while (pending_>0) {
            --pending_;
            if (!pull()) {
                pending_ = 0;
                return;
            }
        }
    }
};

template <typename Source>
chunked<Source> make_chunked(Source src, std::size_t n) {
    return chunked<Source>(std::move(src), n);
}

// Chunk a source, or a sequence presented through a source adaptor:
//
//   * a source (an rvalue; the driver takes ownership);
//   * an lvalue sequence, whose items are copied, and which must outlive
//     the driver;
//   * an rvalue container with random access iterators, which is moved
//     into the driver and whose items are moved out.

template <typename Seq>
auto chunks(Seq&& seq, std::size_t n) {
    using S = std::decay_t<Seq>;

    if constexpr (is_source_v<S>) {
        static_assert(!std::is_lvalue_reference<Seq>::value,
            "chunks() takes ownership of a source: pass it as an rvalue");
        return make_chunked(S(std::forward<Seq>(seq)), n);
    }
    else if constexpr (std::is_lvalue_reference<Seq>::value) {
        using std::begin;
        using std::end;
        return make_chunked(make_source(begin(seq), end(seq)), n);
    }
    else {
        return make_chunked(owning_source<S>(std::move(seq)), n);
    }
}

// Chunk the items of an iterator/sentinel range.

template <typename I, typename S>
auto chunks(I first, S last, std::size_t n) {
    return make_chunked(make_source(std::move(first), std::move(last)), n);
}

} // namespace chunkit

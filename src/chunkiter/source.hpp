/*
 * source.hpp
 *
 * Sequential, single-pass item sources consumed by chunkiter::chunker.
 *
 * Source protocol:
 *   using value_type = T;                  // non-cv object type
 *   std::optional<value_type> next();      // std::nullopt == no more items
 *
 * Optional capabilities (detected at compile time):
 *   size_bounds size_hint() const;         // bounds on remaining items
 *   reg exact_size() const;                // exact remaining items
 *   bool failed() const;                   // last std::nullopt was a failure,
 *                                          // not a clean end of input
 *
 * Stock sources:
 * - iterator_source<It, Sent>:  walks [first, last), copying each element
 *                               (moving when It is a std::move_iterator).
 * - container_source<C>:        owns a container and yields its elements by move.
 * - generator_source<F>:        F() -> std::optional<T>.
 * - stream_source<T>:           operator>> from a borrowed std::basic_istream.
 *
 * Consumption is destructive: an item handed out by next() is never replayed.
 */

#ifndef CHUNKITER_SOURCE_HPP_
#define CHUNKITER_SOURCE_HPP_

#include <istream>
#include <iterator>     // std::iterator_traits, std::distance, std::next
#include <limits>
#include <optional>
#include <string>       // std::char_traits
#include <type_traits>
#include <utility>      // std::move, std::declval

#include "basic_types.h"            // reg
#include "base/chunkiter_tools.hpp" // RB_FORCEINLINE, RB_UNLIKELY

namespace chunkiter {

/* =======================================================================
 * size_bounds
 *
 * Lower bound plus optional upper bound on a remaining count.
 * A disengaged 'upper' means "unbounded / unknown".
 * ======================================================================= */
struct size_bounds
{
    reg lower{0};
    std::optional<reg> upper{};

    [[nodiscard]] static constexpr size_bounds exact(const reg n) noexcept {
        return size_bounds{n, n};
    }

    [[nodiscard]] static constexpr size_bounds unknown() noexcept {
        return size_bounds{0, std::nullopt};
    }

    [[nodiscard]] constexpr bool is_exact() const noexcept {
        return upper.has_value() && *upper == lower;
    }

    // Floor-divides both bounds: a trailing partial group never counts.
    [[nodiscard]] constexpr size_bounds divided_by(const reg n) const noexcept {
        if (n == 0) {
            return size_bounds{std::numeric_limits<reg>::max(), std::nullopt};
        }
        return size_bounds{lower / n, upper ? std::optional<reg>(*upper / n) : std::nullopt};
    }

    friend constexpr bool operator==(const size_bounds& a, const size_bounds& b) noexcept {
        return a.lower == b.lower && a.upper == b.upper;
    }
    friend constexpr bool operator!=(const size_bounds& a, const size_bounds& b) noexcept {
        return !(a == b);
    }
};

namespace detail {

template<class S, class = void>
struct has_value_type : std::false_type {};
template<class S>
struct has_value_type<S, std::void_t<typename S::value_type>> : std::true_type {};

template<class S, class = void>
struct has_next : std::false_type {};
template<class S>
struct has_next<S, std::void_t<decltype(std::declval<S&>().next())>>
    : std::is_same<decltype(std::declval<S&>().next()), std::optional<typename S::value_type>> {};

template<class S, class = void>
struct has_size_hint : std::false_type {};
template<class S>
struct has_size_hint<S, std::void_t<decltype(std::declval<const S&>().size_hint())>>
    : std::is_convertible<decltype(std::declval<const S&>().size_hint()), size_bounds> {};

template<class S, class = void>
struct has_exact_size : std::false_type {};
template<class S>
struct has_exact_size<S, std::void_t<decltype(std::declval<const S&>().exact_size())>>
    : std::is_convertible<decltype(std::declval<const S&>().exact_size()), reg> {};

template<class S, class = void>
struct has_failed : std::false_type {};
template<class S>
struct has_failed<S, std::void_t<decltype(std::declval<const S&>().failed())>>
    : std::is_convertible<decltype(std::declval<const S&>().failed()), bool> {};

template<class S, bool = has_value_type<S>::value>
struct is_source_impl : std::false_type {};
template<class S>
struct is_source_impl<S, true>
    : std::bool_constant<std::is_object_v<typename S::value_type> &&
                         !std::is_const_v<typename S::value_type> &&
                         has_next<S>::value> {};

template<class It>
inline constexpr bool is_random_access_v = std::is_base_of_v<
    std::random_access_iterator_tag,
    typename std::iterator_traits<It>::iterator_category>;

} // namespace detail

template<class S>
inline constexpr bool is_source_v = detail::is_source_impl<S>::value;

template<class S>
inline constexpr bool has_size_hint_v = detail::has_size_hint<S>::value;

template<class S>
inline constexpr bool has_exact_size_v = detail::has_exact_size<S>::value;

template<class S>
inline constexpr bool has_failed_v = detail::has_failed<S>::value;

/* =======================================================================
 * iterator_source<It, Sent>
 *
 * Single-pass walk over [first, last). Elements are copy-constructed from *it
 * (wrap It in std::move_iterator to move them out instead).
 * ======================================================================= */
template<class It, class Sent = It>
class iterator_source
{
public:
    using iterator   = It;
    using sentinel   = Sent;
    using value_type = std::remove_cv_t<typename std::iterator_traits<It>::value_type>;

    static constexpr bool kSized = detail::is_random_access_v<It> && std::is_same_v<It, Sent>;

    static_assert(std::is_constructible_v<value_type, decltype(*std::declval<It&>())>,
                  "[chunkiter::iterator_source]: value_type must be constructible from *It.");

    iterator_source(It first, Sent last)
        : first_(std::move(first))
        , last_(std::move(last))
    {}

    [[nodiscard]] std::optional<value_type> next() {
        if (RB_UNLIKELY(first_ == last_)) {
            return std::nullopt;
        }
        std::optional<value_type> item(std::in_place, *first_);
        ++first_;
        return item;
    }

    [[nodiscard]] size_bounds size_hint() const {
        if constexpr (kSized) {
            return size_bounds::exact(exact_size());
        } else {
            return size_bounds::unknown();
        }
    }

    template<bool S = kSized, typename = std::enable_if_t<S>>
    [[nodiscard]] reg exact_size() const {
        return static_cast<reg>(last_ - first_);
    }

private:
    It   first_;
    Sent last_;
};

/* =======================================================================
 * container_source<C>
 *
 * Owns a container (moved in) and yields its elements by move, front to back.
 * The cursor is kept as an index so moving the source never leaves it
 * pointing into the moved-from container.
 * ======================================================================= */
template<class C>
class container_source
{
public:
    using container_type = C;
    using value_type     = std::remove_cv_t<typename C::value_type>;

    explicit container_source(C container)
        : container_(std::move(container))
        , pos_(0)
        , cursor_(std::begin(container_))
    {}

    container_source(container_source&& other) noexcept(std::is_nothrow_move_constructible_v<C>)
        : container_(std::move(other.container_))
        , pos_(other.pos_)
        , cursor_(std::next(std::begin(container_), static_cast<sreg>(pos_)))
    {}

    container_source(const container_source&)            = delete;
    container_source& operator=(const container_source&) = delete;
    container_source& operator=(container_source&&)      = delete;

    [[nodiscard]] std::optional<value_type> next() {
        if (RB_UNLIKELY(cursor_ == std::end(container_))) {
            return std::nullopt;
        }
        std::optional<value_type> item(std::in_place, std::move(*cursor_));
        ++cursor_;
        ++pos_;
        return item;
    }

    // Only for containers with std::size (not std::forward_list).
    template<class D = C, typename = decltype(std::size(std::declval<const D&>()))>
    [[nodiscard]] size_bounds size_hint() const {
        return size_bounds::exact(exact_size());
    }

    template<class D = C, typename = decltype(std::size(std::declval<const D&>()))>
    [[nodiscard]] reg exact_size() const {
        return static_cast<reg>(std::size(container_)) - pos_;
    }

private:
    using cursor_type = decltype(std::begin(std::declval<C&>()));

    C           container_;
    reg         pos_;
    cursor_type cursor_;
};

/* =======================================================================
 * generator_source<F>
 *
 * Calls F() for every item. F returns std::optional<T>; std::nullopt ends
 * the sequence. No size information.
 * ======================================================================= */
template<class F>
class generator_source
{
    using result_type = std::invoke_result_t<F&>;

public:
    using value_type = typename result_type::value_type;

    static_assert(std::is_same_v<result_type, std::optional<value_type>>,
                  "[chunkiter::generator_source]: F() must return std::optional<T>.");

    explicit generator_source(F fn)
        : fn_(std::move(fn))
    {}

    [[nodiscard]] std::optional<value_type> next() {
        return fn_();
    }

private:
    F fn_;
};

/* =======================================================================
 * stream_source<T, CharT, Traits>
 *
 * Extracts T with operator>> from a borrowed stream (the stream must outlive
 * the source). Only whitespace left before end of stream is a clean end of
 * input. Any extraction error after that (malformed token, including a last
 * one cut short by end of stream) or a bad stream is reported through
 * failed(). Once stopped, the stream is not read again.
 * ======================================================================= */
template<class T, class CharT = char, class Traits = std::char_traits<CharT>>
class stream_source
{
public:
    using value_type  = T;
    using stream_type = std::basic_istream<CharT, Traits>;

    static_assert(std::is_default_constructible_v<T>,
                  "[chunkiter::stream_source]: T must be default-constructible (operator>> target).");

    explicit stream_source(stream_type& in) noexcept
        : in_(&in)
    {}

    [[nodiscard]] std::optional<value_type> next() {
        if (RB_UNLIKELY(stopped_)) {
            return std::nullopt;
        }
        *in_ >> std::ws;
        if (in_->eof() && !in_->bad()) {
            stopped_ = true;
            return std::nullopt;
        }
        std::optional<value_type> item(std::in_place);
        if (*in_ >> *item) {
            ++read_;
            return item;
        }
        stopped_ = true;
        failed_  = true;
        return std::nullopt;
    }

    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] bool stopped() const noexcept { return stopped_; }

    // Items successfully extracted so far.
    [[nodiscard]] reg items_read() const noexcept { return read_; }

private:
    stream_type* in_;
    reg  read_{0};
    bool stopped_{false};
    bool failed_{false};
};

} // namespace chunkiter

#endif /* CHUNKITER_SOURCE_HPP_ */

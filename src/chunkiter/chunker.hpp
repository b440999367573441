/*
 * chunker.hpp
 *
 * Fixed-size chunking adapter over a sequential source.
 *
 * chunker<Source, N> pulls items one at a time from Source and hands them out
 * as std::array<T, N>. Items are staged in an inline, uninitialized N-slot
 * buffer; nothing is heap-allocated and items are never copied on the way
 * through (one move into the slot, one move out, or a single memcpy of the
 * whole block for trivially copyable T).
 *
 * Production model:
 * - next() fills slots [live..N) from the source. A full block is handed out
 *   and live resets to 0. If the source runs dry first, next() returns
 *   std::nullopt and the partial group stays live ("leftover").
 * - End of production is latched: after the first std::nullopt the source is
 *   never pulled again and every later next() returns std::nullopt.
 * - A source exposing failed() can report a failure distinctly from a clean
 *   end; the chunker then ends in state 'failed' with the leftover intact.
 *
 * Leftover:
 * - peek_leftover(): read-only view of the live slots.
 * - take_leftover() &&: moves the live slots out as engaged optionals, then
 *   finalizes the source. The chunker is retired afterwards.
 * - Any production or take on a retired chunker calls CHUNKITER_ON_MISUSE,
 *   in every build.
 *
 * Exceptions (CHUNKITER_ENABLE_EXCEPTIONS == 1):
 * - A throwing source: state 'failed', filled slots stay live, rethrown.
 * - A throwing hand-out with copyable T: values are copied out, so the block
 *   stays staged and the chunker keeps producing; the next call retries.
 * - A throwing hand-out with move-only T: part of the block is already moved
 *   from. The block is destroyed, the state becomes 'failed', rethrown.
 *
 * Teardown:
 * - The destructor destroys exactly the live slots, then the source.
 *
 * N == 0:
 * - next() returns an empty array forever and never touches the source.
 *
 * Concurrency:
 * - Not thread-safe. Move-only, single owner.
 */

#ifndef CHUNKITER_CHUNKER_HPP_
#define CHUNKITER_CHUNKER_HPP_

#include <array>
#include <cstddef>      // std::ptrdiff_t
#include <iterator>     // std::input_iterator_tag
#include <optional>
#include <type_traits>
#include <utility>      // std::move, std::forward, std::in_place

#include "basic_types.h"             // reg
#include "base/chunkiter_slots.hpp"  // ::chunkiter::detail::slot_buffer
#include "base/chunkiter_tools.hpp"  // RB_FORCEINLINE, RB_UNLIKELY, macros
#include "base/chunkiter_view.hpp"   // ::chunkiter::const_slot_view
#include "source.hpp"                // is_source_v, size_bounds, capabilities

namespace chunkiter {

enum class chunker_state : u8 {
    producing, // more chunks may follow
    exhausted, // source ended cleanly; leftover (if any) is live
    failed,    // source reported a failure (or threw); leftover (if any) is live
    retired    // leftover taken or chunker moved from; no source, no live slots
};

template<class Chunker>
class chunk_iterator;

struct chunk_sentinel {};

/* =======================================================================
 * chunker<Source, N>
 * ======================================================================= */
template<class Source, reg N>
class chunker
{
public:
    using source_type   = Source;
    using value_type    = typename Source::value_type;
    using size_type     = reg;
    using chunk_type    = std::array<value_type, N>;
    using leftover_type = std::array<std::optional<value_type>, N>;
    using leftover_view = const_slot_view<value_type, size_type>;
    using iterator      = chunk_iterator<chunker>;
    using sentinel      = chunk_sentinel;

    static constexpr size_type kChunkSize = N;

    // --------------------------------------------------------------------------
    // Static Assertions
    // --------------------------------------------------------------------------
    static_assert(is_source_v<Source>,
                  "[chunkiter::chunker]: Source must expose value_type and std::optional<value_type> next().");
    static_assert(std::is_move_constructible_v<Source>,
                  "[chunkiter::chunker]: Source must be move-constructible.");

#if (CHUNKITER_ENABLE_EXCEPTIONS == 0)
    static_assert(std::is_nothrow_move_constructible_v<value_type>,
                  "[chunkiter::chunker]: no-exceptions mode requires a noexcept move constructor.");
#endif

private:
    using slots_type = detail::slot_buffer<value_type, N>;

    // Declaration order matters: slots_ is destroyed before source_.
    std::optional<Source> source_;
    slots_type            slots_{};
    chunker_state         state_ = chunker_state::producing;

public:
    // --------------------------------------------------------------------------
    // Ctors / Assignment
    // --------------------------------------------------------------------------
    explicit chunker(Source source)
        : source_(std::in_place, std::move(source))
    {}

    template<class... Args>
    explicit chunker(std::in_place_t, Args&&... args)
        : source_(std::in_place, std::forward<Args>(args)...)
    {}

    ~chunker() noexcept = default;

    // Move-only
    chunker(const chunker&)            = delete;
    chunker& operator=(const chunker&) = delete;

    chunker(chunker&& other) noexcept(std::is_nothrow_move_constructible_v<Source> &&
                                      std::is_nothrow_move_constructible_v<value_type>)
        : source_(std::move(other.source_))
        , slots_(std::move(other.slots_))
        , state_(other.state_)
    {
        other.retire_();
    }

    chunker& operator=(chunker&& other) noexcept(std::is_nothrow_move_constructible_v<Source> &&
                                                 std::is_nothrow_move_constructible_v<value_type>) {
        if (this != &other) {
            // Own teardown first: live slots, then the source.
            slots_.clear();
            source_.reset();

            if (other.source_) {
                source_.emplace(std::move(*other.source_));
            }
            slots_ = std::move(other.slots_);
            state_ = other.state_;
            other.retire_();
        }
        return *this;
    }

    // --------------------------------------------------------------------------
    // State
    // --------------------------------------------------------------------------
    [[nodiscard]] static constexpr size_type chunk_size() noexcept { return kChunkSize; }

    [[nodiscard]] RB_FORCEINLINE chunker_state state() const noexcept { return state_; }
    [[nodiscard]] RB_FORCEINLINE bool producing() const noexcept { return state_ == chunker_state::producing; }
    [[nodiscard]] RB_FORCEINLINE bool done() const noexcept { return state_ != chunker_state::producing; }
    [[nodiscard]] RB_FORCEINLINE bool failed() const noexcept { return state_ == chunker_state::failed; }
    [[nodiscard]] RB_FORCEINLINE bool retired() const noexcept { return state_ == chunker_state::retired; }

    // Read-only access to the wrapped source (e.g. to inspect a stream).
    // nullptr once retired.
    [[nodiscard]] const Source* source() const noexcept {
        return source_ ? &*source_ : nullptr;
    }

    // --------------------------------------------------------------------------
    // Production
    // --------------------------------------------------------------------------
    [[nodiscard]] std::optional<chunk_type> next() {
        if (RB_UNLIKELY(!producing())) {
            if (RB_UNLIKELY(retired())) {
                misuse_("chunker::next() on a retired chunker");
            }
            return std::nullopt;
        }
        if constexpr (N == 0) {
            return chunk_type{};
        } else {
            if (!fill_()) {
                return std::nullopt;
            }
            return hand_out_();
        }
    }

    // Assigns the next chunk into 'out'. Returns false at end of production
    // ('out' untouched).
    template<class U = value_type, typename = std::enable_if_t<std::is_move_assignable_v<U>>>
    [[nodiscard]] bool try_next(chunk_type& out) {
        std::optional<chunk_type> c = next();
        if (!c) {
            return false;
        }
        out = std::move(*c);
        return true;
    }

    // --------------------------------------------------------------------------
    // Bound reporting (only when the source offers it)
    // --------------------------------------------------------------------------

    // Remaining full chunks: source bounds floor-divided by N.
    template<class S = Source, typename = std::enable_if_t<has_size_hint_v<S>>>
    [[nodiscard]] size_bounds size_hint() const {
        if (done()) {
            return size_bounds::exact(0);
        }
        return source_->size_hint().divided_by(kChunkSize);
    }

    // Remaining full chunks: exact source count floor-divided by N.
    template<class S = Source, typename = std::enable_if_t<has_exact_size_v<S> && (N > 0)>>
    [[nodiscard]] size_type exact_size() const {
        if (done()) {
            return 0;
        }
        return static_cast<size_type>(source_->exact_size()) / kChunkSize;
    }

    // --------------------------------------------------------------------------
    // Leftover
    // --------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE size_type leftover_size() const noexcept { return slots_.size(); }

    [[nodiscard]] leftover_view peek_leftover() const noexcept {
        return leftover_view(slots_.data(), slots_.size());
    }

#if CHUNKITER_HAS_SPAN
    [[nodiscard]] std::span<const value_type> leftover_span() const noexcept {
        return { slots_.data(), slots_.size() };
    }
#endif

    // Terminal: moves the live slots out, finalizes the source, retires.
    [[nodiscard]] leftover_type take_leftover() && {
        if (RB_UNLIKELY(retired())) {
            misuse_("chunker::take_leftover() on a retired chunker");
        }
        leftover_type out = slots_.take_optional();
        retire_();
        return out;
    }

    // --------------------------------------------------------------------------
    // Iteration (input range over full chunks)
    // --------------------------------------------------------------------------
    [[nodiscard]] iterator begin() { return iterator(*this); }
    [[nodiscard]] sentinel end() const noexcept { return sentinel{}; }

private:
    // Pulls until the buffer is full. false == end of production.
    [[nodiscard]] bool fill_() {
        CHUNKITER_TRY {
            while (!slots_.full()) {
                std::optional<value_type> item = source_->next();
                if (RB_UNLIKELY(!item)) {
                    end_production_();
                    return false;
                }
                // live is bumped only after the value is constructed.
                (void)slots_.emplace_back(std::move(*item));
            }
        } CHUNKITER_CATCH_ALL {
            state_ = chunker_state::failed;
            CHUNKITER_RETHROW;
        }
        return true;
    }

    [[nodiscard]] std::optional<chunk_type> hand_out_() {
        if constexpr (std::is_nothrow_move_constructible_v<value_type>) {
            return std::optional<chunk_type>(slots_.take_all());
        } else {
            // Slots are released only once the chunk is built.
            std::optional<chunk_type> out;
            CHUNKITER_TRY {
                out.emplace(slots_.make_chunk());
            } CHUNKITER_CATCH_ALL {
                if constexpr (!slots_type::kStrongHandOut) {
                    slots_.clear();
                    state_ = chunker_state::failed;
                }
                CHUNKITER_RETHROW;
            }
            slots_.clear();
            return out;
        }
    }

    [[noreturn]] static RB_NOINLINE void misuse_(const char* what) {
        (void)what;
        CHUNKITER_ON_MISUSE(what);
    }

    RB_NOINLINE void end_production_() noexcept {
        state_ = chunker_state::exhausted;
        if constexpr (has_failed_v<Source>) {
            if (source_->failed()) {
                state_ = chunker_state::failed;
            }
        }
    }

    void retire_() noexcept {
        slots_.clear();
        source_.reset();
        state_ = chunker_state::retired;
    }
};

/* =======================================================================
 * chunk_iterator<Chunker>
 *
 * Single-pass input iterator over the full chunks of a chunker. Each
 * increment pulls the next chunk; comparing equal to chunk_sentinel means
 * production has ended.
 * ======================================================================= */
template<class Chunker>
class chunk_iterator
{
public:
    using value_type        = typename Chunker::chunk_type;
    using difference_type   = std::ptrdiff_t;
    using reference         = value_type&;
    using pointer           = value_type*;
    using iterator_category = std::input_iterator_tag;

    chunk_iterator() noexcept = default;

    explicit chunk_iterator(Chunker& owner)
        : owner_(&owner)
    {
        fetch_();
    }

    [[nodiscard]] reference operator*() const noexcept {
        CHUNKITER_ASSERT(current_.has_value());
        return *current_;
    }

    [[nodiscard]] pointer operator->() const noexcept {
        CHUNKITER_ASSERT(current_.has_value());
        return &*current_;
    }

    chunk_iterator& operator++() {
        fetch_();
        return *this;
    }

    void operator++(int) { fetch_(); }

    [[nodiscard]] bool at_end() const noexcept { return !current_.has_value(); }

    friend bool operator==(const chunk_iterator& it, chunk_sentinel) noexcept { return it.at_end(); }
    friend bool operator!=(const chunk_iterator& it, chunk_sentinel) noexcept { return !it.at_end(); }
    friend bool operator==(chunk_sentinel, const chunk_iterator& it) noexcept { return it.at_end(); }
    friend bool operator!=(chunk_sentinel, const chunk_iterator& it) noexcept { return !it.at_end(); }

private:
    void fetch_() {
        current_.reset();
        if (owner_ == nullptr) {
            return;
        }
        std::optional<value_type> c = owner_->next();
        if (c) {
            current_.emplace(std::move(*c));
        }
    }

    Chunker* owner_{nullptr};
    mutable std::optional<value_type> current_{};
};

} // namespace chunkiter

#endif /* CHUNKITER_CHUNKER_HPP_ */

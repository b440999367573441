/*
 * chunkiter_slots.hpp
 *
 * Fixed-capacity staging buffer with a live-count prefix.
 *
 * Layout:
 * - N slots of raw, suitably aligned storage for T (no T is constructed up front,
 *   T does not have to be default-constructible).
 * - live_ is the single source of truth: slots [0..live_) hold constructed
 *   objects, slots [live_..N) are raw memory and are never read or destroyed.
 *
 * Lifetime rules:
 * - emplace_back() constructs first and bumps live_ afterwards. If the
 *   constructor throws, live_ is unchanged and the slot stays raw.
 * - take_all() / take_optional() move the live values out, destroy the
 *   moved-from objects and reset live_ to 0 before returning.
 * - make_chunk() builds a chunk without releasing the slots. Values are
 *   copied when T is copyable and its move may throw, so a throw leaves the
 *   block intact. The caller releases the slots with clear() on success.
 * - The destructor destroys exactly [0..live_).
 *
 * Concurrency:
 * - Not thread-safe. Owned exclusively by one chunker.
 */

#ifndef CHUNKITER_SLOTS_HPP_
#define CHUNKITER_SLOTS_HPP_

#include <array>
#include <cstddef>      // std::byte
#include <cstring>      // std::memcpy
#include <optional>
#include <type_traits>
#include <utility>      // std::move, std::index_sequence

#include "basic_types.h"        // reg
#include "chunkiter_object.hpp" // construct_at, destroy_at
#include "chunkiter_tools.hpp"  // RB_FORCEINLINE, CHUNKITER_ASSERT

namespace chunkiter::detail {

template<class T, reg Capacity>
class slot_buffer
{
public:
    using value_type      = T;
    using size_type       = reg;
    using pointer         = value_type*;
    using const_pointer   = const value_type*;
    using reference       = value_type&;
    using const_reference = const value_type&;

    using chunk_type      = std::array<value_type, Capacity>;
    using leftover_type   = std::array<std::optional<value_type>, Capacity>;

    static constexpr size_type kCapacity = Capacity;

    // A hand-out may be a single memcpy of the whole block.
    static constexpr bool kBulkTransfer =
        std::is_trivially_copyable_v<value_type> &&
        std::is_trivially_default_constructible_v<value_type>;

    // make_chunk() leaves the staged values untouched if it throws.
    static constexpr bool kStrongHandOut =
        std::is_nothrow_move_constructible_v<value_type> ||
        std::is_copy_constructible_v<value_type>;

    // --------------------------------------------------------------------------
    // Static Assertions
    // --------------------------------------------------------------------------
    static_assert(std::is_object_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                  "[chunkiter::slot_buffer]: T must be a non-cv object type.");
    static_assert(std::is_move_constructible_v<T>,
                  "[chunkiter::slot_buffer]: T must be move-constructible.");
    static_assert(std::is_nothrow_destructible_v<T>,
                  "[chunkiter::slot_buffer]: T must have a noexcept destructor.");

private:
    // Capacity 0 still gets one (never used) slot so the array is well-formed.
    static constexpr size_type kStorageSlots = (Capacity == 0) ? 1u : Capacity;

    alignas(value_type) std::byte storage_[kStorageSlots * sizeof(value_type)];
    size_type live_ = 0; // Constructed prefix [0..kCapacity]

public:
    // --------------------------------------------------------------------------
    // Ctors / Assignment
    // --------------------------------------------------------------------------
    slot_buffer() noexcept = default;

    ~slot_buffer() noexcept { clear(); }

    slot_buffer(const slot_buffer&)            = delete;
    slot_buffer& operator=(const slot_buffer&) = delete;

    // Moves every live value of 'other' into this buffer; 'other' ends empty.
    slot_buffer(slot_buffer&& other) noexcept(std::is_nothrow_move_constructible_v<value_type>)
    {
        move_from(other);
    }

    slot_buffer& operator=(slot_buffer&& other) noexcept(std::is_nothrow_move_constructible_v<value_type>)
    {
        if (this != &other) {
            clear();
            move_from(other);
        }
        return *this;
    }

    // --------------------------------------------------------------------------
    // Capacity & State
    // --------------------------------------------------------------------------
    [[nodiscard]] RB_FORCEINLINE bool empty() const noexcept { return live_ == 0; }
    [[nodiscard]] RB_FORCEINLINE bool full()  const noexcept { return live_ >= kCapacity; }
    [[nodiscard]] RB_FORCEINLINE size_type size() const noexcept { return live_; }
    [[nodiscard]] static constexpr size_type capacity() noexcept { return kCapacity; }
    [[nodiscard]] RB_FORCEINLINE size_type free() const noexcept { return static_cast<size_type>(kCapacity - live_); }

    // Destroys the live prefix in index order.
    void clear() noexcept {
        if constexpr (!std::is_trivially_destructible_v<value_type>) {
            for (size_type i = 0; i < live_; ++i) {
                ::chunkiter::detail::destroy_at(slot_ptr(i));
            }
        }
        live_ = 0;
    }

    // --------------------------------------------------------------------------
    // Data Access (live prefix only)
    // --------------------------------------------------------------------------
    // nullptr while empty: there is no object to point at.
    [[nodiscard]] RB_FORCEINLINE pointer data() noexcept { return empty() ? nullptr : slot_ptr(0); }
    [[nodiscard]] RB_FORCEINLINE const_pointer data() const noexcept { return empty() ? nullptr : slot_ptr(0); }

    [[nodiscard]] RB_FORCEINLINE reference operator[](const size_type i) noexcept {
        CHUNKITER_ASSERT(i < live_);
        return *slot_ptr(i);
    }
    [[nodiscard]] RB_FORCEINLINE const_reference operator[](const size_type i) const noexcept {
        CHUNKITER_ASSERT(i < live_);
        return *slot_ptr(i);
    }

    // --------------------------------------------------------------------------
    // Producer Interface
    // --------------------------------------------------------------------------
    template<class... Args>
    RB_FORCEINLINE reference emplace_back(Args&&... args) noexcept(
        std::is_nothrow_constructible_v<value_type, Args&&...>)
    {
        CHUNKITER_ASSERT(!full());
        pointer p = ::chunkiter::detail::construct_at<value_type>(raw_slot(live_), std::forward<Args>(args)...);
        ++live_;
        return *p;
    }

    // --------------------------------------------------------------------------
    // Hand-out
    // --------------------------------------------------------------------------

    // Moves all N values into a chunk and empties the buffer.
    [[nodiscard]] chunk_type take_all() noexcept(std::is_nothrow_move_constructible_v<value_type>) {
        CHUNKITER_ASSERT(full());
        if constexpr (kCapacity == 0) {
            return chunk_type{};
        } else if constexpr (kBulkTransfer) {
            chunk_type out;
            std::memcpy(out.data(), storage_, sizeof(storage_));
            live_ = 0;
            return out;
        } else {
            return take_all_(std::make_index_sequence<kCapacity>{});
        }
    }

    // Builds a chunk from the full block; the slots stay live.
    // Moves when the move cannot throw (or T is move-only), copies otherwise.
    [[nodiscard]] chunk_type make_chunk() {
        CHUNKITER_ASSERT(full());
        if constexpr (kCapacity == 0) {
            return chunk_type{};
        } else {
            return make_chunk_(std::make_index_sequence<kCapacity>{});
        }
    }

    // Moves the live prefix out as engaged optionals; the tail stays disengaged.
    [[nodiscard]] leftover_type take_optional() noexcept(std::is_nothrow_move_constructible_v<value_type>) {
        leftover_type out{};
        for (size_type i = 0; i < live_; ++i) {
            out[i].emplace(std::move(*slot_ptr(i)));
        }
        clear();
        return out;
    }

private:
    template<std::size_t... I>
    [[nodiscard]] chunk_type make_chunk_(std::index_sequence<I...>) {
        return chunk_type{{ std::move_if_noexcept(*slot_ptr(I))... }};
    }

    template<std::size_t... I>
    [[nodiscard]] chunk_type take_all_(std::index_sequence<I...>) {
        chunk_type out{{ std::move(*slot_ptr(I))... }};
        // Moved-from objects are still alive in the slots.
        clear();
        return out;
    }

    void move_from(slot_buffer& other) noexcept(std::is_nothrow_move_constructible_v<value_type>) {
        if constexpr (kBulkTransfer) {
            if (other.live_ != 0) {
                std::memcpy(storage_, other.storage_, other.live_ * sizeof(value_type));
            }
            live_ = other.live_;
            other.live_ = 0;
        } else {
            for (size_type i = 0; i < other.live_; ++i) {
                (void)emplace_back(std::move(*other.slot_ptr(i)));
            }
            other.clear();
        }
    }

    [[nodiscard]] RB_FORCEINLINE void* raw_slot(const size_type i) noexcept {
        return storage_ + i * sizeof(value_type);
    }

    // std::launder is needed because the storage is reused via placement-new.
    [[nodiscard]] RB_FORCEINLINE pointer slot_ptr(const size_type i) noexcept {
        return std::launder(reinterpret_cast<pointer>(storage_ + i * sizeof(value_type)));
    }
    [[nodiscard]] RB_FORCEINLINE const_pointer slot_ptr(const size_type i) const noexcept {
        return std::launder(reinterpret_cast<const_pointer>(storage_ + i * sizeof(value_type)));
    }
};

} // namespace chunkiter::detail

#endif /* CHUNKITER_SLOTS_HPP_ */

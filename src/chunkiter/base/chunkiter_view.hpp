/*
 * chunkiter_view.hpp
 *
 * Read-only view over the live prefix of a staging buffer.
 *
 * This header provides:
 *  - const_slot_view<T, Size>  (contiguous, non-owning, non-consuming)
 *
 * The view is invalidated by any production call on the chunker it came from.
 */

#ifndef CHUNKITER_VIEW_HPP_
#define CHUNKITER_VIEW_HPP_

#include <cstddef>     // std::ptrdiff_t
#include <iterator>    // std::reverse_iterator
#include <type_traits> // std::is_unsigned_v

#include "basic_types.h"       // reg
#include "chunkiter_tools.hpp" // CHUNKITER_ASSERT, CHUNKITER_HAS_SPAN

namespace chunkiter {

template<class T, class Size = reg>
class const_slot_view
{
    static_assert(std::is_unsigned_v<Size>,
                  "[const_slot_view]: Size must be an unsigned integer type");

public:
    using value_type             = T;
    using size_type              = Size;
    using difference_type        = std::ptrdiff_t;
    using const_reference        = const T&;
    using const_pointer          = const T*;
    using const_iterator         = const_pointer;
    using iterator               = const_iterator; // Always const.
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    const_slot_view() noexcept = default;

    const_slot_view(const_pointer data, size_type size) noexcept
        : data_(data)
        , size_(size)
    {}

    const_iterator begin() const noexcept { return data_; }
    const_iterator end() const noexcept { return data_ + size_; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend() const noexcept { return end(); }

    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }

    [[nodiscard]] const_pointer data() const noexcept { return data_; }
    [[nodiscard]] size_type size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] const_reference operator[](const size_type i) const noexcept {
        CHUNKITER_ASSERT(i < size_);
        return data_[i];
    }

    [[nodiscard]] const_reference front() const noexcept { CHUNKITER_ASSERT(!empty()); return data_[0]; }
    [[nodiscard]] const_reference back() const noexcept { CHUNKITER_ASSERT(!empty()); return data_[size_ - 1]; }

#if CHUNKITER_HAS_SPAN
    [[nodiscard]] std::span<const value_type> span() const noexcept { return { data_, size_ }; }
#endif

private:
    const_pointer data_{nullptr};
    size_type     size_{0};
};

} // namespace chunkiter

#endif /* CHUNKITER_VIEW_HPP_ */

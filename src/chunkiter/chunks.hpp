/*
 * chunks.hpp
 *
 * Attach helpers: build a chunker<Source, N> from whatever the caller holds.
 *
 *   auto c = chunkiter::chunks<3>(std::move(vec));   // owns vec, moves items out
 *   auto c = chunkiter::chunks<3>(vec);              // copies items, vec untouched
 *   auto c = chunkiter::chunks<3>(first, last);      // iterator pair
 *   auto c = chunkiter::generate_chunks<3>(fn);      // fn() -> std::optional<T>
 *   auto c = chunkiter::read_chunks<3, int>(stream); // operator>> from a stream
 *   auto c = chunkiter::make_chunker<3>(my_source);  // any source type
 */

#ifndef CHUNKITER_CHUNKS_HPP_
#define CHUNKITER_CHUNKS_HPP_

#include <iterator>    // std::begin, std::end
#include <type_traits>
#include <utility>     // std::move, std::forward

#include "basic_types.h" // reg
#include "chunker.hpp"
#include "source.hpp"

namespace chunkiter {

template<reg N, class Source>
[[nodiscard]] chunker<std::decay_t<Source>, N> make_chunker(Source&& source)
{
    static_assert(is_source_v<std::decay_t<Source>>,
                  "[chunkiter::make_chunker]: argument is not a source.");
    return chunker<std::decay_t<Source>, N>(std::forward<Source>(source));
}

template<reg N, class It, class Sent>
[[nodiscard]] chunker<iterator_source<It, Sent>, N> chunks(It first, Sent last)
{
    return chunker<iterator_source<It, Sent>, N>(
        iterator_source<It, Sent>(std::move(first), std::move(last)));
}

// Lvalue range: walks it by iterator and copies the items (the range must
// outlive the chunker). Rvalue container: the chunker takes ownership and
// moves the items out.
template<reg N, class Range>
[[nodiscard]] auto chunks(Range&& range)
{
    if constexpr (std::is_lvalue_reference_v<Range>) {
        using It = decltype(std::begin(range));
        using Sent = decltype(std::end(range));
        return chunker<iterator_source<It, Sent>, N>(
            iterator_source<It, Sent>(std::begin(range), std::end(range)));
    } else {
        using C = std::remove_cv_t<Range>;
        return chunker<container_source<C>, N>(
            std::in_place, std::move(range));
    }
}

template<reg N, class F>
[[nodiscard]] chunker<generator_source<std::decay_t<F>>, N> generate_chunks(F&& fn)
{
    return chunker<generator_source<std::decay_t<F>>, N>(
        generator_source<std::decay_t<F>>(std::forward<F>(fn)));
}

template<reg N, class T, class CharT, class Traits>
[[nodiscard]] chunker<stream_source<T, CharT, Traits>, N> read_chunks(std::basic_istream<CharT, Traits>& in)
{
    return chunker<stream_source<T, CharT, Traits>, N>(std::in_place, in);
}

} // namespace chunkiter

#endif /* CHUNKITER_CHUNKS_HPP_ */

#pragma once

#include <cstddef>

#include <algorithm>
#include <iterator>
#include <type_traits>

#include <boost/range/iterator_range.hpp>

#include "aux/chunk.hpp"
#include "aux/iterator_concept.hpp"

namespace binfind
{

template <typename Iterator, typename = void>
class RangeChunkReader
{
};

///
/// @brief      This class describes a chunk reader walking a contiguous region
///             of bytes, a memory mapped file for instance, window by window
///
/// @details    Windows are laid out the same way StreamChunkReader lays them out
///             for a stream with the same content
///
template <typename Iterator>
class RangeChunkReader<Iterator, typename std::enable_if<detail::is_random_access_byte_iterator<Iterator>>::type>
{
public:
    using iterator = Iterator;
    using range_t  = boost::iterator_range<Iterator>;
    using chunk_t  = detail::Chunk<range_t>;

    template <typename Range>
    explicit RangeChunkReader(Range const &source_range, size_t chunk_size = kDefaultChunkSize, size_t overlap = 0)
        : RangeChunkReader(std::begin(source_range), std::end(source_range), chunk_size, overlap)
    {
    }

    explicit RangeChunkReader(Iterator first, Iterator last, size_t chunk_size = kDefaultChunkSize, size_t overlap = 0)
        : first_(first)
        , last_(last)
        , current_pos_(first_)
        , chunk_size_(static_cast<std::ptrdiff_t>(std::clamp(chunk_size, static_cast<size_t>(1), kMaxChunkSize)))
        , overlap_(static_cast<std::ptrdiff_t>(overlap))
    {
    }

    chunk_t operator()() noexcept
    {
        chunk_t chunk;
        eorange_ = last_ == current_pos_;
        if (!eorange_)
        {
            auto const consumed = static_cast<std::ptrdiff_t>(std::distance(first_, current_pos_));
            auto const carried  = std::min(overlap_, consumed);
            auto const left     = static_cast<std::ptrdiff_t>(std::distance(current_pos_, last_));
            auto const window_last = std::next(current_pos_, std::min(chunk_size_, left));

            chunk.offset = static_cast<pos_t>(consumed - carried);
            chunk.data   = boost::make_iterator_range(std::prev(current_pos_, carried), window_last);
            current_pos_ = window_last;
        }
        return chunk;
    }

    operator bool() const noexcept { return !eorange(); }
    bool operator!() const noexcept { return eorange(); }

    bool eorange() const noexcept { return eorange_; }

private:
    Iterator       first_;
    Iterator       last_;
    Iterator       current_pos_;
    std::ptrdiff_t chunk_size_;
    std::ptrdiff_t overlap_;
    bool           eorange_ = false;
};

} // namespace binfind

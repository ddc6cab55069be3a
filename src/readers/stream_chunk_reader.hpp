#pragma once

#include <cstddef>

#include <algorithm>
#include <istream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/range/iterator_range.hpp>

#include "aux/chunk.hpp"
#include "aux/errors.hpp"

namespace binfind
{

///
/// @brief      This class describes a stream chunk reader that reads a stream
///             block by block of a fixed size
///
/// @details    Every chunk returned is a window over the internal buffer:
///             the last 'overlap' bytes of the previous window followed by the bytes
///             just read. The window stays valid until the next call
///
class StreamChunkReader
{
public:
    using range_t = boost::iterator_range<byte_t const *>;
    using chunk_t = detail::Chunk<range_t>;

    ///
    /// @brief      Constructs stream chunk reader
    ///
    /// @param[in]  is          Input stream, should be opened in binary mode
    /// @param[in]  chunk_size  The number of bytes requested from the stream per read,
    ///                         kept within [1, kMaxChunkSize]
    /// @param[in]  overlap     The number of trailing bytes of a window carried over
    ///                         to the front of the next one
    ///
    explicit StreamChunkReader(std::istream &is, size_t chunk_size = kDefaultChunkSize, size_t overlap = 0)
        : is_(is)
        , chunk_size_(std::clamp(chunk_size, static_cast<size_t>(1), kMaxChunkSize))
        , overlap_(overlap)
        , buffer_(overlap_ + chunk_size_)
    {
    }

    ///
    /// @brief      Reads the next block from the stream
    ///
    /// @throws     ReadError if the stream has failed for a reason other than its end
    ///
    /// @return     The window with its absolute offset, empty once the stream is exhausted
    ///
    chunk_t operator()()
    {
        chunk_t chunk;

        auto const carried = std::min(overlap_, window_size_);
        if (carried < window_size_)
            std::copy(std::next(buffer_.begin(), window_size_ - carried), std::next(buffer_.begin(), window_size_), buffer_.begin());

        is_.read(reinterpret_cast<char *>(buffer_.data() + carried), static_cast<std::streamsize>(chunk_size_));
        if (is_.bad())
            throw ReadError("reading failed at offset " + std::to_string(consumed_));

        auto const bytes_read = static_cast<size_t>(is_.gcount());
        eos_ = 0 == bytes_read;
        if (!eos_)
        {
            window_size_ = carried + bytes_read;
            chunk.offset = consumed_ - carried;
            chunk.data   = boost::make_iterator_range(buffer_.data(), buffer_.data() + window_size_);
            consumed_ += bytes_read;
        }

        return chunk;
    }

    ///
    /// @brief      Bool conversion operator. Checks if the stream is not exhausted
    ///
    /// @returns    True if the stream is not finished yet, False otherwise
    ///
    operator bool() const noexcept { return !eos_; }

    ///
    /// @brief      Bool conversion operator. Checks if the stream is exhausted
    ///
    /// @returns    True if the stream is exhausted, False otherwise
    ///
    bool operator!() const noexcept { return eos_; }

    ///
    /// @brief      Gets the number of bytes read from the stream so far
    ///
    pos_t consumed() const noexcept { return consumed_; }

private:
    std::istream       &is_;
    size_t              chunk_size_;
    size_t              overlap_;
    std::vector<byte_t> buffer_;
    size_t              window_size_ = 0;
    pos_t               consumed_    = 0;
    bool                eos_         = false;
};

} // namespace binfind

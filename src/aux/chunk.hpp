#pragma once

#include <cstddef>
#include <cstdint>

#include <vector>

namespace binfind
{

using byte_t    = std::uint8_t;
using pattern_t = std::vector<byte_t>;
using pos_t     = std::uint64_t;

constexpr std::size_t kDefaultChunkSize = 4096;
// a window and its carried-over tail must fit in memory and in std::ptrdiff_t
constexpr std::size_t kMaxChunkSize = std::size_t{1} << 30;

namespace detail
{

///
/// @brief      A window of a source together with the absolute offset
///             of its first byte within the source
///
/// @tparam     Range   A range of bytes
///
template <typename Range>
struct Chunk
{
    pos_t offset = 0;
    Range data;
};

} // namespace detail

} // namespace binfind

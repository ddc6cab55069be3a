#pragma once

#include <cstddef>

#include <utility>

#include "aux/chunk.hpp"
#include "aux/chunk_handler.hpp"

namespace binfind::strat
{

///
/// @brief      Scans a source chunk by chunk with a tokenizer, the findings
///             are given to the sink as absolute offsets as soon as they are found
///
/// @details    This is the scan session of a single source: the reader keeps the
///             buffer and the number of bytes consumed, the tokenizer keeps the pattern.
///             Chunks are handled one by one in the order the reader produces them,
///             findings of a chunk come in ascending order, hence all the findings do
///
/// @param[in]  reader          A functor-like object that would be called to receive a chunk
///                             The reader is called until it is exhausted, what it is checked by calling operator bool()
///                             A reader may throw, a scan is aborted then, findings already sent stay sent
/// @param[in]  tokenizer       A tokenizer being called on each chunk to receive findings
/// @param[in]  findings_sink   A sink for the offset of each finding
///
/// @tparam     ChunkReader     A reader that will be fetching a chunk until reader's source has depleted
/// @tparam     ChunkTokenizer  A functor like tokenizer for a chunk fetched
/// @tparam     FindingsSink    A functor-like sink type for an offset
///
/// @return     The number of findings
///
template <typename ChunkReader, typename ChunkTokenizer, typename FindingsSink>
size_t sequential(ChunkReader reader, ChunkTokenizer tokenizer, FindingsSink findings_sink)
{
    detail::ChunkHandler<ChunkTokenizer, FindingsSink> handler(std::move(tokenizer), std::move(findings_sink));

    // process the input produced by the reader chunk by chunk
    for (auto chunk = reader(); reader; chunk = reader())
        handler(chunk);

    return handler.findings_count();
}

} // namespace binfind::strat

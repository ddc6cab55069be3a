#pragma once

#include <cstddef>

#include <utility>

#include <boost/function_output_iterator.hpp>

#include "aux/chunk.hpp"

namespace binfind::detail
{

///
/// @brief      Handler of the chunks of one source: tokenizes every window and
///             passes absolute offsets of the findings to the sink
///
/// @tparam     Tokenizer      A tokenizer giving positions of the findings within a window
/// @tparam     FindingsSink   A functor-like sink called with a pos_t per finding
///
template <typename Tokenizer, typename FindingsSink>
class ChunkHandler
{
public:
    ChunkHandler(Tokenizer tokenizer, FindingsSink sink)
        : tokenizer_(std::move(tokenizer)), sink_(std::move(sink))
    {
    }

    template <typename Range>
    void operator()(Chunk<Range> const &chunk)
    {
        findings_count_ += tokenizer_(chunk.data, boost::make_function_output_iterator([this, offset = chunk.offset](size_t pos) {
                                          sink_(offset + pos);
                                      }));
    }

    size_t findings_count() const noexcept { return findings_count_; }

private:
    Tokenizer    tokenizer_;
    FindingsSink sink_;
    size_t       findings_count_ = 0;
};

} // namespace binfind::detail

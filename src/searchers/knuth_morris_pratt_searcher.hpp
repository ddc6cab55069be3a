#pragma once

#include <boost/algorithm/searching/knuth_morris_pratt.hpp>

#include "searchers/boosted_searcher.hpp"

namespace binfind
{

///
/// @brief      Searcher class that uses a pattern given to seek a subrange in an input range
///
/// @details    Searching algorithm is Knuth-Morris-Pratt borrowed from boost library,
///             linear in the size of the input whatever the pattern is
///
/// @tparam     Pattern
///
template <typename Pattern>
class KnuthMorrisPrattSearcher : public detail::BoostedSearcher<Pattern, boost::algorithm::knuth_morris_pratt>
{
public:
    using detail::BoostedSearcher<Pattern, boost::algorithm::knuth_morris_pratt>::BoostedSearcher;
};

} // namespace binfind

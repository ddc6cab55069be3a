#pragma once

#include <iterator>
#include <memory>
#include <utility>

#include <boost/range/iterator_range.hpp>

namespace binfind
{

namespace searchers { struct Boosted {}; } // namespace searchers

namespace detail
{

///
/// @brief      Searcher class that adapts a searching algorithm object borrowed
///             from boost library (boost::algorithm::boyer_moore, knuth_morris_pratt, etc.)
///             to the searchers' interface
///
/// @details    The algorithm object keeps iterators into the pattern, so both are
///             shared among the copies of the searcher
///
/// @tparam     Pattern
/// @tparam     Algorithm   A boost searching algorithm class template
///
template <typename Pattern, template <typename...> class Algorithm>
class BoostedSearcher
{
public:
    using algorithm_t = Algorithm<typename Pattern::const_iterator>;

    explicit BoostedSearcher(Pattern pattern)
        : pattern_(std::make_shared<Pattern const>(std::move(pattern)))
        , algorithm_(std::make_shared<algorithm_t const>(pattern_->begin(), pattern_->end()))
    {
    }

    ///
    /// @brief      Finds the first occurrence of the pattern in the input range
    ///
    /// @param[in]  first   The first random access iterator of the range to explore
    /// @param[in]  last    The last random access iterator of the range to explore
    ///
    /// @tparam     RandomAccessIterator   Random Access Iterator
    ///
    /// @return     A subrange of input's iterators that meets the pattern,
    ///             an empty range at last if there is no occurrence
    ///
    template <typename RandomAccessIterator>
    auto operator()(RandomAccessIterator first, RandomAccessIterator last) const
    {
        if (pattern_->empty())
            return boost::make_iterator_range(last, last);

        auto match = (*algorithm_)(first, last);
        return boost::make_iterator_range(match.first, match.second);
    }

    template <typename Range>
    auto operator()(Range const &input) const { return (*this)(std::begin(input), std::end(input)); }

private:
    std::shared_ptr<Pattern const>     pattern_;
    std::shared_ptr<algorithm_t const> algorithm_;
};

} // namespace detail

} // namespace binfind

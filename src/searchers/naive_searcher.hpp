#pragma once

#include <cstddef>

#include <algorithm>
#include <iterator>
#include <utility>

#include <boost/range/iterator_range.hpp>

namespace binfind
{

///
/// @brief      Searcher class that uses a pattern given to seek a subrange in an input range
///             Searching algorithm is brute-force: the pattern is compared byte by byte
///             at every start position
///
/// @tparam     Pattern
///
template <typename Pattern>
class NaiveSearcher
{
public:
    ///
    /// @brief      Constructs the searcher based on the pattern
    ///
    /// @param[in]  pattern  The pattern
    ///
    explicit NaiveSearcher(Pattern pattern) noexcept
        : pattern_(std::move(pattern))
    {
    }

    ///
    /// @brief      Finds the first occurrence of the pattern in the input range
    ///
    /// @param[in]  first   The first forward iterator of the range to explore
    /// @param[in]  last    The last forward iterator of the range to explore
    ///
    /// @tparam     ForwardIt   Forward iterator
    ///
    /// @return     A subrange of input's iterators that meets the pattern,
    ///             an empty range at last if there is no occurrence
    ///
    template <typename ForwardIt>
    auto operator()(ForwardIt first, ForwardIt last) const noexcept
    {
        auto const pattern_size = static_cast<std::ptrdiff_t>(pattern_.size());
        auto       left         = static_cast<std::ptrdiff_t>(std::distance(first, last));

        // every start position up to left - pattern_size inclusively is tried
        for (; 0 < pattern_size && pattern_size <= left; ++first, --left)
        {
            if (std::equal(pattern_.begin(), pattern_.end(), first))
                return boost::make_iterator_range(first, std::next(first, pattern_size));
        }

        return boost::make_iterator_range(last, last);
    }

    ///
    /// @brief      Finds the first occurrence of the pattern in the input range
    ///
    /// @param[in]  input   Input range to explore
    ///
    /// @tparam     Range
    ///
    /// @return     A subrange that meets the pattern
    ///
    template <typename Range>
    auto operator()(Range const &input) const noexcept
    {
        return (*this)(std::begin(input), std::end(input));
    }

private:
    Pattern pattern_;
};

} // namespace binfind

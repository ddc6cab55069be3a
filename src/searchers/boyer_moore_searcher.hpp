#pragma once

#include <cstddef>

#include <algorithm>
#include <array>
#include <iterator>
#include <limits>
#include <utility>

#include <boost/algorithm/searching/boyer_moore.hpp>
#include <boost/range/iterator_range.hpp>

#include "searchers/boosted_searcher.hpp"

namespace binfind
{

///
/// @brief      Searcher class that uses a pattern given to seek a subrange in an input range
///
/// @details    Searching algorithm is based on Boyer-Moore algorithm with
///             Bad Character Heuristic used
///
/// @tparam     Pattern     A container of bytes
/// @tparam     Variant     void for the own implementation,
///                         searchers::Boosted for the one borrowed from boost library
///
template <typename Pattern, typename Variant = void>
class BoyerMooreSearcher
{
public:
    ///
    /// @brief      Constructs the searcher based on the pattern
    ///
    /// @param[in]  pattern     The pattern that input ranges will be compared with
    ///
    explicit BoyerMooreSearcher(Pattern pattern) noexcept
        : pattern_(std::move(pattern))
    {
        last_occurrences_.fill(-1);
        // fill positions of the last occurrences of the bytes
        for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(pattern_.size()); ++i)
            last_occurrences_[pattern_[i]] = i;
    }

    ///
    /// @brief      Finds the first occurrence of the pattern in the input range
    ///
    /// @param[in]  first   The first bidirectional iterator of the range to explore
    /// @param[in]  last    The last bidirectional iterator of the range to explore
    ///
    /// @tparam     BidirIterator   Bidirectional iterator
    ///
    /// @return     A subrange of input's iterators that meets the pattern,
    ///             an empty range at last if there is no occurrence
    ///
    template <typename BidirIterator>
    auto operator()(BidirIterator first, BidirIterator last) const noexcept
    {
        auto const pattern_size = static_cast<std::ptrdiff_t>(pattern_.size());
        if (0 == pattern_size)
            return boost::make_iterator_range(last, last);

        while (pattern_size <= std::distance(first, last))
        {
            auto end_range = std::next(first, pattern_size);
            auto mism      = std::mismatch(pattern_.rbegin(), pattern_.rend(), std::make_reverse_iterator(end_range));
            if (pattern_.rend() == mism.first)
                return boost::make_iterator_range(first, end_range);

            // align the mismatched byte of the input with its last occurrence in the pattern
            // or move past it if the pattern lacks it, moving backwards is never allowed
            auto const mism_idx        = std::distance(mism.first, pattern_.rend()) - 1;
            auto const last_occurrence = last_occurrences_[*mism.second];
            first = std::next(first, std::max<std::ptrdiff_t>(1, mism_idx - last_occurrence));
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
    auto operator()(Range const &input) const noexcept { return (*this)(std::begin(input), std::end(input)); }

private:
    static constexpr size_t kMaxBytes = std::numeric_limits<unsigned char>::max() + 1;

    Pattern                                  pattern_;
    std::array<std::ptrdiff_t, kMaxBytes>    last_occurrences_;
};

///
/// @brief      Searcher class that uses a pattern given to seek a subrange in an input range
///
/// @details    Searching algorithm is based on Boyer-Moore algorithm borrowed from boost library
///
/// @tparam     Pattern
///
template <typename Pattern>
class BoyerMooreSearcher<Pattern, searchers::Boosted>
    : public detail::BoostedSearcher<Pattern, boost::algorithm::boyer_moore>
{
public:
    using detail::BoostedSearcher<Pattern, boost::algorithm::boyer_moore>::BoostedSearcher;
};

} // namespace binfind

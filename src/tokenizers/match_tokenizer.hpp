#pragma once

#include <cstddef>

#include <iterator>
#include <utility>

#include <boost/range/begin.hpp>
#include <boost/range/empty.hpp>

namespace binfind
{

///
/// @brief      A tokenizer that finds every occurrence of a pattern in a window
///             with the searcher given
///
/// @details    Occurrences may overlap: after each one the search resumes one byte
///             past its start, not past its end, so "AA" occurs in "AAAA" three times
///
/// @tparam     Searcher      A functor-like searcher called with two iterators of a window,
///                           returns the first match as a range, an empty one if there is none
///
template <typename Searcher>
class MatchTokenizer
{
public:
    explicit MatchTokenizer(Searcher searcher) noexcept
        : searcher_(std::move(searcher))
    {
    }

    ///
    /// @brief      Finds the occurrences in a window in ascending order
    ///
    /// @param[in]  window   The window to look through
    /// @param[in]  out      The output iterator receiving the position of each occurrence
    ///                      relative to the start of the window
    ///
    /// @tparam     Range
    /// @tparam     OutputIt
    ///
    /// @return     The number of occurrences
    ///
    template <typename Range, typename OutputIt>
    size_t operator()(Range const &window, OutputIt out)
    {
        auto const window_first = std::begin(window);
        auto const window_last  = std::end(window);

        size_t found = 0;
        for (auto first = window_first; first != window_last; ++found, ++out)
        {
            auto const match = searcher_(first, window_last);
            if (boost::empty(match))
                break;
            *out  = static_cast<size_t>(std::distance(window_first, boost::begin(match)));
            first = std::next(boost::begin(match));
        }
        return found;
    }

private:
    Searcher searcher_;
};

} // namespace binfind

#pragma once

#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/utility/string_view.hpp>

#include "aux/chunk.hpp"
#include "aux/errors.hpp"

namespace binfind
{

namespace detail
{

///
/// @brief      Decodes a contiguous hexadecimal string
///
/// @param[in]  digits  Hexadecimal digits, an even number of them, no separators
/// @param[out] bytes   Decoded bytes, untouched if the decoding fails
///
/// @return     True if every digit pair has been decoded, False otherwise
///
inline bool try_unhex(boost::string_view const digits, pattern_t &bytes)
{
    pattern_t decoded;
    decoded.reserve(digits.size() / 2);
    try
    {
        boost::algorithm::unhex(digits.begin(), digits.end(), std::back_inserter(decoded));
    }
    catch (boost::algorithm::hex_decode_error const &)
    {
        return false;
    }
    bytes = std::move(decoded);
    return true;
}

} // namespace detail

///
/// @brief      Parses a line of text into a pattern
///
/// @details    The whole trimmed line is tried as a hex string first ("deadbeef"),
///             then as whitespace separated bytes each of exactly two hex digits
///             with an optional 0x prefix ("0xDE 0xAD BE EF")
///
/// @param[in]  input  The line of text
///
/// @throws     InvalidPatternError if neither form matches or the pattern is empty
///
/// @return     The pattern
///
inline pattern_t parse_pattern(boost::string_view const input)
{
    auto const text = boost::algorithm::trim_copy(std::string(input.begin(), input.end()));
    if (text.empty())
        throw InvalidPatternError("pattern is empty", text);

    pattern_t pattern;
    if (detail::try_unhex(text, pattern))
        return pattern;

    std::vector<std::string> tokens;
    boost::algorithm::split(tokens, text, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

    pattern.reserve(tokens.size());
    for (auto const &token : tokens)
    {
        boost::string_view digits(token);
        if (boost::algorithm::istarts_with(token, "0x"))
            digits.remove_prefix(2);

        pattern_t byte;
        if (2 != digits.size() || !detail::try_unhex(digits, byte))
            throw InvalidPatternError("invalid byte format: " + token, text);
        pattern.push_back(byte.front());
    }

    return pattern;
}

///
/// @brief      Renders a pattern as contiguous upper-case hex digits, "DEADBEEF"
///
inline std::string hex_string(pattern_t const &pattern)
{
    std::string text;
    text.reserve(pattern.size() * 2);
    boost::algorithm::hex(pattern.begin(), pattern.end(), std::back_inserter(text));
    return text;
}

///
/// @brief      Renders a pattern as space separated upper-case bytes, "DE AD BE EF"
///
inline std::string format_pattern(pattern_t const &pattern)
{
    std::string text;
    text.reserve(pattern.size() * 3);
    for (auto it = pattern.begin(); it != pattern.end(); ++it)
    {
        if (it != pattern.begin())
            text.push_back(' ');
        boost::algorithm::hex(it, std::next(it), std::back_inserter(text));
    }
    return text;
}

} // namespace binfind

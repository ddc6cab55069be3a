#pragma once

#include <cstddef>

#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>

#include "aux/chunk.hpp"
#include "scanners/file_scanner.hpp"

namespace binfind
{

enum class Algorithm
{
    naive,
    boyer_moore,
    boost_boyer_moore,
    knuth_morris_pratt,
};

///
/// @brief      The application's parameters given through the command line
///
struct Options
{
    bool                         help      = false;
    Algorithm                    algorithm = Algorithm::naive;
    ScanSettings                 settings;
    // no pattern given means the pattern and the paths are to be asked for
    boost::optional<std::string> pattern;
    std::vector<std::string>     paths;

    bool interactive() const noexcept { return !pattern; }
};

///
/// @brief      Gets the algorithm by its name
///
/// @throws     std::invalid_argument if the name is unknown
///
inline Algorithm parse_algorithm(boost::string_view const name)
{
    if ("naive" == name)
        return Algorithm::naive;
    if ("boyer-moore" == name)
        return Algorithm::boyer_moore;
    if ("boost-boyer-moore" == name)
        return Algorithm::boost_boyer_moore;
    if ("kmp" == name)
        return Algorithm::knuth_morris_pratt;
    throw std::invalid_argument("unknown algorithm '" + name.to_string() + "'");
}

///
/// @brief      Parses a chunk size, a positive decimal number of bytes up to kMaxChunkSize
///
/// @throws     std::invalid_argument if the value is not a positive number or is too large
///
inline size_t parse_chunk_size(boost::string_view const value)
{
    size_t chunk_size = 0;
    if (value.empty() || !boost::algorithm::all(value, boost::algorithm::is_digit())
        || !boost::conversion::try_lexical_convert(value.data(), value.size(), chunk_size) || 0 == chunk_size
        || chunk_size > kMaxChunkSize)
    {
        throw std::invalid_argument("invalid chunk size '" + value.to_string() + "'");
    }
    return chunk_size;
}

///
/// @brief      Parses the command line
///
/// @details    The first positional argument is the pattern, the rest ones are paths.
///             Everything after "--" is positional
///
/// @param[in]  argc  The count of arguments
/// @param      argv  The arguments array
///
/// @throws     std::invalid_argument if the command line is malformed
///
/// @return     The options
///
inline Options parse_options(int argc, char const *const argv[])
{
    Options                  options;
    std::vector<std::string> positionals;
    bool                     positional_only = false;

    auto value_of = [argc, argv](int &i) -> boost::string_view {
        if (i + 1 >= argc)
            throw std::invalid_argument(std::string("option '") + argv[i] + "' requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        boost::string_view const arg(argv[i]);
        if (positional_only || !boost::algorithm::starts_with(arg, "-") || "-" == arg)
            positionals.push_back(arg.to_string());
        else if ("--" == arg)
            positional_only = true;
        else if ("-h" == arg || "--help" == arg)
            options.help = true;
        else if ("--no-mmap" == arg)
            options.settings.use_mmap = false;
        else if ("-c" == arg || "--chunk-size" == arg)
            options.settings.chunk_size = parse_chunk_size(value_of(i));
        else if ("-a" == arg || "--algorithm" == arg)
            options.algorithm = parse_algorithm(value_of(i));
        else
            throw std::invalid_argument("unknown option '" + arg.to_string() + "'");
    }

    if (!positionals.empty())
    {
        options.pattern = positionals.front();
        options.paths.assign(std::next(positionals.begin()), positionals.end());
        if (options.paths.empty() && !options.help)
            throw std::invalid_argument("no input files given");
    }

    return options;
}

} // namespace binfind

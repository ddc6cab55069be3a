#pragma once

#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/range/algorithm_ext/erase.hpp>
#include <boost/utility/string_view.hpp>

namespace binfind
{

#ifdef _WIN32
constexpr char kPathListSeparator = ';';
#else
constexpr char kPathListSeparator = ':';
#endif

///
/// @brief      Splits a line of dropped or pasted paths into separate paths
///
/// @details    Entries are separated by the platform path list separator,
///             every entry is trimmed of whitespace and then of quotes
///             a terminal may have wrapped it in, empty entries are dropped
///
/// @param[in]  input      The line of paths
/// @param[in]  separator  The separator between the entries
///
/// @return     The list of paths in the order given
///
inline std::vector<std::string> parse_path_list(boost::string_view const input, char separator = kPathListSeparator)
{
    std::vector<std::string> paths;
    std::string const        text(input.begin(), input.end());
    boost::algorithm::split(paths, text, boost::algorithm::is_any_of(std::string(1, separator)));

    for (auto &path : paths)
    {
        boost::algorithm::trim(path);
        boost::algorithm::trim_if(path, boost::algorithm::is_any_of("\"'"));
    }

    boost::remove_erase_if(paths, [](auto const &path) { return path.empty(); });
    return paths;
}

} // namespace binfind

#pragma once

#include <cstddef>

#include <exception>
#include <string>
#include <vector>

#include "aux/chunk.hpp"

namespace binfind
{

///
/// @brief      Scans the sources one after another in the order given
///
/// @details    A failure of a source is reported and the batch goes on with the next one.
///             For every source the reporter gets file_started(), then match() per finding,
///             then either file_completed() or file_failed()
///
/// @param[in]  paths      The paths of the sources
/// @param[in]  scan_one   A functor-like object called as scan_one(path, sink) that scans
///                        a source calling sink(offset) per finding and returns
///                        the number of findings, it throws if the source fails
/// @param      reporter   The reporter
///
/// @tparam     SourceScan
/// @tparam     Reporter
///
/// @return     The number of sources failed
///
template <typename SourceScan, typename Reporter>
size_t scan_batch(std::vector<std::string> const &paths, SourceScan scan_one, Reporter &reporter)
{
    size_t failed = 0;
    for (auto const &path : paths)
    {
        reporter.file_started(path);
        try
        {
            auto const findings_count = scan_one(path, [&reporter, &path](pos_t offset) { reporter.match(path, offset); });
            reporter.file_completed(path, findings_count);
        }
        catch (std::exception const &ex)
        {
            ++failed;
            reporter.file_failed(path, ex.what());
        }
    }
    return failed;
}

} // namespace binfind

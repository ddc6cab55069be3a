#pragma once

#include <cstddef>

#include <exception>
#include <ios>
#include <iostream>
#include <iterator>
#include <utility>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/iostreams/device/mapped_file.hpp>
#include <boost/range/iterator_range.hpp>

#include "aux/chunk.hpp"
#include "aux/errors.hpp"
#include "readers/range_chunk_reader.hpp"
#include "readers/stream_chunk_reader.hpp"
#include "strat/sequential.hpp"
#include "tokenizers/match_tokenizer.hpp"

namespace binfind
{

struct ScanSettings
{
    size_t chunk_size = kDefaultChunkSize;
    // walk a memory mapping of a file instead of reading it through a stream
    bool   use_mmap   = true;
};

///
/// @brief      Scans sources for a pattern with a searcher given, one scan session per source
///
/// @details    Consecutive windows overlap by the pattern size minus one byte, so that
///             an occurrence crossing the border between two reads is found once
///
/// @tparam     Searcher     A searcher constructed for the pattern
/// @tparam     MappedFile   A read-only memory mapped file device,
///                          boost::iostreams::mapped_file_source alike
///
template <typename Searcher, typename MappedFile = boost::iostreams::mapped_file_source>
class FileScanner
{
public:
    ///
    /// @brief      Constructs the scanner
    ///
    /// @param[in]  searcher      The searcher
    /// @param[in]  pattern_size  The size of the pattern the searcher seeks, non-zero
    /// @param[in]  settings      The settings
    /// @param      log           The stream to write warnings to
    ///
    FileScanner(Searcher searcher, size_t pattern_size, ScanSettings settings = ScanSettings(), std::ostream &log = std::cerr)
        : searcher_(std::move(searcher))
        , overlap_(pattern_size > 0 ? pattern_size - 1 : 0)
        , settings_(settings)
        , log_(log)
    {
    }

    ///
    /// @brief      Scans a stream reading it block by block
    ///
    /// @param      is     The stream
    /// @param[in]  sink   A sink for the offset of each finding
    ///
    /// @throws     ReadError if the stream fails
    ///
    /// @return     The number of findings
    ///
    template <typename FindingsSink>
    size_t scan_stream(std::istream &is, FindingsSink sink) const
    {
        return strat::sequential(StreamChunkReader(is, settings_.chunk_size, overlap_), MatchTokenizer<Searcher>(searcher_), std::move(sink));
    }

    ///
    /// @brief      Scans a contiguous region of bytes window by window
    ///
    template <typename Range, typename FindingsSink>
    size_t scan_range(Range const &bytes, FindingsSink sink) const
    {
        using Reader = RangeChunkReader<decltype(std::begin(bytes))>;
        return strat::sequential(Reader(bytes, settings_.chunk_size, overlap_), MatchTokenizer<Searcher>(searcher_), std::move(sink));
    }

    ///
    /// @brief      Scans a regular file
    ///
    /// @details    The file is memory mapped unless the settings forbid it,
    ///             if mapping fails the file is read through a stream
    ///
    /// @param[in]  path   The path to the file
    /// @param[in]  sink   A sink for the offset of each finding
    ///
    /// @throws     ReadError if the file is missing, is not regular or cannot be read
    ///
    /// @return     The number of findings
    ///
    template <typename FindingsSink>
    size_t scan_file(boost::filesystem::path const &path, FindingsSink sink) const
    {
        if (!boost::filesystem::exists(path))
            throw ReadError("file doesn't exist");

        if (!boost::filesystem::is_regular_file(path))
            throw ReadError("file is not regular");

        // nothing to map and nothing to find
        if (boost::filesystem::is_empty(path))
            return 0;

        if (settings_.use_mmap)
        {
            MappedFile mapped_file;
            try
            {
                // mapping is performed in readonly mode
                mapped_file.open(path.string());
            }
            catch (std::exception const &ex)
            {
                log_ << "WARNING: mapping file " << path << " failed: " << ex.what() << '\n';
            }

            if (mapped_file.is_open())
            {
                auto const *first = reinterpret_cast<byte_t const *>(mapped_file.data());
                return scan_range(boost::make_iterator_range(first, first + mapped_file.size()), std::move(sink));
            }

            log_ << "WARNING: falling back to the stream-oriented reading mode for " << path << '\n';
        }

        boost::filesystem::ifstream stream(path, std::ios_base::in | std::ios_base::binary);
        if (!stream)
            throw ReadError("opening file in stream-mode failed");

        return scan_stream(stream, std::move(sink));
    }

private:
    Searcher      searcher_;
    size_t        overlap_;
    ScanSettings  settings_;
    std::ostream &log_;
};

} // namespace binfind

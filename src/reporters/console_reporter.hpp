#pragma once

#include <cstddef>

#include <iostream>
#include <string>

#include <boost/filesystem/path.hpp>

#include "aux/chunk.hpp"

namespace binfind
{

///
/// @brief      Reporter printing out the progress of a batch scan and its findings
///             Findings and progress go to the output stream, failures go to the error stream
///
class ConsoleReporter
{
public:
    explicit ConsoleReporter(std::ostream &out = std::cout, std::ostream &err = std::cerr) noexcept
        : out_(out), err_(err)
    {
    }

    void file_started(std::string const &path)
    {
        out_ << "\nSearching for pattern in file: '" << path << "'\n";
    }

    void match(std::string const &path, pos_t offset)
    {
        out_ << "Pattern found in " << path << " at offset " << offset << '\n';
    }

    void file_completed(std::string const &path, size_t findings_count)
    {
        out_ << "Pattern search completed for file: " << boost::filesystem::path(path).filename().string()
             << " (" << findings_count << (1 == findings_count ? " match" : " matches") << ")\n";
    }

    void file_failed(std::string const &path, std::string const &reason)
    {
        // flush the findings first so that the error lands after them on a terminal
        out_.flush();
        err_ << "error: " << path << ": " << reason << '\n';
    }

private:
    std::ostream &out_;
    std::ostream &err_;
};

} // namespace binfind

#pragma once

#include <iostream>
#include <string>

#include <boost/optional.hpp>

namespace binfind
{

///
/// @brief          The application singleton: prompts of the interactive session and the help page
///
class Application final
{
public:
    static Application &instance() noexcept
    {
        static Application app;
        return app;
    }

public:
    ///
    /// @brief      Asks a user for a line of input
    ///
    /// @param[in]  prompt  The prompt printed out before reading
    /// @param      is      The stream to read from
    /// @param      os      The stream to print the prompt to
    ///
    /// @return     The line, none if the input is over
    ///
    boost::optional<std::string> ask(char const *prompt, std::istream &is = std::cin, std::ostream &os = std::cout) const
    {
        os << prompt << std::flush;
        std::string line;
        if (!std::getline(is, line))
            return boost::none;
        return line;
    }

    char const *files_prompt() const noexcept
    {
        return "Please drag and drop files into this console, then press Enter to proceed:\n";
    }

    char const *pattern_prompt() const noexcept
    {
        return "Enter the binary pattern to search for (e.g., 'deadbeef' or '0xDE 0xAD 0xBE 0xEF'): ";
    }

    char const *exit_prompt() const noexcept
    {
        return "\nSearch complete. Press Enter to exit.\n";
    }

    ///
    /// @brief      Prints a help page.
    ///
    void help() noexcept
    {
        std::cout << R"help(
usage: binfind [OPTIONS] PATTERN FILE...
       binfind [OPTIONS]

    PATTERN - a sequence of bytes to seek in every FILE
    FILE    - an input file to process, several files are processed one by one

    Without PATTERN and FILEs the files and the pattern are asked for interactively,
    the files are separated by ':' then (';' on Windows)

    A pattern should meet one of the following formats:
        HEX    = hex digit pair, { hex digit pair }
        TOKENS = byte, { whitespace, byte }
        byte   = [ "0x" ], hex digit pair

options:
    -h, --help              print this page
    -c, --chunk-size N      read files by blocks of N bytes, 4096 by default,
                            1073741824 at most
    -a, --algorithm NAME    searching algorithm: naive (default), boyer-moore,
                            boost-boyer-moore, kmp
    --no-mmap               read files through streams instead of mapping them to memory

    Every occurrence is reported with its offset from the start of the file,
    overlapping occurrences are reported each.

examples:
    > binfind deadbeef core.dump
        Will find bytes DE AD BE EF in core.dump

    > binfind "0x7F 0x45 0x4C 0x46" a.out b.out
        Will find ELF signatures in a.out and b.out

    > binfind -a kmp "00 00" image.bin
        Will find pairs of zero bytes in image.bin, "00 00 00" gives two findings
    )help"
                     "\n";
    }

private:
    Application() = default;
};

} // namespace binfind

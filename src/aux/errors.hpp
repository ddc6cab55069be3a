#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace binfind
{

///
/// @brief      Thrown when a line of text cannot be turned into a pattern
///
class InvalidPatternError : public std::invalid_argument
{
public:
    InvalidPatternError(std::string const &what, std::string input)
        : std::invalid_argument(what), input_(std::move(input))
    {
    }

    ///
    /// @brief      Gets the text the parsing has been attempted on
    ///
    std::string const &input() const noexcept { return input_; }

private:
    std::string input_;
};

///
/// @brief      Thrown when a source cannot be opened or read
///
class ReadError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace binfind

/**
 * binchain - Exception types raised by the codec and the streaming parser.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "binchain/error_codes.hpp"

namespace binchain
{

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Input cannot be represented on the wire.
    class EncodingError : public Error
    {
    public:
        using Error::Error;
    };

    // Byte stream violates the format or a configured limit.
    class ParseError : public Error
    {
    public:
        using Error::Error;
    };

    // Bad configuration or call pattern.
    class ArgumentError : public Error
    {
    public:
        using Error::Error;
    };

} // namespace binchain

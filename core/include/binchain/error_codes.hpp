/**
 * binchain - Error classification shared by the codec, parser and front ends.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace binchain
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NonAsciiPrefix = 1,
        LengthOutOfRange = 2,
        InvalidControlByte = 3,
        PartTooLarge = 4,
        PrefixTooLarge = 5,
        ChainTooLarge = 6,
        ChainTooLong = 7,
        ParserFailed = 8,
        EmptyInput = 9,
        InvalidLimits = 10,
        InvalidDocument = 11
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace binchain

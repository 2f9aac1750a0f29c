#include "binchain/error_codes.hpp"

#include <array>

namespace binchain
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 12> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::NonAsciiPrefix, "non_ascii_prefix"},
            {ErrorCode::LengthOutOfRange, "length_out_of_range"},
            {ErrorCode::InvalidControlByte, "invalid_control_byte"},
            {ErrorCode::PartTooLarge, "part_too_large"},
            {ErrorCode::PrefixTooLarge, "prefix_too_large"},
            {ErrorCode::ChainTooLarge, "chain_too_large"},
            {ErrorCode::ChainTooLong, "chain_too_long"},
            {ErrorCode::ParserFailed, "parser_failed"},
            {ErrorCode::EmptyInput, "empty_input"},
            {ErrorCode::InvalidLimits, "invalid_limits"},
            {ErrorCode::InvalidDocument, "invalid_document"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace binchain

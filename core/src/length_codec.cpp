#include "binchain/length_codec.hpp"

#include <array>
#include <string>

#include "binchain/errors.hpp"

namespace binchain::codec
{

    namespace
    {
        constexpr std::array<std::uint64_t, kMaxLengthWidth> kWidthLimits{{
            0xFFULL,
            0xFFFFULL,
            0xFFFFFFULL,
            0xFFFFFFFFULL,
            0xFFFFFFFFFFULL,
            0xFFFFFFFFFFFFULL,
            0xFFFFFFFFFFFFFFULL,
            0xFFFFFFFFFFFFFFFFULL,
        }};

        void write_be(std::uint64_t value, std::span<std::uint8_t> buffer)
        {
            for (std::size_t i = buffer.size(); i > 0; --i)
            {
                buffer[i - 1] = static_cast<std::uint8_t>(value & 0xFF);
                value >>= 8;
            }
        }
    } // namespace

    ControlByte classify_control_byte(std::uint8_t byte) noexcept
    {
        if (byte == kEndOfChain)
        {
            return ControlByte::EndOfChain;
        }
        if (byte >= kZeroLengthSop && byte <= kMaxSop)
        {
            return ControlByte::StartOfPart;
        }
        return ControlByte::Invalid;
    }

    std::optional<std::size_t> start_of_part_width(std::uint8_t byte) noexcept
    {
        if (classify_control_byte(byte) != ControlByte::StartOfPart)
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(byte - kZeroLengthSop);
    }

    std::size_t length_width(std::uint64_t length) noexcept
    {
        if (length == 0)
        {
            return 0;
        }
        std::size_t width = 1;
        while (length > kWidthLimits[width - 1])
        {
            ++width;
        }
        return width;
    }

    void append_length(std::vector<std::uint8_t> &out, std::uint64_t length)
    {
        const auto width = length_width(length);
        out.push_back(static_cast<std::uint8_t>(kZeroLengthSop + width));
        const auto offset = out.size();
        out.resize(offset + width);
        write_be(length, std::span<std::uint8_t>(out).subspan(offset, width));
    }

    std::vector<std::uint8_t> encode_length(std::uint64_t length)
    {
        std::vector<std::uint8_t> encoded;
        encoded.reserve(1 + kMaxLengthWidth);
        append_length(encoded, length);
        return encoded;
    }

    std::vector<std::uint8_t> encode_length_checked(std::int64_t length)
    {
        if (length < 0)
        {
            throw EncodingError(ErrorCode::LengthOutOfRange,
                                "part length must be non-negative, got " + std::to_string(length));
        }
        return encode_length(static_cast<std::uint64_t>(length));
    }

    std::uint64_t decode_length(std::span<const std::uint8_t> bytes) noexcept
    {
        std::uint64_t value = 0;
        for (const auto byte : bytes)
        {
            value = (value << 8) | static_cast<std::uint64_t>(byte);
        }
        return value;
    }

} // namespace binchain::codec

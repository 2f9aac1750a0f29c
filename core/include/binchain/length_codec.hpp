/**
 * binchain - Start-of-part markers and variable-width big-endian part lengths.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace binchain::codec
{

    constexpr std::uint8_t kZeroLengthSop = 0x80;
    constexpr std::uint8_t kEndOfChain = 0xFF;
    constexpr std::size_t kMaxLengthWidth = 8;
    constexpr std::uint8_t kMaxSop = kZeroLengthSop + kMaxLengthWidth;

    enum class ControlByte : std::uint8_t
    {
        StartOfPart,
        EndOfChain,
        Invalid
    };

    constexpr bool is_control_byte(std::uint8_t byte) noexcept
    {
        return byte >= kZeroLengthSop;
    }

    ControlByte classify_control_byte(std::uint8_t byte) noexcept;

    // Width of the length field announced by a start-of-part byte, nullopt for anything else.
    std::optional<std::size_t> start_of_part_width(std::uint8_t byte) noexcept;

    // Smallest number of big-endian bytes that holds length; 0 for an empty part.
    std::size_t length_width(std::uint64_t length) noexcept;

    std::vector<std::uint8_t> encode_length(std::uint64_t length);

    // Same as encode_length, but raises EncodingError for negative lengths.
    std::vector<std::uint8_t> encode_length_checked(std::int64_t length);

    void append_length(std::vector<std::uint8_t> &out, std::uint64_t length);

    // Interprets 1..8 bytes as an unsigned big-endian integer.
    std::uint64_t decode_length(std::span<const std::uint8_t> bytes) noexcept;

} // namespace binchain::codec

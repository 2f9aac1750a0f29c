#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <span>

namespace binchain::cli
{

    constexpr std::size_t kDefaultLineLength = 40;

    // Two lines per row: upper-case hex values, then the ASCII characters with
    // U+2610 standing in for anything non-printable, followed by a blank line.
    void display_binary(std::ostream &out, std::span<const std::uint8_t> data,
                        std::size_t line_length = kDefaultLineLength);

} // namespace binchain::cli

/**
 * binchain - In-memory chain value and its serialiser.
 *
 * A chain is an ASCII prefix followed by zero or more binary parts:
 *
 *     prefix_bytes* (SOP length_bytes* part_bytes*)* EOC
 *
 * Every part is terminated by the start-of-part byte of the next part or by the
 * end-of-chain byte, so an empty chain serialises to the single byte 0xFF.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace binchain
{

    using Bytes = std::vector<std::uint8_t>;

    struct Chain
    {
        std::string prefix{};
        std::vector<Bytes> parts{};

        bool operator==(const Chain &other) const = default;
    };

    // Raises EncodingError when prefix holds a byte >= 0x80.
    void validate_prefix(std::string_view prefix);

    Chain make_chain(std::string prefix, std::vector<Bytes> parts = {});

    std::size_t serialised_size(const Chain &chain);

    Bytes serialise(const Chain &chain);

    // Short form for logs: long prefixes and parts are elided.
    std::string summarise(const Chain &chain);

    inline Bytes to_bytes(std::string_view text)
    {
        return Bytes(text.begin(), text.end());
    }

} // namespace binchain

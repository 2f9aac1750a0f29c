/**
 * binchain - Resource limits enforced while a chain is being parsed.
 */
#pragma once

#include <cstdint>
#include <optional>

namespace binchain
{

    struct ReaderLimits
    {
        // Mandatory, must be positive.
        std::uint64_t max_part_size{};
        // Bytes of prefix plus parts in one chain.
        std::optional<std::uint64_t> max_chain_size{};
        // Number of parts in one chain; the prefix does not count.
        std::optional<std::uint64_t> max_chain_length{};
        std::optional<std::uint64_t> max_prefix_size{};

        bool operator==(const ReaderLimits &other) const = default;
    };

    // Raises ArgumentError when max_part_size is zero.
    void validate_limits(const ReaderLimits &limits);

} // namespace binchain

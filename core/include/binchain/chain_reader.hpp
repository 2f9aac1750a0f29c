/**
 * binchain - Collects parser fragments into complete chains.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "binchain/chain.hpp"
#include "binchain/limits.hpp"
#include "binchain/streaming_parser.hpp"

namespace binchain
{

    class ChainReader
    {
    public:
        explicit ChainReader(ReaderLimits limits);

        void feed(std::span<const std::uint8_t> chunk);

        // Next chain completed by the data fed so far, nullopt when more input is needed.
        std::optional<Chain> next();

        std::vector<Chain> read(std::span<const std::uint8_t> chunk);

        bool is_complete() const noexcept { return parser_.is_complete(); }

        // Chain still being assembled; empty between chains.
        const Chain &in_progress() const noexcept { return current_; }

        const StreamingParser &parser() const noexcept { return parser_; }

    private:
        StreamingParser parser_;
        Chain current_;
    };

} // namespace binchain

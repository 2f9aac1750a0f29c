#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>

#include "binchain/chain.hpp"
#include "binchain/chain_reader.hpp"
#include "binchain/cli/config.hpp"

namespace binchain::cli
{

    struct StreamSummary
    {
        std::uint64_t bytes_read{};
        std::size_t chains{};
        bool complete{};
    };

    // Feeds input through reader in chunk_size pieces, calling on_chain for each
    // complete chain as soon as it is available.
    StreamSummary decode_stream(std::istream &input, ChainReader &reader, std::size_t chunk_size,
                                const std::function<void(const Chain &)> &on_chain);

    // Human-readable listing of one decoded chain; index is 1-based.
    void print_chain(std::ostream &out, std::size_t index, const Chain &chain);

    int run_encode(const EncodeOptions &options, std::ostream &out);

    int run_decode(const DecodeOptions &options, std::istream &stdin_stream, std::ostream &out);

    int run_view(const ViewOptions &options, std::ostream &out);

    int run_send(const SendOptions &options);

    int run_receive(const ReceiveOptions &options);

} // namespace binchain::cli

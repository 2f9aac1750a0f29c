/**
 * binchain - Incremental chain parser.
 *
 * Bytes may arrive in any segmentation. The parser keeps the unconsumed tail in
 * a pending buffer and hands out a fragment (prefix, part or end-of-chain) as
 * soon as the whole unit is buffered. A part unit is its payload plus the
 * control byte that follows it, so a fragment is never produced for data that
 * could still be extended.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "binchain/chain.hpp"
#include "binchain/limits.hpp"

namespace binchain
{

    struct PrefixFragment
    {
        std::string prefix;

        bool operator==(const PrefixFragment &other) const = default;
    };

    struct PartFragment
    {
        Bytes data;

        bool operator==(const PartFragment &other) const = default;
    };

    struct EndOfChain
    {
        bool operator==(const EndOfChain &other) const = default;
    };

    using Fragment = std::variant<PrefixFragment, PartFragment, EndOfChain>;

    // Growable byte buffer with a read cursor. Consumed bytes are dropped lazily,
    // once they make up at least half of the storage.
    class PendingBuffer
    {
    public:
        void append(std::span<const std::uint8_t> bytes);

        std::span<const std::uint8_t> view() const noexcept;

        std::size_t size() const noexcept { return data_.size() - cursor_; }
        bool empty() const noexcept { return size() == 0; }

        void consume(std::size_t count);

        // Copies the first count unread bytes out and consumes them.
        Bytes take(std::size_t count);

    private:
        void compact();

        Bytes data_;
        std::size_t cursor_{0};
    };

    enum class ParserPhase : std::uint8_t
    {
        InPrefix,
        InPartLength,
        InBinaryPart
    };

    std::string_view to_string(ParserPhase phase) noexcept;

    struct ParserState
    {
        ParserPhase phase{ParserPhase::InPrefix};
        PendingBuffer pending{};
        // Unread bytes already checked for a control byte while in InPrefix.
        std::size_t prefix_scanned{0};
        std::size_t length_width{0};
        std::uint64_t part_length{0};
        std::uint64_t chain_size{0};
        std::int64_t chain_length{-1};
        bool end_of_chain_pending{false};
    };

    // Produces the next fragment available in state.pending, or nullopt when more
    // input is needed. Limits are checked as each fragment is counted.
    std::optional<Fragment> step(ParserState &state, const ReaderLimits &limits);

    bool is_complete(const ParserState &state) noexcept;

    class StreamingParser
    {
    public:
        explicit StreamingParser(ReaderLimits limits);

        // Appends a non-empty chunk to the pending buffer.
        void feed(std::span<const std::uint8_t> chunk);

        std::optional<Fragment> next();

        // feed() followed by draining every fragment the chunk completed.
        std::vector<Fragment> parse(std::span<const std::uint8_t> chunk);

        // True when idle between chains with nothing partially consumed.
        bool is_complete() const noexcept;

        const ParserState &state() const noexcept { return state_; }
        const ReaderLimits &limits() const noexcept { return limits_; }

    private:
        void ensure_usable() const;

        ReaderLimits limits_;
        ParserState state_;
        bool failed_{false};
    };

} // namespace binchain

#include "binchain/streaming_parser.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

#include "binchain/errors.hpp"
#include "binchain/length_codec.hpp"

namespace binchain
{

    namespace
    {
        constexpr std::size_t kCompactThreshold = 4096;

        std::string hex_byte(std::uint8_t byte)
        {
            char text[5];
            std::snprintf(text, sizeof(text), "0x%02X", static_cast<unsigned>(byte));
            return text;
        }

        void reset_chain_counters(ParserState &state)
        {
            state.chain_size = 0;
            state.chain_length = -1;
        }

        // Applies the control byte that ends a prefix or a part.
        void enter_from_control_byte(ParserState &state, std::uint8_t byte)
        {
            switch (codec::classify_control_byte(byte))
            {
            case codec::ControlByte::EndOfChain:
                state.phase = ParserPhase::InPrefix;
                state.end_of_chain_pending = true;
                return;
            case codec::ControlByte::StartOfPart:
            {
                const auto width = static_cast<std::size_t>(byte - codec::kZeroLengthSop);
                if (width == 0)
                {
                    state.part_length = 0;
                    state.phase = ParserPhase::InBinaryPart;
                }
                else
                {
                    state.length_width = width;
                    state.phase = ParserPhase::InPartLength;
                }
                return;
            }
            case codec::ControlByte::Invalid:
                break;
            }
            throw ParseError(ErrorCode::InvalidControlByte, "invalid start of part byte " + hex_byte(byte));
        }

        std::optional<Fragment> read_prefix(ParserState &state, const ReaderLimits &limits)
        {
            const auto bytes = state.pending.view();
            for (std::size_t index = state.prefix_scanned; index < bytes.size(); ++index)
            {
                const auto byte = bytes[index];
                if (codec::is_control_byte(byte))
                {
                    std::string prefix(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(index));
                    enter_from_control_byte(state, byte);
                    state.pending.consume(index + 1);
                    state.prefix_scanned = 0;
                    return PrefixFragment{std::move(prefix)};
                }
                // A prefix of exactly max_prefix_size bytes is accepted.
                if (limits.max_prefix_size && index + 1 > *limits.max_prefix_size)
                {
                    throw ParseError(ErrorCode::PrefixTooLarge,
                                     "prefix too long: more than " + std::to_string(*limits.max_prefix_size) + " bytes");
                }
            }
            state.prefix_scanned = bytes.size();
            return std::nullopt;
        }

        bool read_part_length(ParserState &state, const ReaderLimits &limits)
        {
            if (state.pending.size() < state.length_width)
            {
                return false;
            }
            state.part_length = codec::decode_length(state.pending.view().first(state.length_width));
            state.pending.consume(state.length_width);
            state.phase = ParserPhase::InBinaryPart;
            if (state.part_length > limits.max_part_size)
            {
                throw ParseError(ErrorCode::PartTooLarge,
                                 "part length too long: " + std::to_string(state.part_length) + " > " +
                                     std::to_string(limits.max_part_size));
            }
            return true;
        }

        // part_length was checked against max_part_size when the length field was read.
        std::optional<Fragment> read_binary_part(ParserState &state)
        {
            // The unit is the payload plus the SOP/EOC byte that terminates it.
            if (state.pending.size() <= state.part_length)
            {
                return std::nullopt;
            }
            const auto length = static_cast<std::size_t>(state.part_length);
            const auto terminator = state.pending.view()[length];
            enter_from_control_byte(state, terminator);
            auto data = state.pending.take(length);
            state.pending.consume(1);
            return PartFragment{std::move(data)};
        }

        std::size_t fragment_size(const Fragment &fragment)
        {
            if (const auto *prefix = std::get_if<PrefixFragment>(&fragment))
            {
                return prefix->prefix.size();
            }
            if (const auto *part = std::get_if<PartFragment>(&fragment))
            {
                return part->data.size();
            }
            return 0;
        }

        void count_fragment(ParserState &state, const ReaderLimits &limits, std::size_t size)
        {
            state.chain_size += size;
            state.chain_length += 1;
            if (limits.max_chain_size && state.chain_size > *limits.max_chain_size)
            {
                throw ParseError(ErrorCode::ChainTooLarge,
                                 "chain size too big: " + std::to_string(state.chain_size) + " > " +
                                     std::to_string(*limits.max_chain_size));
            }
            if (limits.max_chain_length && static_cast<std::uint64_t>(state.chain_length) > *limits.max_chain_length)
            {
                throw ParseError(ErrorCode::ChainTooLong,
                                 "chain too long: length of " + std::to_string(state.chain_length) + " > " +
                                     std::to_string(*limits.max_chain_length));
            }
        }

    } // namespace

    void PendingBuffer::append(std::span<const std::uint8_t> bytes)
    {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    std::span<const std::uint8_t> PendingBuffer::view() const noexcept
    {
        return std::span<const std::uint8_t>(data_).subspan(cursor_);
    }

    void PendingBuffer::consume(std::size_t count)
    {
        cursor_ += std::min(count, size());
        compact();
    }

    Bytes PendingBuffer::take(std::size_t count)
    {
        const auto unread = view().first(std::min(count, size()));
        Bytes out(unread.begin(), unread.end());
        consume(out.size());
        return out;
    }

    void PendingBuffer::compact()
    {
        if (cursor_ == data_.size())
        {
            data_.clear();
            cursor_ = 0;
        }
        else if (cursor_ >= kCompactThreshold && cursor_ * 2 >= data_.size())
        {
            data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(cursor_));
            cursor_ = 0;
        }
    }

    std::string_view to_string(ParserPhase phase) noexcept
    {
        switch (phase)
        {
        case ParserPhase::InPrefix:
            return "IN_PREFIX";
        case ParserPhase::InPartLength:
            return "IN_PART_LENGTH";
        case ParserPhase::InBinaryPart:
            return "IN_BINARY_PART";
        }
        return "UNKNOWN";
    }

    std::optional<Fragment> step(ParserState &state, const ReaderLimits &limits)
    {
        if (state.end_of_chain_pending)
        {
            state.end_of_chain_pending = false;
            reset_chain_counters(state);
            return EndOfChain{};
        }

        std::optional<Fragment> fragment;
        switch (state.phase)
        {
        case ParserPhase::InPrefix:
            fragment = read_prefix(state, limits);
            break;
        case ParserPhase::InPartLength:
            if (read_part_length(state, limits))
            {
                fragment = read_binary_part(state);
            }
            break;
        case ParserPhase::InBinaryPart:
            fragment = read_binary_part(state);
            break;
        }

        if (fragment)
        {
            count_fragment(state, limits, fragment_size(*fragment));
        }
        return fragment;
    }

    bool is_complete(const ParserState &state) noexcept
    {
        return state.phase == ParserPhase::InPrefix && state.pending.empty() && !state.end_of_chain_pending;
    }

    StreamingParser::StreamingParser(ReaderLimits limits)
        : limits_(std::move(limits))
    {
        validate_limits(limits_);
    }

    void StreamingParser::feed(std::span<const std::uint8_t> chunk)
    {
        if (chunk.empty())
        {
            throw ArgumentError(ErrorCode::EmptyInput, "incoming data must not be empty");
        }
        ensure_usable();
        state_.pending.append(chunk);
    }

    std::optional<Fragment> StreamingParser::next()
    {
        ensure_usable();
        try
        {
            return step(state_, limits_);
        }
        catch (const ParseError &)
        {
            failed_ = true;
            throw;
        }
    }

    std::vector<Fragment> StreamingParser::parse(std::span<const std::uint8_t> chunk)
    {
        feed(chunk);
        std::vector<Fragment> fragments;
        while (auto fragment = next())
        {
            fragments.push_back(std::move(*fragment));
        }
        return fragments;
    }

    bool StreamingParser::is_complete() const noexcept
    {
        return !failed_ && binchain::is_complete(state_);
    }

    void StreamingParser::ensure_usable() const
    {
        if (failed_)
        {
            throw ParseError(ErrorCode::ParserFailed, "parser is in a failed state and must be recreated");
        }
    }

} // namespace binchain

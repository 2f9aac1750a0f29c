#include "binchain/chain_reader.hpp"

#include <utility>
#include <variant>

namespace binchain
{

    namespace
    {
        template <typename... Handlers>
        struct Overloaded : Handlers...
        {
            using Handlers::operator()...;
        };

        template <typename... Handlers>
        Overloaded(Handlers...) -> Overloaded<Handlers...>;
    } // namespace

    ChainReader::ChainReader(ReaderLimits limits)
        : parser_(std::move(limits))
    {
    }

    void ChainReader::feed(std::span<const std::uint8_t> chunk)
    {
        parser_.feed(chunk);
    }

    std::optional<Chain> ChainReader::next()
    {
        while (auto fragment = parser_.next())
        {
            const bool completed = std::visit(
                Overloaded{
                    [this](PrefixFragment &prefix)
                    {
                        current_.prefix = std::move(prefix.prefix);
                        return false;
                    },
                    [this](PartFragment &part)
                    {
                        current_.parts.push_back(std::move(part.data));
                        return false;
                    },
                    [](EndOfChain &)
                    { return true; },
                },
                *fragment);
            if (completed)
            {
                return std::exchange(current_, Chain{});
            }
        }
        return std::nullopt;
    }

    std::vector<Chain> ChainReader::read(std::span<const std::uint8_t> chunk)
    {
        feed(chunk);
        std::vector<Chain> chains;
        while (auto chain = next())
        {
            chains.push_back(std::move(*chain));
        }
        return chains;
    }

} // namespace binchain

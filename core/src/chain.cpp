#include "binchain/chain.hpp"

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>

#include "binchain/errors.hpp"
#include "binchain/length_codec.hpp"

namespace binchain
{

    namespace
    {
        constexpr std::size_t kSummaryPrefixChars = 100;
        constexpr std::size_t kSummaryParts = 10;
        constexpr std::size_t kSummaryPartBytes = 10;

        void append_escaped(std::string &out, const Bytes &part, std::size_t limit)
        {
            out += "b\"";
            const auto shown = std::min(part.size(), limit);
            for (std::size_t i = 0; i < shown; ++i)
            {
                const auto byte = part[i];
                if (byte >= 0x20 && byte < 0x7F && byte != '"' && byte != '\\')
                {
                    out.push_back(static_cast<char>(byte));
                }
                else
                {
                    char escaped[5];
                    std::snprintf(escaped, sizeof(escaped), "\\x%02X", static_cast<unsigned>(byte));
                    out += escaped;
                }
            }
            if (part.size() > limit)
            {
                out += "...";
            }
            out.push_back('"');
        }
    } // namespace

    void validate_prefix(std::string_view prefix)
    {
        const auto it = std::find_if(prefix.begin(), prefix.end(), [](char ch)
                                     { return codec::is_control_byte(static_cast<std::uint8_t>(ch)); });
        if (it != prefix.end())
        {
            throw EncodingError(ErrorCode::NonAsciiPrefix,
                                "prefix must be an ascii string (byte at offset " +
                                    std::to_string(std::distance(prefix.begin(), it)) + " is not)");
        }
    }

    Chain make_chain(std::string prefix, std::vector<Bytes> parts)
    {
        validate_prefix(prefix);
        return Chain{.prefix = std::move(prefix), .parts = std::move(parts)};
    }

    std::size_t serialised_size(const Chain &chain)
    {
        std::size_t size = chain.prefix.size() + 1;
        for (const auto &part : chain.parts)
        {
            size += 1 + codec::length_width(part.size()) + part.size();
        }
        return size;
    }

    Bytes serialise(const Chain &chain)
    {
        validate_prefix(chain.prefix);

        Bytes out;
        out.reserve(serialised_size(chain));
        out.insert(out.end(), chain.prefix.begin(), chain.prefix.end());
        for (const auto &part : chain.parts)
        {
            codec::append_length(out, part.size());
            out.insert(out.end(), part.begin(), part.end());
        }
        out.push_back(codec::kEndOfChain);
        return out;
    }

    std::string summarise(const Chain &chain)
    {
        std::string out = "Chain<\"";
        if (chain.prefix.size() <= kSummaryPrefixChars)
        {
            out += chain.prefix;
        }
        else
        {
            out += chain.prefix.substr(0, kSummaryPrefixChars);
            out += "...";
        }
        out += "\", [";

        const auto shown = std::min(chain.parts.size(), kSummaryParts);
        for (std::size_t i = 0; i < shown; ++i)
        {
            if (i > 0)
            {
                out += ", ";
            }
            append_escaped(out, chain.parts[i], kSummaryPartBytes);
        }
        if (chain.parts.size() > kSummaryParts)
        {
            out += ", .....";
        }
        out += "]>";
        return out;
    }

} // namespace binchain

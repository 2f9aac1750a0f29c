#include "binchain/encoding/base64.hpp"

#include <array>
#include <cctype>

namespace binchain::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::uint8_t> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::uint32_t buffer = 0;
        int bits_collected = 0;

        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | byte;
            bits_collected += 8;
            while (bits_collected >= 6)
            {
                bits_collected -= 6;
                output.push_back(kAlphabet[(buffer >> bits_collected) & 0x3Fu]);
            }
        }

        if (bits_collected > 0)
        {
            buffer <<= (6 - bits_collected);
            output.push_back(kAlphabet[buffer & 0x3Fu]);
        }

        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }

        return output;
    }

    std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input)
    {
        std::vector<std::uint8_t> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            const auto value = kDecodeTable[c];
            if (value == kInvalid)
            {
                if (!std::isspace(c))
                {
                    return std::nullopt;
                }
                continue;
            }
            if (value == kPadding)
            {
                break;
            }
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                output.push_back(static_cast<std::uint8_t>((accumulator >> bits_collected) & 0xFFu));
            }
        }

        return output;
    }

} // namespace binchain::encoding

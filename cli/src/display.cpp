#include "binchain/cli/display.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <string_view>

namespace binchain::cli
{

    namespace
    {
        constexpr std::string_view kPlaceholder = "☐";

        bool is_printable(std::uint8_t byte)
        {
            return byte >= 0x20 && byte < 0x7F;
        }
    } // namespace

    void display_binary(std::ostream &out, std::span<const std::uint8_t> data, std::size_t line_length)
    {
        line_length = std::max<std::size_t>(line_length, 1);
        for (std::size_t offset = 0; offset < data.size(); offset += line_length)
        {
            const auto row = data.subspan(offset, std::min(line_length, data.size() - offset));

            std::string hex_line;
            std::string char_line;
            for (std::size_t i = 0; i < row.size(); ++i)
            {
                if (i > 0)
                {
                    hex_line.push_back(' ');
                    char_line.push_back(' ');
                }
                char hex[3];
                std::snprintf(hex, sizeof(hex), "%02X", static_cast<unsigned>(row[i]));
                hex_line += hex;

                if (is_printable(row[i]))
                {
                    char_line.push_back(static_cast<char>(row[i]));
                }
                else
                {
                    char_line += kPlaceholder;
                }
                char_line.push_back(' ');
            }
            out << hex_line << '\n'
                << char_line << '\n'
                << '\n';
        }
    }

} // namespace binchain::cli

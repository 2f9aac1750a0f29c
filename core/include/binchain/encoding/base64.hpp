#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace binchain::encoding
{

    std::string encode_base64(std::span<const std::uint8_t> data);

    // nullopt on characters outside the alphabet (whitespace is skipped).
    std::optional<std::vector<std::uint8_t>> decode_base64(std::string_view input);

} // namespace binchain::encoding

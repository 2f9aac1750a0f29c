/**
 * binchain - BLAKE2b digests (libsodium) used to identify parts in listings.
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace binchain::crypto
{

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::uint8_t> data);

} // namespace binchain::crypto

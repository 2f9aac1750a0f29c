/**
 * binchain - JSON forms of chains and reader limits.
 *
 * Chains are written as {"prefix": "...", "parts": ["<base64>", ...]}. When read,
 * a part may also be an object carrying its payload under "data", which is the
 * shape describe_chain() produces. Limits are written as
 * {"max_part_size": n, "max_chain_size": n|null, ...} where null means unlimited.
 */
#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "binchain/chain.hpp"
#include "binchain/limits.hpp"

namespace binchain
{

    void to_json(nlohmann::json &json, const Chain &chain);
    void from_json(const nlohmann::json &json, Chain &chain);

    void to_json(nlohmann::json &json, const ReaderLimits &limits);
    void from_json(const nlohmann::json &json, ReaderLimits &limits);

    // Chain listing with per-part size and BLAKE2b digest next to the payload.
    nlohmann::json describe_chain(const Chain &chain);

    // Values in the file override the matching fields of defaults.
    ReaderLimits load_limits(const std::filesystem::path &path, ReaderLimits defaults = {});

    Chain load_chain(const std::filesystem::path &path);

} // namespace binchain

#include "binchain/json.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

#include "binchain/crypto.hpp"
#include "binchain/encoding/base64.hpp"
#include "binchain/errors.hpp"

namespace binchain
{

    namespace
    {

        nlohmann::json optional_limit(const std::optional<std::uint64_t> &value)
        {
            if (value)
            {
                return *value;
            }
            return nullptr;
        }

        // get<std::uint64_t>() would wrap a negative integer instead of rejecting it.
        std::uint64_t limit_value(const nlohmann::json &value, const char *key)
        {
            const bool non_negative =
                value.is_number_unsigned() || (value.is_number_integer() && value.get<std::int64_t>() >= 0);
            if (!non_negative)
            {
                throw ArgumentError(ErrorCode::InvalidLimits,
                                    std::string(key) + " must be a non-negative integer, got " + value.dump());
            }
            return value.get<std::uint64_t>();
        }

        void read_optional_limit(const nlohmann::json &json, const char *key, std::optional<std::uint64_t> &value)
        {
            const auto it = json.find(key);
            if (it == json.end())
            {
                return;
            }
            if (it->is_null())
            {
                value.reset();
            }
            else
            {
                value = limit_value(*it, key);
            }
        }

        nlohmann::json read_document(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
            {
                throw std::runtime_error("Failed to open " + path.string());
            }
            try
            {
                return nlohmann::json::parse(in);
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw ArgumentError(ErrorCode::InvalidDocument, path.string() + ": " + ex.what());
            }
        }

    } // namespace

    void to_json(nlohmann::json &json, const Chain &chain)
    {
        auto parts = nlohmann::json::array();
        for (const auto &part : chain.parts)
        {
            parts.push_back(encoding::encode_base64(part));
        }
        json = {
            {"prefix", chain.prefix},
            {"parts", std::move(parts)},
        };
    }

    void from_json(const nlohmann::json &json, Chain &chain)
    {
        chain.prefix = json.value("prefix", std::string{});
        validate_prefix(chain.prefix);
        chain.parts.clear();
        if (auto it = json.find("parts"); it != json.end())
        {
            for (const auto &entry : *it)
            {
                const auto &payload = entry.is_object() ? entry.at("data") : entry;
                auto decoded = encoding::decode_base64(payload.get<std::string>());
                if (!decoded)
                {
                    throw ArgumentError(ErrorCode::InvalidDocument,
                                        "part " + std::to_string(chain.parts.size()) + " is not valid base64");
                }
                chain.parts.push_back(std::move(*decoded));
            }
        }
    }

    void to_json(nlohmann::json &json, const ReaderLimits &limits)
    {
        json = {
            {"max_part_size", limits.max_part_size},
            {"max_chain_size", optional_limit(limits.max_chain_size)},
            {"max_chain_length", optional_limit(limits.max_chain_length)},
            {"max_prefix_size", optional_limit(limits.max_prefix_size)},
        };
    }

    // Keys that are absent leave the current value untouched.
    void from_json(const nlohmann::json &json, ReaderLimits &limits)
    {
        if (const auto it = json.find("max_part_size"); it != json.end())
        {
            limits.max_part_size = limit_value(*it, "max_part_size");
        }
        read_optional_limit(json, "max_chain_size", limits.max_chain_size);
        read_optional_limit(json, "max_chain_length", limits.max_chain_length);
        read_optional_limit(json, "max_prefix_size", limits.max_prefix_size);
    }

    nlohmann::json describe_chain(const Chain &chain)
    {
        auto parts = nlohmann::json::array();
        for (const auto &part : chain.parts)
        {
            parts.push_back({
                {"size", part.size()},
                {"digest", crypto::hash_bytes(part)},
                {"data", encoding::encode_base64(part)},
            });
        }
        return {
            {"prefix", chain.prefix},
            {"parts", std::move(parts)},
            {"serialised_size", serialised_size(chain)},
        };
    }

    ReaderLimits load_limits(const std::filesystem::path &path, ReaderLimits defaults)
    {
        const auto document = read_document(path);
        try
        {
            from_json(document, defaults);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ArgumentError(ErrorCode::InvalidDocument, path.string() + ": " + ex.what());
        }
        validate_limits(defaults);
        return defaults;
    }

    Chain load_chain(const std::filesystem::path &path)
    {
        const auto document = read_document(path);
        try
        {
            return document.get<Chain>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ArgumentError(ErrorCode::InvalidDocument, path.string() + ": " + ex.what());
        }
    }

} // namespace binchain

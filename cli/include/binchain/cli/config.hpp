#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "binchain/limits.hpp"

namespace binchain::cli
{

    enum class Subcommand
    {
        Encode,
        Decode,
        View,
        Send,
        Receive
    };

    struct EncodeOptions
    {
        std::optional<std::string> prefix;
        bool no_prefix{};
        std::optional<std::filesystem::path> from_json;
        // "-" writes raw bytes to stdout; absent prints a hex dump.
        std::optional<std::string> output_file;
        bool verify{};
        std::vector<std::filesystem::path> input_files;
    };

    struct DecodeOptions
    {
        // "-" reads stdin.
        std::string input;
        std::optional<std::filesystem::path> output_dir;
        bool json{};
        std::size_t chunk_size{64 * 1024};
        ReaderLimits limits;
    };

    struct ViewOptions
    {
        std::filesystem::path file;
    };

    struct SendOptions
    {
        std::string host;
        std::uint16_t port{};
        EncodeOptions chain;
    };

    struct ReceiveOptions
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{};
        std::optional<std::filesystem::path> output_dir;
        ReaderLimits limits;
    };

    struct CliConfig
    {
        std::optional<Subcommand> command;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool show_help{};
        bool show_version{};
        EncodeOptions encode;
        DecodeOptions decode;
        ViewOptions view;
        SendOptions send;
        ReceiveOptions receive;
    };

    // Limits used by decode and receive unless overridden: 1 MiB parts, 10 MiB chains, 256 parts.
    ReaderLimits default_limits();

    std::string usage(const std::string &program_name);

    CliConfig parse_arguments(int argc, char *argv[]);

} // namespace binchain::cli

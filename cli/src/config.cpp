#include "binchain/cli/config.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>

#include "binchain/json.hpp"

namespace binchain::cli
{

    namespace
    {

        struct LimitOverrides
        {
            std::optional<std::filesystem::path> file;
            std::optional<std::uint64_t> max_part_size;
            std::optional<std::uint64_t> max_chain_size;
            std::optional<std::uint64_t> max_chain_length;
            std::optional<std::uint64_t> max_prefix_size;
        };

        bool is_option(const std::string &arg)
        {
            return arg.size() > 1 && arg[0] == '-';
        }

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            ++index;
            return argv[index];
        }

        std::uint64_t parse_unsigned(const std::string &value, const std::string &option)
        {
            if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0])))
            {
                throw std::runtime_error("Invalid value for " + option + ": " + value);
            }
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size())
                {
                    throw std::runtime_error("Invalid value for " + option + ": " + value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error("Invalid value for " + option + ": " + value);
            }
        }

        std::uint16_t parse_port(const std::string &value, const std::string &option)
        {
            const auto port = parse_unsigned(value, option);
            if (port == 0 || port > std::numeric_limits<std::uint16_t>::max())
            {
                throw std::runtime_error("Port out of range for " + option + ": " + value);
            }
            return static_cast<std::uint16_t>(port);
        }

        bool parse_limit_option(int &index, int argc, char *argv[], LimitOverrides &overrides)
        {
            const std::string arg = argv[index];
            if (arg == "--limits")
            {
                overrides.file = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--max-part-size")
            {
                overrides.max_part_size = parse_unsigned(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--max-chain-size")
            {
                overrides.max_chain_size = parse_unsigned(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--max-chain-length")
            {
                overrides.max_chain_length = parse_unsigned(require_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--max-prefix-size")
            {
                overrides.max_prefix_size = parse_unsigned(require_value(index, argc, argv, arg), arg);
            }
            else
            {
                return false;
            }
            return true;
        }

        ReaderLimits resolve_limits(const LimitOverrides &overrides)
        {
            auto limits = default_limits();
            if (overrides.file)
            {
                limits = load_limits(*overrides.file, limits);
            }
            if (overrides.max_part_size)
            {
                limits.max_part_size = *overrides.max_part_size;
            }
            if (overrides.max_chain_size)
            {
                limits.max_chain_size = overrides.max_chain_size;
            }
            if (overrides.max_chain_length)
            {
                limits.max_chain_length = overrides.max_chain_length;
            }
            if (overrides.max_prefix_size)
            {
                limits.max_prefix_size = overrides.max_prefix_size;
            }
            validate_limits(limits);
            return limits;
        }

        bool parse_encode_option(int &index, int argc, char *argv[], EncodeOptions &options)
        {
            const std::string arg = argv[index];
            if (arg == "--prefix")
            {
                options.prefix = require_value(index, argc, argv, arg);
            }
            else if (arg == "--noprefix")
            {
                options.no_prefix = true;
            }
            else if (arg == "--from-json")
            {
                options.from_json = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--output-file")
            {
                options.output_file = require_value(index, argc, argv, arg);
            }
            else if (arg == "--verify")
            {
                options.verify = true;
            }
            else if (!is_option(arg))
            {
                options.input_files.emplace_back(arg);
            }
            else
            {
                return false;
            }
            return true;
        }

        void check_encode_options(const EncodeOptions &options)
        {
            if (options.prefix && options.no_prefix)
            {
                throw std::runtime_error("--prefix and --noprefix are mutually exclusive");
            }
            if (options.from_json && (options.prefix || options.no_prefix || !options.input_files.empty()))
            {
                throw std::runtime_error("--from-json cannot be combined with --prefix, --noprefix or input files");
            }
            if (options.verify && !options.output_file)
            {
                throw std::runtime_error("--verify requires --output-file");
            }
            if (options.verify && *options.output_file == "-")
            {
                throw std::runtime_error("Can't verify stdout");
            }
        }

        void parse_endpoint(const std::string &endpoint, SendOptions &options)
        {
            const auto colon_pos = endpoint.rfind(':');
            if (colon_pos == std::string::npos || colon_pos == 0)
            {
                throw std::runtime_error("Expected endpoint format host:port");
            }
            options.host = endpoint.substr(0, colon_pos);
            options.port = parse_port(endpoint.substr(colon_pos + 1), "endpoint");
        }

        void parse_encode(int index, int argc, char *argv[], EncodeOptions &options)
        {
            for (; index < argc; ++index)
            {
                if (!parse_encode_option(index, argc, argv, options))
                {
                    throw std::runtime_error(std::string("Unknown argument: ") + argv[index]);
                }
            }
            check_encode_options(options);
        }

        void parse_decode(int index, int argc, char *argv[], DecodeOptions &options)
        {
            LimitOverrides overrides;
            std::vector<std::string> positional;
            for (; index < argc; ++index)
            {
                const std::string arg = argv[index];
                if (parse_limit_option(index, argc, argv, overrides))
                {
                    continue;
                }
                if (arg == "--output-dir")
                {
                    options.output_dir = std::filesystem::path(require_value(index, argc, argv, arg));
                }
                else if (arg == "--json")
                {
                    options.json = true;
                }
                else if (arg == "--chunk-size")
                {
                    const auto value = parse_unsigned(require_value(index, argc, argv, arg), arg);
                    if (value == 0)
                    {
                        throw std::runtime_error("--chunk-size must be positive");
                    }
                    options.chunk_size = static_cast<std::size_t>(value);
                }
                else if (!is_option(arg))
                {
                    positional.push_back(arg);
                }
                else
                {
                    throw std::runtime_error("Unknown argument: " + arg);
                }
            }
            if (positional.size() != 1)
            {
                throw std::runtime_error("decode expects exactly one input file (or - for stdin)");
            }
            if (options.json && options.output_dir)
            {
                throw std::runtime_error("--json and --output-dir are mutually exclusive");
            }
            options.input = positional.front();
            options.limits = resolve_limits(overrides);
        }

        void parse_view(int index, int argc, char *argv[], ViewOptions &options)
        {
            if (index + 1 != argc || is_option(argv[index]))
            {
                throw std::runtime_error("view expects exactly one file");
            }
            options.file = std::filesystem::path(argv[index]);
        }

        void parse_send(int index, int argc, char *argv[], SendOptions &options)
        {
            if (index >= argc || is_option(argv[index]))
            {
                throw std::runtime_error("send expects <host>:<port> before the chain options");
            }
            parse_endpoint(argv[index], options);
            parse_encode(index + 1, argc, argv, options.chain);
            if (options.chain.output_file)
            {
                throw std::runtime_error("--output-file and --verify are not available for send");
            }
        }

        void parse_receive(int index, int argc, char *argv[], ReceiveOptions &options)
        {
            LimitOverrides overrides;
            for (; index < argc; ++index)
            {
                const std::string arg = argv[index];
                if (parse_limit_option(index, argc, argv, overrides))
                {
                    continue;
                }
                if (arg == "--port")
                {
                    options.port = parse_port(require_value(index, argc, argv, arg), arg);
                }
                else if (arg == "--address")
                {
                    options.address = require_value(index, argc, argv, arg);
                }
                else if (arg == "--output-dir")
                {
                    options.output_dir = std::filesystem::path(require_value(index, argc, argv, arg));
                }
                else
                {
                    throw std::runtime_error("Unknown argument: " + arg);
                }
            }
            if (options.port == 0)
            {
                throw std::runtime_error("receive requires --port");
            }
            options.limits = resolve_limits(overrides);
        }

    } // namespace

    ReaderLimits default_limits()
    {
        constexpr std::uint64_t kMiB = 1024 * 1024;
        return ReaderLimits{
            .max_part_size = 1 * kMiB,
            .max_chain_size = 10 * kMiB,
            .max_chain_length = 256,
            .max_prefix_size = std::nullopt,
        };
    }

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " [--log <file>] [--verbose] <command> [options]\n"
               "\n"
               "Commands:\n"
               "  encode [--prefix <text> | --noprefix] [--from-json <file>] [--output-file <file>|-] [--verify]\n"
               "         [<input-file>...]\n"
               "      First input file is the prefix unless --prefix or --noprefix is given;\n"
               "      the other files become parts. Without --output-file a hex dump is printed.\n"
               "  decode [--output-dir <dir>] [--json] [--chunk-size <n>] [limits] <input-file>|-\n"
               "  view <file>\n"
               "  send <host>:<port> [encode options]\n"
               "  receive --port <port> [--address <address>] [--output-dir <dir>] [limits]\n"
               "\n"
               "Limits:\n"
               "  --limits <json-file> --max-part-size <n> --max-chain-size <n> --max-chain-length <n>\n"
               "  --max-prefix-size <n>\n";
    }

    CliConfig parse_arguments(int argc, char *argv[])
    {
        CliConfig config;
        int index = 1;
        for (; index < argc; ++index)
        {
            const std::string arg = argv[index];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.show_help = true;
                return config;
            }
            else if (arg == "--version")
            {
                config.show_version = true;
                return config;
            }
            else if (is_option(arg))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                break;
            }
        }

        if (index >= argc)
        {
            throw std::runtime_error("Missing command");
        }

        const std::string command = argv[index++];
        if (command == "encode")
        {
            config.command = Subcommand::Encode;
            parse_encode(index, argc, argv, config.encode);
        }
        else if (command == "decode")
        {
            config.command = Subcommand::Decode;
            parse_decode(index, argc, argv, config.decode);
        }
        else if (command == "view")
        {
            config.command = Subcommand::View;
            parse_view(index, argc, argv, config.view);
        }
        else if (command == "send")
        {
            config.command = Subcommand::Send;
            parse_send(index, argc, argv, config.send);
        }
        else if (command == "receive")
        {
            config.command = Subcommand::Receive;
            parse_receive(index, argc, argv, config.receive);
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command);
        }
        return config;
    }

} // namespace binchain::cli

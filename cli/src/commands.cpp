#include "binchain/cli/commands.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "binchain/cli/chain_files.hpp"
#include "binchain/cli/display.hpp"
#include "binchain/cli/net.hpp"
#include "binchain/crypto.hpp"
#include "binchain/json.hpp"

namespace binchain::cli
{

    namespace
    {

        std::string file_safe(std::string name)
        {
            std::replace_if(name.begin(), name.end(), [](char ch)
                            { return ch == ':' || ch == '/' || ch == '\\'; },
                            '_');
            return name;
        }

        int verify_output(const std::filesystem::path &path, const Bytes &expected, std::ostream &out)
        {
            const auto actual = read_file(path);
            if (actual != expected)
            {
                out << "Binary chain file does NOT match expected output\n";
                spdlog::info("expected blake2b {} ({} bytes), found {} ({} bytes)", crypto::hash_bytes(expected),
                             expected.size(), crypto::hash_bytes(actual), actual.size());
                return 1;
            }
            out << "Binary chain file matches expected output\n";
            return 0;
        }

    } // namespace

    StreamSummary decode_stream(std::istream &input, ChainReader &reader, std::size_t chunk_size,
                                const std::function<void(const Chain &)> &on_chain)
    {
        StreamSummary summary;
        std::vector<char> buffer(std::max<std::size_t>(chunk_size, 1));
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count == 0)
            {
                break;
            }
            summary.bytes_read += read_count;
            reader.feed(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(buffer.data()), read_count));
            while (auto chain = reader.next())
            {
                ++summary.chains;
                on_chain(*chain);
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Failed to read input");
        }
        summary.complete = reader.is_complete();
        return summary;
    }

    void print_chain(std::ostream &out, std::size_t index, const Chain &chain)
    {
        out << "Chain " << index << '\n';
        out << "Prefix: \"" << chain.prefix << "\"\n";
        if (chain.parts.empty())
        {
            out << "No Binary Parts\n";
        }
        for (std::size_t part_index = 0; part_index < chain.parts.size(); ++part_index)
        {
            const auto &part = chain.parts[part_index];
            out << "Part " << part_index << " (" << part.size() << " bytes, blake2b " << crypto::hash_bytes(part)
                << ")\n";
            display_binary(out, part);
        }
        out << std::string(3 * kDefaultLineLength, '-') << "\n\n";
    }

    int run_encode(const EncodeOptions &options, std::ostream &out)
    {
        const auto chain = build_chain(options);
        const auto data = serialise(chain);
        spdlog::debug("Encoded {}", summarise(chain));

        if (!options.output_file)
        {
            display_binary(out, data);
            return 0;
        }
        if (*options.output_file == "-")
        {
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            return 0;
        }
        const std::filesystem::path path(*options.output_file);
        if (options.verify)
        {
            return verify_output(path, data, out);
        }
        write_file(path, data);
        spdlog::info("Wrote {} bytes ({} parts) to {}", data.size(), chain.parts.size(), path.string());
        return 0;
    }

    int run_decode(const DecodeOptions &options, std::istream &stdin_stream, std::ostream &out)
    {
        std::ifstream file;
        std::istream *input = &stdin_stream;
        std::string name = "stdin";
        if (options.input != "-")
        {
            file.open(options.input, std::ios::binary);
            if (!file.is_open())
            {
                throw std::runtime_error("Failed to open " + options.input);
            }
            input = &file;
            name = std::filesystem::path(options.input).filename().string();
        }

        ChainReader reader(options.limits);
        auto listing = nlohmann::json::array();
        std::size_t index = 0;
        const auto summary = decode_stream(*input, reader, options.chunk_size, [&](const Chain &chain)
                                           {
            ++index;
            if (options.output_dir)
            {
                const auto written = write_chain_files(chain, chain_file_prefix(name, index), *options.output_dir);
                spdlog::info("Chain {} written to {} files in {}", index, written.size(), options.output_dir->string());
            }
            else if (options.json)
            {
                listing.push_back(describe_chain(chain));
            }
            else
            {
                print_chain(out, index, chain);
            } });

        if (summary.bytes_read == 0)
        {
            out << "File is empty. No data found.\n";
            return 0;
        }
        if (options.json)
        {
            out << listing.dump(2) << '\n';
        }
        if (summary.chains == 0)
        {
            if (options.json)
            {
                spdlog::warn("No complete chain found");
            }
            else
            {
                out << "No complete chain found.\n";
            }
        }
        if (!summary.complete)
        {
            spdlog::error("Input ended in the middle of a chain: {} of {} bytes not decoded",
                          reader.parser().state().pending.size(), summary.bytes_read);
            return 1;
        }
        spdlog::debug("Decoded {} chains from {} bytes", summary.chains, summary.bytes_read);
        return 0;
    }

    int run_view(const ViewOptions &options, std::ostream &out)
    {
        display_binary(out, read_file(options.file));
        return 0;
    }

    int run_send(const SendOptions &options)
    {
        const auto chain = build_chain(options.chain);
        const auto data = serialise(chain);
        send_bytes(options.host, options.port, data);
        spdlog::info("Sent {} bytes to {}:{}: {}", data.size(), options.host, options.port, summarise(chain));
        return 0;
    }

    int run_receive(const ReceiveOptions &options)
    {
        const auto output_dir = options.output_dir;
        Receiver receiver(options, [output_dir](const std::string &peer, std::size_t index, const Chain &chain)
                          {
            spdlog::info("Chain {} from {}: {}", index, peer, summarise(chain));
            if (output_dir)
            {
                write_chain_files(chain, chain_file_prefix(file_safe(peer), index), *output_dir);
            } });
        receiver.run();
        return 0;
    }

} // namespace binchain::cli

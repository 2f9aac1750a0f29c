#include "binchain/cli/chain_files.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "binchain/json.hpp"

namespace binchain::cli
{

    Bytes read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open " + path.string());
        }
        return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void write_file(const std::filesystem::path &path, const Bytes &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Failed to create " + path.string());
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out)
        {
            throw std::runtime_error("Failed to write " + path.string());
        }
    }

    Chain build_chain(const EncodeOptions &options)
    {
        if (options.from_json)
        {
            return load_chain(*options.from_json);
        }

        const bool first_is_prefix = !options.prefix && !options.no_prefix;
        std::string prefix = options.prefix.value_or(std::string{});
        std::vector<Bytes> parts;
        for (std::size_t index = 0; index < options.input_files.size(); ++index)
        {
            auto data = read_file(options.input_files[index]);
            if (index == 0 && first_is_prefix)
            {
                prefix.assign(data.begin(), data.end());
                spdlog::debug("Prefix from {} ({} bytes)", options.input_files[index].string(), data.size());
            }
            else
            {
                spdlog::debug("Part {} from {} ({} bytes)", parts.size(), options.input_files[index].string(),
                              data.size());
                parts.push_back(std::move(data));
            }
        }
        return make_chain(std::move(prefix), std::move(parts));
    }

    std::string chain_file_prefix(const std::string &name, std::size_t index)
    {
        return name + "-chain-" + std::to_string(index);
    }

    std::vector<std::filesystem::path> write_chain_files(const Chain &chain, const std::string &filename_prefix,
                                                         const std::filesystem::path &output_dir)
    {
        std::filesystem::create_directories(output_dir);

        std::vector<std::filesystem::path> written;
        const auto prefix_path = output_dir / (filename_prefix + "-asc-prefix.txt");
        write_file(prefix_path, to_bytes(chain.prefix));
        written.push_back(prefix_path);

        for (std::size_t index = 0; index < chain.parts.size(); ++index)
        {
            const auto part_path = output_dir / (filename_prefix + "-bin-part-" + std::to_string(index) + ".data");
            write_file(part_path, chain.parts[index]);
            written.push_back(part_path);
        }
        return written;
    }

} // namespace binchain::cli

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "binchain/chain.hpp"
#include "binchain/cli/config.hpp"

namespace binchain::cli
{

    Bytes read_file(const std::filesystem::path &path);

    void write_file(const std::filesystem::path &path, const Bytes &data);

    // Builds the chain described by the encode options: a JSON document, or the
    // input files with the first one used as prefix unless a prefix was given.
    Chain build_chain(const EncodeOptions &options);

    // "<name>-chain-<index>", index is 1-based.
    std::string chain_file_prefix(const std::string &name, std::size_t index);

    // Writes <prefix>-asc-prefix.txt and one <prefix>-bin-part-<n>.data per part.
    std::vector<std::filesystem::path> write_chain_files(const Chain &chain, const std::string &filename_prefix,
                                                         const std::filesystem::path &output_dir);

} // namespace binchain::cli

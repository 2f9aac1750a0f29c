#pragma once

#include <filesystem>
#include <optional>

namespace binchain::cli
{

    // Installs the default spdlog logger: colour sink on stderr plus an optional file sink.
    void configure_logging(const std::optional<std::filesystem::path> &log_path, bool verbose);

} // namespace binchain::cli

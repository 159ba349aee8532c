#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <filesystem>
#include <map>
#include <string>

namespace chartdl::config {

/**
 * Build a DownloaderConfig from the [downloader] section of a TOML-style file.
 *
 * A missing file yields the defaults. Unknown keys are ignored with a debug
 * message; a value that does not parse is an InvalidArgument error naming the key.
 * CHARTDL_CHARTS_DIR, when set, overrides charts_dir.
 */
downloader::Expected<downloader::DownloaderConfig>
loadDownloaderConfig(const std::filesystem::path& path);

/// Apply [downloader] values on top of an existing config.
downloader::Expected<void>
applyDownloaderSection(const std::map<std::string, std::string>& values,
                       downloader::DownloaderConfig& cfg);

} // namespace chartdl::config

#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace chartdl::downloader {

struct TransportOptions {
    std::chrono::milliseconds connectTimeout{15000};
    /// Abort when no byte arrives for this long. Zero disables the check.
    std::chrono::milliseconds stallTimeout{30000};
    bool verifyTls{true};
    std::string caPath{};
    std::optional<std::string> proxy{};
    std::string userAgent{"chartdl/1.0"};
    bool followRedirects{true};
};

[[nodiscard]] TransportOptions transportOptionsFrom(const DownloaderConfig& config);

/// libcurl easy-API transport. Safe to share across worker threads; each call owns its handle.
std::shared_ptr<ITransportClient> makeCurlTransport(TransportOptions options = {});

} // namespace chartdl::downloader

#include <chartdl/config/config_helpers.h>
#include <chartdl/config/downloader_config.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace chartdl::config {

using downloader::DownloaderConfig;
using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

namespace {

Error badValue(const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for downloader." + key + ": '" + value + "'"};
}

template <typename Int> bool parseInt(const std::string& s, Int& out) {
    if (s.empty())
        return false;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

bool parseDouble(const std::string& s, double& out) {
    if (s.empty())
        return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

} // namespace

Expected<void> applyDownloaderSection(const std::map<std::string, std::string>& values,
                                      DownloaderConfig& cfg) {
    for (const auto& [key, value] : values) {
        long long n = 0;
        bool ok = true;

        auto millis = [&](std::chrono::milliseconds& field) {
            ok = parseInt(value, n) && n >= 0;
            if (ok)
                field = std::chrono::milliseconds(n);
        };

        if (key == "max_concurrent") {
            ok = parseInt(value, n) && n >= 1;
            if (ok)
                cfg.maxConcurrent = static_cast<std::size_t>(n);
        } else if (key == "max_attempts") {
            ok = parseInt(value, n) && n >= 1;
            if (ok)
                cfg.retry.maxAttempts = static_cast<int>(n);
        } else if (key == "initial_backoff_ms") {
            millis(cfg.retry.initialBackoff);
        } else if (key == "backoff_multiplier") {
            double d = 0.0;
            ok = parseDouble(value, d) && d >= 1.0;
            if (ok)
                cfg.retry.multiplier = d;
        } else if (key == "max_backoff_ms") {
            millis(cfg.retry.maxBackoff);
        } else if (key == "progress_throttle_ms") {
            millis(cfg.progressThrottle);
        } else if (key == "finalize_attempts") {
            ok = parseInt(value, n) && n >= 1;
            if (ok)
                cfg.finalizeAttempts = static_cast<int>(n);
        } else if (key == "finalize_retry_delay_ms") {
            millis(cfg.finalizeRetryDelay);
        } else if (key == "max_projected_bytes") {
            std::uint64_t bytes = 0;
            ok = parseInt(value, bytes);
            if (ok)
                cfg.maxProjectedBytes = bytes;
        } else if (key == "state_file") {
            ok = !value.empty() && value.find('/') == std::string::npos;
            if (ok)
                cfg.stateFileName = value;
        } else if (key == "charts_dir") {
            ok = !value.empty();
            if (ok)
                cfg.chartsDir = expand_tilde(value);
        } else if (key == "connect_timeout_ms") {
            millis(cfg.connectTimeout);
        } else if (key == "stall_timeout_ms") {
            millis(cfg.stallTimeout);
        } else if (key == "verify_tls") {
            auto b = parse_bool(value);
            ok = b.has_value();
            if (ok)
                cfg.verifyTls = *b;
        } else if (key == "log_level") {
            ok = !value.empty();
            if (ok)
                cfg.logLevel = value;
        } else {
            spdlog::debug("Ignoring unknown config key downloader.{}", key);
        }

        if (!ok)
            return badValue(key, value);
    }
    return {};
}

Expected<DownloaderConfig> loadDownloaderConfig(const std::filesystem::path& path) {
    DownloaderConfig cfg;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        auto values = read_config_section(path, "downloader");
        if (auto r = applyDownloaderSection(values, cfg); !r.ok())
            return r.error();
        spdlog::debug("Loaded downloader config from {}", path.string());
    } else {
        spdlog::debug("No config file at {}, using defaults", path.string());
    }

    if (const char* dir = std::getenv("CHARTDL_CHARTS_DIR"); dir && *dir) {
        cfg.chartsDir = expand_tilde(dir);
    }
    return cfg;
}

} // namespace chartdl::config

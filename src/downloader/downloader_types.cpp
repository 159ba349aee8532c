#include <chartdl/downloader/downloader.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace chartdl::downloader {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(lower(name));
    if (it == headers.end())
        return std::nullopt;
    return it->second;
}

std::optional<std::uint64_t> HttpResponse::contentLength() const {
    auto v = header("content-length");
    if (!v || v->empty())
        return std::nullopt;
    std::uint64_t n = 0;
    auto* first = v->data();
    auto* last = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(first, last, n);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return n;
}

std::string_view toString(DownloadPriority priority) noexcept {
    switch (priority) {
        case DownloadPriority::High:
            return "high";
        case DownloadPriority::Low:
            return "low";
        case DownloadPriority::Normal:
        default:
            return "normal";
    }
}

std::string_view toString(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::Queued:
            return "queued";
        case DownloadStatus::Downloading:
            return "downloading";
        case DownloadStatus::Paused:
            return "paused";
        case DownloadStatus::Completed:
            return "completed";
        case DownloadStatus::Failed:
            return "failed";
        case DownloadStatus::Cancelled:
            return "cancelled";
    }
    return "queued";
}

std::string_view toString(BatchStatus status) noexcept {
    switch (status) {
        case BatchStatus::InProgress:
            return "inProgress";
        case BatchStatus::Paused:
            return "paused";
        case BatchStatus::Completed:
            return "completed";
        case BatchStatus::Cancelled:
            return "cancelled";
    }
    return "inProgress";
}

std::optional<DownloadPriority> parsePriority(std::string_view text) noexcept {
    if (text == "high")
        return DownloadPriority::High;
    if (text == "normal")
        return DownloadPriority::Normal;
    if (text == "low")
        return DownloadPriority::Low;
    return std::nullopt;
}

std::optional<DownloadStatus> parseStatus(std::string_view text) noexcept {
    for (auto s : {DownloadStatus::Queued, DownloadStatus::Downloading, DownloadStatus::Paused,
                   DownloadStatus::Completed, DownloadStatus::Failed, DownloadStatus::Cancelled}) {
        if (toString(s) == text)
            return s;
    }
    return std::nullopt;
}

std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalidArgument";
        case ErrorCode::NotFound:
            return "notFound";
        case ErrorCode::NetworkError:
            return "network";
        case ErrorCode::Timeout:
            return "networkTimeout";
        case ErrorCode::TlsVerificationFailed:
            return "tlsVerificationFailed";
        case ErrorCode::ServerError:
            return "serverError";
        case ErrorCode::RangeNotSatisfiable:
            return "rangeNotSatisfiable";
        case ErrorCode::IoError:
            return "storage";
        case ErrorCode::PermissionDenied:
            return "permissionDenied";
        case ErrorCode::InsufficientDiskSpace:
            return "insufficientDiskSpace";
        case ErrorCode::ChecksumMismatch:
            return "checksumMismatch";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

std::string_view errorCategory(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::NetworkError:
        case ErrorCode::ServerError:
        case ErrorCode::TlsVerificationFailed:
        case ErrorCode::RangeNotSatisfiable:
            return "network";
        case ErrorCode::ChecksumMismatch:
            return "checksum";
        case ErrorCode::IoError:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InsufficientDiskSpace:
            return "disk";
        case ErrorCode::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

bool isTransient(ErrorCode code) noexcept {
    return code == ErrorCode::Timeout || code == ErrorCode::NetworkError ||
           code == ErrorCode::ServerError;
}

bool isTerminal(DownloadStatus status) noexcept {
    return status == DownloadStatus::Completed || status == DownloadStatus::Failed ||
           status == DownloadStatus::Cancelled;
}

std::string fileNameFor(std::string_view chartId, std::string_view url) {
    auto path = url;
    if (auto scheme = path.find("://"); scheme != std::string_view::npos) {
        path.remove_prefix(scheme + 3);
        auto slash = path.find('/');
        path = slash == std::string_view::npos ? std::string_view{} : path.substr(slash);
    }
    if (auto cut = path.find_first_of("?#"); cut != std::string_view::npos)
        path = path.substr(0, cut);

    auto slash = path.rfind('/');
    auto segment = slash == std::string_view::npos ? path : path.substr(slash + 1);
    bool usable = !segment.empty() && segment.find('.') != std::string_view::npos &&
                  segment != "." && segment != ".." && segment.find('\\') == std::string_view::npos;
    if (usable)
        return std::string(segment);
    return std::string(chartId) + ".zip";
}

} // namespace chartdl::downloader

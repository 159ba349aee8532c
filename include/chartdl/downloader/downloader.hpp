#pragma once

/*
 * chartdl Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data types shared by the queue, the transfer engine,
 * the persistence layer and the manager, plus the abstract transport interface
 * the engine drives. It contains no implementation details.
 *
 * Design principles:
 * - One chart id maps to at most one queued or active transfer
 * - Partial bytes live in "<final>.part" beside the final file and are resumable
 * - Every failure is a single classified Error; no exceptions for control flow
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <chartdl/downloader/cancel_token.h>

namespace chartdl::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo {
    Sha256,
    Sha512,
    Md5 // legacy chart servers only publish md5
};

/**
 * Queue priority. Higher tiers are always admitted before lower ones.
 */
enum class DownloadPriority { High, Normal, Low };

/**
 * Observable status of a single chart download.
 */
enum class DownloadStatus { Queued, Downloading, Paused, Completed, Failed, Cancelled };

/**
 * Aggregate status of a batch.
 */
enum class BatchStatus { InProgress, Paused, Completed, Cancelled };

/**
 * How a transfer that did not fail came to an end.
 * Interrupted means the manager was shut down while the transfer was running.
 */
enum class TransferOutcome { Completed, Paused, Cancelled, Interrupted };

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NotFound,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    RangeNotSatisfiable,
    IoError,
    PermissionDenied,
    InsufficientDiskSpace,
    ChecksumMismatch,
    Cancelled,
    Unknown
};

inline constexpr std::string_view kPartialSuffix = ".part";
inline constexpr std::string_view kDefaultStateFileName = ".download_state.json";

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Retry/backoff policy for transient transport failures.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * Downloader configuration. Loaded from the [downloader] section of the config file.
 */
struct DownloaderConfig {
    std::filesystem::path chartsDir{"charts"};
    std::string stateFileName{std::string(kDefaultStateFileName)};
    std::size_t maxConcurrent{3};
    RetryPolicy retry{};
    std::chrono::milliseconds progressThrottle{100};
    int finalizeAttempts{3};
    std::chrono::milliseconds finalizeRetryDelay{50};
    std::uint64_t maxProjectedBytes{5ull * 1024ull * 1024ull * 1024ull}; // 0 = unlimited
    std::chrono::milliseconds connectTimeout{15000};
    std::chrono::milliseconds stallTimeout{30000};
    bool verifyTls{true};
    std::string logLevel{"info"};
};

/**
 * A unit of queued or active work.
 */
struct DownloadTask {
    std::string chartId;
    std::string url;
    DownloadPriority priority{DownloadPriority::Normal};
    std::optional<std::string> expectedChecksum{};
    std::chrono::system_clock::time_point addedAt{std::chrono::system_clock::now()};
    std::uint64_t sequence{0}; // assigned by the queue on insert
};

/**
 * Observable state of an active or historical transfer.
 */
struct DownloadProgress {
    std::string chartId;
    DownloadStatus status{DownloadStatus::Queued};
    double progress{0.0}; // 0.0 - 1.0
    std::optional<std::uint64_t> totalBytes{};
    std::optional<std::uint64_t> downloadedBytes{};
    std::chrono::system_clock::time_point lastUpdated{std::chrono::system_clock::now()};
    std::optional<std::string> errorMessage{};
    std::optional<std::string> errorCategory{};
    std::optional<double> bytesPerSecond{};
    std::optional<std::uint64_t> etaSeconds{};
    std::optional<std::string> url{};
};

/**
 * Durable metadata that lets a transfer continue after a restart.
 * downloadedBytes mirrors the size of the on-disk partial file.
 */
struct ResumeRecord {
    std::string chartId;
    std::string originalUrl;
    std::uint64_t downloadedBytes{0};
    std::chrono::system_clock::time_point lastAttempt{std::chrono::system_clock::now()};
    std::optional<std::string> checksum{};
    std::optional<bool> supportsRange{};
    int attempts{0};
    std::optional<std::string> lastErrorCode{};
};

/**
 * Aggregate over the members of one batch.
 */
struct BatchDownloadProgress {
    std::string batchId;
    std::size_t totalCharts{0};
    std::size_t completedCharts{0};
    std::size_t failedCharts{0};
    double overallProgress{0.0};
    BatchStatus status{BatchStatus::InProgress};
};

/**
 * Response metadata from a HEAD or small GET.
 * Header names are stored lower-case.
 */
struct HttpResponse {
    int statusCode{0};
    std::map<std::string, std::string> headers;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    [[nodiscard]] std::optional<std::uint64_t> contentLength() const;
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

/// Absolute bytes present in the destination file, and the total when known.
using TransferProgressCallback =
    std::function<void(std::uint64_t received, std::optional<std::uint64_t> total)>;

/// Receives every terminal storage or transfer failure.
using ErrorHook = std::function<void(std::string_view chartId, const Error& error)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP transport abstraction. The curl implementation satisfies this; tests use a fake.
 */
class ITransportClient {
public:
    virtual ~ITransportClient() = default;

    /**
     * Metadata probe. Used for content-length only; failure never fails a download.
     */
    virtual Expected<HttpResponse> head(std::string_view url) = 0;

    /**
     * Small GET with extra headers, used for "Range: bytes=0-0" probes. The body is discarded.
     */
    virtual Expected<HttpResponse> get(std::string_view url, const std::vector<Header>& headers) = 0;

    /**
     * Stream url into destination. With resumeFrom set, bytes are appended after that offset
     * using a Range request; a 416 answer yields ErrorCode::RangeNotSatisfiable.
     * Implementations check the token between chunks and return ErrorCode::Cancelled.
     */
    virtual Expected<void> downloadFile(std::string_view url,
                                        const std::filesystem::path& destination,
                                        const CancelToken& token,
                                        const TransferProgressCallback& onProgress,
                                        std::optional<std::uint64_t> resumeFrom) = 0;
};

// ======================
// Helpers
// ======================

[[nodiscard]] std::string_view toString(DownloadPriority priority) noexcept;
[[nodiscard]] std::string_view toString(DownloadStatus status) noexcept;
[[nodiscard]] std::string_view toString(BatchStatus status) noexcept;
[[nodiscard]] std::optional<DownloadPriority> parsePriority(std::string_view text) noexcept;
[[nodiscard]] std::optional<DownloadStatus> parseStatus(std::string_view text) noexcept;

/**
 * Stable string persisted in ResumeRecord::lastErrorCode.
 */
[[nodiscard]] std::string_view errorCodeToString(ErrorCode code) noexcept;

/**
 * Coarse category shown to users in DownloadProgress::errorCategory.
 */
[[nodiscard]] std::string_view errorCategory(ErrorCode code) noexcept;

/**
 * Transient transport failures are retried with backoff.
 */
[[nodiscard]] bool isTransient(ErrorCode code) noexcept;

/**
 * Completed, failed and cancelled downloads do not change without a new request.
 */
[[nodiscard]] bool isTerminal(DownloadStatus status) noexcept;

/**
 * Final file name for a chart: the last URL path segment when it has an extension,
 * otherwise "<chartId>.zip".
 */
[[nodiscard]] std::string fileNameFor(std::string_view chartId, std::string_view url);

[[nodiscard]] inline std::filesystem::path finalPathFor(const std::filesystem::path& chartsDir,
                                                        std::string_view chartId,
                                                        std::string_view url) {
    return chartsDir / fileNameFor(chartId, url);
}

[[nodiscard]] inline std::filesystem::path partialPathFor(const std::filesystem::path& finalPath) {
    auto p = finalPath;
    p += std::string(kPartialSuffix);
    return p;
}

} // namespace chartdl::downloader

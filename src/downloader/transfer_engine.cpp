/*
 * TransferEngine: one chart, start to terminal state.
 *
 *   begin (progress 0.0) -> HEAD preflight -> disk check -> attempt loop
 *   (range resume, 416 restart, transient retry with backoff)
 *   -> checksum -> finalize -> completed (progress 1.0, record cleared)
 */

#include <chartdl/downloader/transfer_engine.h>

#include <chartdl/downloader/integrity_verifier.h>
#include <chartdl/downloader/metrics_collector.h>
#include <chartdl/downloader/progress_tracker.h>
#include <chartdl/downloader/resume_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <system_error>

namespace chartdl::downloader {

namespace fs = std::filesystem;

namespace {

constexpr auto kRecordPersistInterval = std::chrono::seconds{1};

Error storageError(const std::error_code& ec, const std::string& what) {
    ErrorCode code = ErrorCode::IoError;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        code = ErrorCode::PermissionDenied;
    } else if (ec == std::errc::no_space_on_device) {
        code = ErrorCode::InsufficientDiskSpace;
    }
    return Error{code, what + ": " + ec.message()};
}

std::uint64_t fileSizeOrZero(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec))
        return 0;
    auto n = fs::file_size(p, ec);
    return ec ? 0 : static_cast<std::uint64_t>(n);
}

void removeQuietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        spdlog::warn("Failed to delete {}: {}", p.string(), ec.message());
    }
}

} // namespace

TransferEngine::TransferEngine(ITransportClient& transport, ResumeRegistry& resume,
                               ProgressTracker& progress, const DownloaderConfig& config,
                               SaveRequest requestSave, MetricsCollector* metrics)
    : transport_(transport), resume_(resume), progress_(progress), config_(config),
      requestSave_(std::move(requestSave)), metrics_(metrics),
      finalizer_(config.finalizeAttempts, config.finalizeRetryDelay) {}

std::chrono::milliseconds TransferEngine::backoffFor(int attempt) const {
    const auto& rp = config_.retry;
    double factor = std::pow(rp.multiplier, std::max(0, attempt - 1));
    double ms = static_cast<double>(rp.initialBackoff.count()) * factor;
    double cap = static_cast<double>(rp.maxBackoff.count());
    return std::chrono::milliseconds{static_cast<std::int64_t>(std::min(ms, cap))};
}

Expected<TransferOutcome> TransferEngine::execute(const DownloadTask& task,
                                                  const CancelToken& token) {
    if (task.chartId.empty() || task.url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Download task needs a chart id and a url"};
    }

    const auto finalFile = finalPath(task);
    const auto partial = partialPathFor(finalFile);

    progress_.begin(task.chartId, task.url);
    if (metrics_)
        metrics_->start(task.chartId);

    // A digest that cannot be checked would fail every attempt after a full download.
    if (task.expectedChecksum && !task.expectedChecksum->empty() &&
        !parseChecksum(*task.expectedChecksum)) {
        return fail(task, partial,
                    Error{ErrorCode::InvalidArgument,
                          "Unrecognized checksum format: " + *task.expectedChecksum});
    }

    // Resume record exists for the whole life of the transfer.
    {
        auto existing = resume_.get(task.chartId);
        ResumeRecord rec;
        if (existing && existing->originalUrl == task.url) {
            rec = *existing;
        } else {
            if (existing) {
                auto stale = partialPathFor(finalPathFor(config_.chartsDir, existing->chartId,
                                                         existing->originalUrl));
                if (stale != partial) {
                    spdlog::info("Source for {} changed; discarding previous partial", task.chartId);
                    removeQuietly(stale);
                }
            }
            rec.chartId = task.chartId;
            rec.originalUrl = task.url;
        }
        if (task.expectedChecksum)
            rec.checksum = task.expectedChecksum;
        rec.lastAttempt = std::chrono::system_clock::now();
        rec.downloadedBytes = fileSizeOrZero(partial);
        resume_.put(std::move(rec));
        requestSave_();
    }

    if (token.isCancelled())
        return stop(task, partial, token.reason());

    std::error_code ec;
    fs::create_directories(config_.chartsDir, ec);
    if (ec) {
        return fail(task, partial,
                    storageError(ec, "Cannot create charts directory " + config_.chartsDir.string()));
    }

    // Preflight. Only the length is used; a failed probe is not fatal.
    std::optional<std::uint64_t> expectedTotal;
    {
        auto head = transport_.head(task.url);
        if (head.ok() && head.value().statusCode < 400) {
            expectedTotal = head.value().contentLength();
        } else if (!head.ok()) {
            spdlog::debug("HEAD probe failed for {}: {}", task.url, head.error().message);
        }
    }

    if (expectedTotal) {
        if (auto err = checkDiskSpace(*expectedTotal, fileSizeOrZero(partial)))
            return fail(task, partial, std::move(*err));
    }

    auto lastPersist = std::chrono::steady_clock::now();
    auto onProgress = [&](std::uint64_t received, std::optional<std::uint64_t> total) {
        progress_.reportBytes(task.chartId, received, total ? total : expectedTotal);
        auto now = std::chrono::steady_clock::now();
        if (now - lastPersist >= kRecordPersistInterval) {
            lastPersist = now;
            resume_.update(task.chartId, [&](ResumeRecord& r) { r.downloadedBytes = received; });
            requestSave_();
        }
    };

    bool restartedFromZero = false;
    int attempt = 0;
    while (true) {
        if (token.isCancelled())
            return stop(task, partial, token.reason());

        std::optional<std::uint64_t> resumeFrom;
        auto onDisk = fileSizeOrZero(partial);
        if (onDisk > 0) {
            probeRangeSupport(task);
            auto rec = resume_.get(task.chartId);
            if (rec && rec->supportsRange.has_value() && !*rec->supportsRange) {
                spdlog::info("Server does not support ranges for {}; restarting from zero",
                             task.chartId);
                removeQuietly(partial);
                syncRecordWithFile(task.chartId, partial);
            } else if (expectedTotal && onDisk > *expectedTotal) {
                spdlog::warn("Partial file for {} is larger than the remote file; restarting",
                             task.chartId);
                removeQuietly(partial);
                syncRecordWithFile(task.chartId, partial);
            } else if (expectedTotal && onDisk == *expectedTotal) {
                spdlog::debug("Partial file for {} already holds every byte", task.chartId);
                break;
            } else {
                resumeFrom = onDisk;
            }
        }

        ++attempt;
        resume_.update(task.chartId, [](ResumeRecord& r) {
            ++r.attempts;
            r.lastAttempt = std::chrono::system_clock::now();
        });

        auto rc = transport_.downloadFile(task.url, partial, token, onProgress, resumeFrom);
        if (rc.ok())
            break;

        Error err = rc.error();
        syncRecordWithFile(task.chartId, partial);

        if (err.code == ErrorCode::Cancelled || token.isCancelled()) {
            auto reason = token.reason();
            return stop(task, partial, reason == CancelReason::None ? CancelReason::Cancel : reason);
        }

        if (err.code == ErrorCode::RangeNotSatisfiable && resumeFrom && !restartedFromZero) {
            spdlog::warn("Range not satisfiable for {} at offset {}; discarding partial and "
                         "restarting from zero",
                         task.chartId, *resumeFrom);
            restartedFromZero = true;
            --attempt;
            resume_.update(task.chartId, [](ResumeRecord& r) {
                if (r.attempts > 0)
                    --r.attempts;
            });
            removeQuietly(partial);
            syncRecordWithFile(task.chartId, partial);
            requestSave_();
            continue;
        }

        if (!isTransient(err.code))
            return fail(task, partial, std::move(err));

        resume_.update(task.chartId, [&](ResumeRecord& r) {
            r.lastErrorCode = std::string(errorCodeToString(err.code));
        });
        requestSave_();
        spdlog::warn("Download attempt {} failed for {}: {}", attempt, task.chartId, err.message);

        if (attempt >= config_.retry.maxAttempts)
            return fail(task, partial, std::move(err));

        if (metrics_)
            metrics_->incrementRetry(task.chartId);
        if (token.waitFor(backoffFor(attempt)))
            return stop(task, partial, token.reason());
    }

    auto received = syncRecordWithFile(task.chartId, partial);
    if (token.isCancelled())
        return stop(task, partial, token.reason());

    if (task.expectedChecksum && !task.expectedChecksum->empty()) {
        auto vr = verifyFileChecksum(partial, *task.expectedChecksum);
        if (!vr.ok()) {
            if (vr.error().code == ErrorCode::ChecksumMismatch) {
                removeQuietly(partial);
                resume_.update(task.chartId, [](ResumeRecord& r) { r.downloadedBytes = 0; });
            }
            return fail(task, partial, vr.error());
        }
    }

    auto fr = finalizer_.commit(partial, finalFile);
    if (!fr.ok())
        return fail(task, partial, fr.error());

    auto finalSize = fileSizeOrZero(finalFile);
    resume_.erase(task.chartId);
    requestSave_();
    progress_.markCompleted(task.chartId, finalSize ? finalSize : received);
    if (metrics_)
        metrics_->completeSuccess(task.chartId);
    spdlog::info("Downloaded {} ({} bytes) to {}", task.chartId, finalSize, finalFile.string());
    return TransferOutcome::Completed;
}

Expected<TransferOutcome> TransferEngine::fail(const DownloadTask& task, const fs::path& partial,
                                               Error error) {
    syncRecordWithFile(task.chartId, partial);
    resume_.update(task.chartId, [&](ResumeRecord& r) {
        r.lastErrorCode = std::string(errorCodeToString(error.code));
    });
    requestSave_();
    progress_.markFailed(task.chartId, error);
    if (metrics_)
        metrics_->completeFailure(task.chartId, errorCategory(error.code));
    spdlog::error("Download of {} failed ({}): {}", task.chartId, errorCodeToString(error.code),
                  error.message);
    return error;
}

TransferOutcome TransferEngine::stop(const DownloadTask& task, const fs::path& partial,
                                     CancelReason reason) {
    if (metrics_)
        metrics_->discard(task.chartId);

    if (reason == CancelReason::Cancel) {
        removeQuietly(partial);
        resume_.erase(task.chartId);
        requestSave_();
        progress_.markCancelled(task.chartId);
        spdlog::info("Download of {} cancelled", task.chartId);
        return TransferOutcome::Cancelled;
    }

    auto kept = syncRecordWithFile(task.chartId, partial);
    requestSave_();
    progress_.markPaused(task.chartId);
    spdlog::info("Download of {} stopped with {} bytes kept", task.chartId, kept);
    return reason == CancelReason::Shutdown ? TransferOutcome::Interrupted : TransferOutcome::Paused;
}

std::uint64_t TransferEngine::syncRecordWithFile(const std::string& chartId,
                                                 const fs::path& partial) {
    auto size = fileSizeOrZero(partial);
    resume_.update(chartId, [&](ResumeRecord& r) { r.downloadedBytes = size; });
    return size;
}

std::optional<Error> TransferEngine::checkDiskSpace(std::uint64_t expectedTotal,
                                                    std::uint64_t alreadyOnDisk) {
    if (config_.maxProjectedBytes > 0 && expectedTotal > config_.maxProjectedBytes) {
        return Error{ErrorCode::InsufficientDiskSpace,
                     "Download of " + std::to_string(expectedTotal) +
                         " bytes exceeds the configured ceiling of " +
                         std::to_string(config_.maxProjectedBytes)};
    }
    std::error_code ec;
    auto info = fs::space(config_.chartsDir, ec);
    if (ec) {
        spdlog::debug("Free space query failed for {}: {}", config_.chartsDir.string(),
                      ec.message());
        return std::nullopt;
    }
    auto needed = expectedTotal > alreadyOnDisk ? expectedTotal - alreadyOnDisk : 0;
    if (needed > info.available) {
        return Error{ErrorCode::InsufficientDiskSpace,
                     "Need " + std::to_string(needed) + " bytes, " +
                         std::to_string(info.available) + " available"};
    }
    return std::nullopt;
}

void TransferEngine::probeRangeSupport(const DownloadTask& task) {
    auto rec = resume_.get(task.chartId);
    if (!rec || rec->supportsRange.has_value())
        return;

    auto probe = transport_.get(task.url, {Header{"Range", "bytes=0-0"}});
    if (!probe.ok()) {
        spdlog::debug("Range probe failed for {}: {}", task.url, probe.error().message);
        return;
    }
    bool supported = probe.value().statusCode == 206;
    if (probe.value().statusCode != 206 && probe.value().statusCode != 200) {
        // inconclusive; let the resumed request decide
        return;
    }
    resume_.update(task.chartId, [&](ResumeRecord& r) { r.supportsRange = supported; });
    requestSave_();
}

} // namespace chartdl::downloader

#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chartdl::downloader {

/**
 * Everything the manager persists: the pending queue, the last known progress per
 * chart and the resume records.
 */
struct PersistedState {
    std::vector<DownloadTask> queue;
    std::map<std::string, DownloadProgress> downloads;
    std::map<std::string, ResumeRecord> resumeData;
};

enum class LoadOutcome { Loaded, Missing, Corrupt };

struct LoadResult {
    PersistedState state;
    LoadOutcome outcome{LoadOutcome::Missing};
};

/**
 * Reads and writes PersistedState as one JSON document:
 *   { "queue": [...], "downloads": {...}, "resumeData": {...} }
 * located at <chartsDir>/<fileName>. Saves and loads are serialized.
 */
class StateStore {
public:
    explicit StateStore(std::filesystem::path chartsDir,
                        std::string fileName = std::string(kDefaultStateFileName));

    /// Write to a temp sibling, then rename over the previous snapshot.
    Expected<void> save(const PersistedState& state);

    /// Never fails: a missing or unreadable file yields an empty state.
    LoadResult load();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex ioMutex_;
};

/**
 * What a recovery sweep changed.
 */
struct SweepReport {
    std::vector<std::string> orphaned;  // no partial, no final file
    std::vector<std::string> corrupt;   // zero-length partial deleted
    std::vector<std::string> completed; // final file already present
    std::vector<std::string> repaired;  // downloadedBytes resynced to the partial size

    [[nodiscard]] bool empty() const noexcept {
        return orphaned.empty() && corrupt.empty() && completed.empty() && repaired.empty();
    }
};

/**
 * Reconcile resume records with the partial and final files under chartsDir.
 * Idempotent: a second run over the same layout changes nothing.
 */
SweepReport sweepResumeRecords(std::map<std::string, ResumeRecord>& records,
                               const std::filesystem::path& chartsDir);

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:30:00.250Z
std::string formatTimestamp(std::chrono::system_clock::time_point tp);
std::optional<std::chrono::system_clock::time_point> parseTimestamp(std::string_view text);

} // namespace chartdl::downloader

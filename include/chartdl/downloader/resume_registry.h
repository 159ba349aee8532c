#pragma once

#include <chartdl/downloader/downloader.hpp>

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace chartdl::downloader {

/**
 * In-memory table of ResumeRecords keyed by chart id. Thread-safe.
 * Durability comes from the manager snapshotting all() through the StateStore.
 */
class ResumeRegistry {
public:
    [[nodiscard]] std::optional<ResumeRecord> get(std::string_view chartId) const;
    void put(ResumeRecord record);

    /// Apply fn to the record for chartId if present. Returns the updated copy.
    std::optional<ResumeRecord> update(std::string_view chartId,
                                       const std::function<void(ResumeRecord&)>& fn);

    bool erase(std::string_view chartId);
    [[nodiscard]] std::map<std::string, ResumeRecord> all() const;
    void replaceAll(std::map<std::string, ResumeRecord> records);

private:
    std::map<std::string, ResumeRecord, std::less<>> table_;
    mutable std::shared_mutex mutex_;
};

} // namespace chartdl::downloader

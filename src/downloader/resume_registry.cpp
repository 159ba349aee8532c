#include <chartdl/downloader/resume_registry.h>

#include <spdlog/spdlog.h>

#include <mutex>
#include <utility>

namespace chartdl::downloader {

std::optional<ResumeRecord> ResumeRegistry::get(std::string_view chartId) const {
    std::shared_lock lk(mutex_);
    auto it = table_.find(chartId);
    if (it == table_.end())
        return std::nullopt;
    return it->second;
}

void ResumeRegistry::put(ResumeRecord record) {
    spdlog::debug("ResumeRegistry: chart='{}' bytes={} attempts={}", record.chartId,
                  record.downloadedBytes, record.attempts);
    std::unique_lock lk(mutex_);
    auto key = record.chartId;
    table_.insert_or_assign(std::move(key), std::move(record));
}

std::optional<ResumeRecord> ResumeRegistry::update(std::string_view chartId,
                                                   const std::function<void(ResumeRecord&)>& fn) {
    std::unique_lock lk(mutex_);
    auto it = table_.find(chartId);
    if (it == table_.end())
        return std::nullopt;
    fn(it->second);
    return it->second;
}

bool ResumeRegistry::erase(std::string_view chartId) {
    std::unique_lock lk(mutex_);
    auto it = table_.find(chartId);
    if (it == table_.end())
        return false;
    table_.erase(it);
    return true;
}

std::map<std::string, ResumeRecord> ResumeRegistry::all() const {
    std::shared_lock lk(mutex_);
    return {table_.begin(), table_.end()};
}

void ResumeRegistry::replaceAll(std::map<std::string, ResumeRecord> records) {
    std::unique_lock lk(mutex_);
    table_.clear();
    for (auto& [id, rec] : records)
        table_.emplace(id, std::move(rec));
}

} // namespace chartdl::downloader

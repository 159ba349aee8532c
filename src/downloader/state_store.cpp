/*
 * Durable snapshot of the download manager (nlohmann::json) and the startup
 * sweep that reconciles resume records with the files actually on disk.
 */

#include <chartdl/downloader/state_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <limits>
#include <system_error>

namespace chartdl::downloader {

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(tp);
    auto ms = duration_cast<milliseconds>(tp - secs).count();
    if (ms < 0) {
        secs -= seconds{1};
        ms += 1000;
    }
    std::time_t t = system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                  tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(ms));
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(std::string_view text) {
    std::string s(text);
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &mon, &day, &hour, &min, &sec,
                    &consumed) != 6) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60)
        return std::nullopt;

    long frac_ms = 0;
    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 3) {
                frac_ms = frac_ms * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        while (digits > 0 && digits < 3) {
            frac_ms *= 10;
            ++digits;
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds{frac_ms};
}

namespace {

json optionalString(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

std::optional<std::string> readString(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string())
        return obj[key].get<std::string>();
    return std::nullopt;
}

std::optional<std::uint64_t> readUnsigned(const json& obj, const char* key) {
    if (!obj.contains(key))
        return std::nullopt;
    const auto& v = obj[key];
    if (v.is_number_unsigned())
        return v.get<std::uint64_t>();
    if (v.is_number_integer() && v.get<std::int64_t>() >= 0)
        return static_cast<std::uint64_t>(v.get<std::int64_t>());
    return std::nullopt;
}

std::chrono::system_clock::time_point readTime(const json& obj, const char* key) {
    if (auto s = readString(obj, key)) {
        if (auto tp = parseTimestamp(*s))
            return *tp;
    }
    return std::chrono::system_clock::now();
}

json taskToJson(const DownloadTask& t) {
    json j;
    j["chartId"] = t.chartId;
    j["url"] = t.url;
    j["priority"] = std::string(toString(t.priority));
    j["expectedChecksum"] = optionalString(t.expectedChecksum);
    j["addedAt"] = formatTimestamp(t.addedAt);
    return j;
}

std::optional<DownloadTask> taskFromJson(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    auto id = readString(j, "chartId");
    auto url = readString(j, "url");
    if (!id || !url || id->empty())
        return std::nullopt;
    DownloadTask t;
    t.chartId = *id;
    t.url = *url;
    if (auto p = readString(j, "priority")) {
        t.priority = parsePriority(*p).value_or(DownloadPriority::Normal);
    }
    t.expectedChecksum = readString(j, "expectedChecksum");
    t.addedAt = readTime(j, "addedAt");
    return t;
}

json progressToJson(const DownloadProgress& p) {
    json j;
    j["chartId"] = p.chartId;
    j["status"] = std::string(toString(p.status));
    j["progress"] = p.progress;
    j["totalBytes"] = p.totalBytes ? json(*p.totalBytes) : json(nullptr);
    j["downloadedBytes"] = p.downloadedBytes ? json(*p.downloadedBytes) : json(nullptr);
    j["lastUpdated"] = formatTimestamp(p.lastUpdated);
    j["errorMessage"] = optionalString(p.errorMessage);
    j["errorCategory"] = optionalString(p.errorCategory);
    j["url"] = optionalString(p.url);
    return j;
}

std::optional<DownloadProgress> progressFromJson(const std::string& key, const json& j) {
    if (!j.is_object())
        return std::nullopt;
    DownloadProgress p;
    p.chartId = readString(j, "chartId").value_or(key);
    auto status = readString(j, "status");
    if (!status)
        return std::nullopt;
    auto parsed = parseStatus(*status);
    if (!parsed)
        return std::nullopt;
    p.status = *parsed;
    if (j.contains("progress") && j["progress"].is_number()) {
        double v = j["progress"].get<double>();
        p.progress = v < 0.0 ? 0.0 : (v > 1.0 ? 1.0 : v);
    }
    p.totalBytes = readUnsigned(j, "totalBytes");
    p.downloadedBytes = readUnsigned(j, "downloadedBytes");
    p.lastUpdated = readTime(j, "lastUpdated");
    p.errorMessage = readString(j, "errorMessage");
    p.errorCategory = readString(j, "errorCategory");
    p.url = readString(j, "url");
    return p;
}

json recordToJson(const ResumeRecord& r) {
    json j;
    j["chartId"] = r.chartId;
    j["originalUrl"] = r.originalUrl;
    j["downloadedBytes"] = r.downloadedBytes;
    j["lastAttempt"] = formatTimestamp(r.lastAttempt);
    j["checksum"] = optionalString(r.checksum);
    j["supportsRange"] = r.supportsRange ? json(*r.supportsRange) : json(nullptr);
    j["attempts"] = r.attempts;
    j["lastErrorCode"] = optionalString(r.lastErrorCode);
    return j;
}

std::optional<ResumeRecord> recordFromJson(const std::string& key, const json& j) {
    if (!j.is_object())
        return std::nullopt;
    auto url = readString(j, "originalUrl");
    if (!url)
        return std::nullopt;
    ResumeRecord r;
    r.chartId = readString(j, "chartId").value_or(key);
    r.originalUrl = *url;
    r.downloadedBytes = readUnsigned(j, "downloadedBytes").value_or(0);
    r.lastAttempt = readTime(j, "lastAttempt");
    r.checksum = readString(j, "checksum");
    if (j.contains("supportsRange") && j["supportsRange"].is_boolean())
        r.supportsRange = j["supportsRange"].get<bool>();
    if (auto attempts = readUnsigned(j, "attempts")) {
        constexpr auto kMaxAttempts = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
        r.attempts = static_cast<int>(std::min(*attempts, kMaxAttempts));
    }
    r.lastErrorCode = readString(j, "lastErrorCode");
    return r;
}

PersistedState stateFromJson(const json& root) {
    PersistedState st;
    if (root.contains("queue") && root["queue"].is_array()) {
        for (const auto& item : root["queue"]) {
            if (auto t = taskFromJson(item)) {
                st.queue.push_back(std::move(*t));
            } else {
                spdlog::debug("Skipping malformed queue entry in download state");
            }
        }
    }
    if (root.contains("downloads") && root["downloads"].is_object()) {
        for (const auto& el : root["downloads"].items()) {
            if (auto p = progressFromJson(el.key(), el.value()))
                st.downloads.emplace(el.key(), std::move(*p));
        }
    }
    if (root.contains("resumeData") && root["resumeData"].is_object()) {
        for (const auto& el : root["resumeData"].items()) {
            if (auto r = recordFromJson(el.key(), el.value()))
                st.resumeData.emplace(el.key(), std::move(*r));
        }
    }
    return st;
}

} // namespace

StateStore::StateStore(fs::path chartsDir, std::string fileName)
    : path_(std::move(chartsDir) / std::move(fileName)) {}

Expected<void> StateStore::save(const PersistedState& state) {
    json root;
    root["queue"] = json::array();
    for (const auto& t : state.queue)
        root["queue"].push_back(taskToJson(t));
    root["downloads"] = json::object();
    for (const auto& [id, p] : state.downloads)
        root["downloads"][id] = progressToJson(p);
    root["resumeData"] = json::object();
    for (const auto& [id, r] : state.resumeData)
        root["resumeData"][id] = recordToJson(r);

    std::lock_guard<std::mutex> lk(ioMutex_);
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     "Failed to create state dir " + path_.parent_path().string() + ": " +
                         ec.message()};
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to open download state for write"};
        }
        out << root.dump(2);
        out.flush();
        if (!out) {
            return Error{ErrorCode::IoError, "Failed to write download state"};
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError, "Failed to replace download state: " + ec.message()};
    }
    return {};
}

LoadResult StateStore::load() {
    std::lock_guard<std::mutex> lk(ioMutex_);
    LoadResult result;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::debug("No persistent download state found at {}", path_.string());
        result.outcome = LoadOutcome::Missing;
        return result;
    }

    std::ifstream in(path_);
    if (!in) {
        spdlog::warn("Failed to load download state: cannot open {}", path_.string());
        result.outcome = LoadOutcome::Corrupt;
        return result;
    }

    try {
        json root;
        in >> root;
        if (!root.is_object()) {
            spdlog::warn("Failed to load download state: root is not an object");
            result.outcome = LoadOutcome::Corrupt;
            return result;
        }
        result.state = stateFromJson(root);
        result.outcome = LoadOutcome::Loaded;
        spdlog::info("Download state loaded from disk ({} queued, {} downloads, {} resume records)",
                     result.state.queue.size(), result.state.downloads.size(),
                     result.state.resumeData.size());
    } catch (const json::exception& e) {
        spdlog::warn("Failed to load download state: {}", e.what());
        result = LoadResult{};
        result.outcome = LoadOutcome::Corrupt;
    }
    return result;
}

SweepReport sweepResumeRecords(std::map<std::string, ResumeRecord>& records,
                               const fs::path& chartsDir) {
    SweepReport report;
    for (auto it = records.begin(); it != records.end();) {
        auto& rec = it->second;
        const auto finalPath = finalPathFor(chartsDir, rec.chartId, rec.originalUrl);
        const auto partPath = partialPathFor(finalPath);

        std::error_code ec;
        bool partExists = fs::is_regular_file(partPath, ec);
        bool finalExists = fs::is_regular_file(finalPath, ec);

        if (!partExists && !finalExists) {
            spdlog::info("Removing orphaned resume record for {}", rec.chartId);
            report.orphaned.push_back(rec.chartId);
            it = records.erase(it);
            continue;
        }

        std::uint64_t partSize = 0;
        if (partExists) {
            partSize = fs::file_size(partPath, ec);
            if (ec) {
                spdlog::warn("Cannot stat partial file {}: {}", partPath.string(), ec.message());
                ++it;
                continue;
            }
            if (partSize == 0) {
                spdlog::warn("Removing zero-length partial file for {}", rec.chartId);
                fs::remove(partPath, ec);
                if (ec) {
                    spdlog::warn("Failed to delete {}: {}", partPath.string(), ec.message());
                }
                report.corrupt.push_back(rec.chartId);
                it = records.erase(it);
                continue;
            }
        }

        if (finalExists) {
            auto finalSize = fs::file_size(finalPath, ec);
            if (!ec && finalSize >= rec.downloadedBytes) {
                spdlog::info("Chart {} already complete on disk; dropping resume record",
                             rec.chartId);
                if (partExists) {
                    fs::remove(partPath, ec);
                    if (ec) {
                        spdlog::warn("Failed to delete stale partial {}: {}", partPath.string(),
                                     ec.message());
                    }
                }
                report.completed.push_back(rec.chartId);
                it = records.erase(it);
                continue;
            }
        }

        if (partExists && partSize != rec.downloadedBytes) {
            spdlog::info("Resume record for {} claimed {} bytes; partial file has {}", rec.chartId,
                         rec.downloadedBytes, partSize);
            rec.downloadedBytes = partSize;
            report.repaired.push_back(rec.chartId);
        }
        ++it;
    }
    return report;
}

} // namespace chartdl::downloader

#include <chartdl/common/logging.h>
#include <chartdl/config/config_helpers.h>
#include <chartdl/config/downloader_config.h>
#include <chartdl/downloader/curl_transport.h>
#include <chartdl/downloader/download_manager.h>
#include <chartdl/downloader/state_store.h>

#include <CLI/CLI.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <map>
#include <string>
#include <vector>

namespace dl = chartdl::downloader;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) {
    g_interrupted.store(true);
}

bool splitPair(const std::string& arg, std::string& key, std::string& value) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size())
        return false;
    key = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

std::string percent(double p) {
    return fmt::format("{:5.1f}%", p * 100.0);
}

void printProgress(const std::map<std::string, dl::DownloadProgress>& all) {
    for (const auto& [id, p] : all) {
        std::string line = fmt::format("  {:<24} {:<11} {}", id, dl::toString(p.status),
                                       percent(p.progress));
        if (p.bytesPerSecond && *p.bytesPerSecond > 0)
            line += fmt::format("  {:.1f} KiB/s", *p.bytesPerSecond / 1024.0);
        if (p.errorMessage)
            line += fmt::format("  ({})", *p.errorMessage);
        fmt::print(stderr, "{}\n", line);
    }
}

int runGet(const dl::DownloaderConfig& cfg, const std::vector<std::string>& pairs,
           const std::vector<std::string>& checksums, const std::string& priorityName) {
    auto priority = dl::parsePriority(priorityName);
    if (!priority) {
        fmt::print(stderr, "Unknown priority '{}'\n", priorityName);
        return 2;
    }

    std::map<std::string, std::string> expected;
    for (const auto& c : checksums) {
        std::string id, hex;
        if (!splitPair(c, id, hex)) {
            fmt::print(stderr, "Expected --checksum ID=HEX, got '{}'\n", c);
            return 2;
        }
        expected[id] = hex;
    }

    std::vector<std::pair<std::string, std::string>> requests;
    for (const auto& p : pairs) {
        std::string id, url;
        if (!splitPair(p, id, url)) {
            fmt::print(stderr, "Expected ID=URL, got '{}'\n", p);
            return 2;
        }
        requests.emplace_back(id, url);
    }

    dl::ManagerOptions opts;
    opts.config = cfg;
    dl::DownloadManager manager(opts, dl::makeCurlTransport(dl::transportOptionsFrom(cfg)));

    for (const auto& [id, url] : requests) {
        std::optional<std::string> checksum;
        if (auto it = expected.find(id); it != expected.end())
            checksum = it->second;
        if (!manager.addToQueue(id, url, *priority, checksum))
            spdlog::info("{} is already scheduled", id);
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!manager.waitForIdle(std::chrono::milliseconds(1000))) {
        if (g_interrupted.load()) {
            fmt::print(stderr, "Interrupted; partial files are kept for the next run\n");
            manager.dispose();
            return 130;
        }
        printProgress(manager.getAllProgress());
    }

    int failures = 0;
    auto all = manager.getAllProgress();
    for (const auto& [id, url] : requests) {
        auto it = all.find(id);
        if (it == all.end())
            continue;
        const auto& p = it->second;
        if (p.status == dl::DownloadStatus::Completed) {
            fmt::print("{} -> {}\n", id, dl::finalPathFor(cfg.chartsDir, id, url).string());
        } else {
            ++failures;
            fmt::print("{} {}: {}\n", id, dl::toString(p.status), p.errorMessage.value_or("-"));
        }
    }
    manager.dispose();
    return failures == 0 ? 0 : 1;
}

int runStatus(const dl::DownloaderConfig& cfg) {
    dl::StateStore store(cfg.chartsDir, cfg.stateFileName);
    auto loaded = store.load();
    if (loaded.outcome == dl::LoadOutcome::Missing) {
        fmt::print("No download state in {}\n", cfg.chartsDir.string());
        return 0;
    }
    if (loaded.outcome == dl::LoadOutcome::Corrupt) {
        fmt::print("State file {} is unreadable\n", store.path().string());
        return 1;
    }

    const auto& st = loaded.state;
    fmt::print("Queue ({}):\n", st.queue.size());
    for (const auto& t : st.queue)
        fmt::print("  {:<24} {:<7} {}\n", t.chartId, dl::toString(t.priority), t.url);
    fmt::print("Downloads ({}):\n", st.downloads.size());
    printProgress(st.downloads);
    fmt::print("Resume records ({}):\n", st.resumeData.size());
    for (const auto& [id, r] : st.resumeData) {
        fmt::print("  {:<24} {} bytes, {} attempts{}\n", id, r.downloadedBytes, r.attempts,
                   r.lastErrorCode ? ", last error " + *r.lastErrorCode : std::string{});
    }
    return 0;
}

int runSweep(const dl::DownloaderConfig& cfg) {
    dl::StateStore store(cfg.chartsDir, cfg.stateFileName);
    auto loaded = store.load();
    auto report = dl::sweepResumeRecords(loaded.state.resumeData, cfg.chartsDir);
    fmt::print("orphaned {}, corrupt {}, completed {}, repaired {}\n", report.orphaned.size(),
               report.corrupt.size(), report.completed.size(), report.repaired.size());
    if (report.empty())
        return 0;
    auto r = store.save(loaded.state);
    if (!r.ok()) {
        fmt::print(stderr, "Failed to save state: {}\n", r.error().message);
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Resumable chart downloader", "chartdl"};
    app.require_subcommand(1);

    std::string configPath;
    std::string chartsDir;
    std::string logLevel;
    std::size_t maxConcurrent = 0;
    app.add_option("--config", configPath, "Config file (default: ~/.config/chartdl/config.toml)");
    app.add_option("--dir", chartsDir, "Charts directory");
    app.add_option("--log-level", logLevel, "trace|debug|info|warn|error");
    app.add_option("--max-concurrent", maxConcurrent, "Parallel downloads")
        ->check(CLI::PositiveNumber);

    auto* get = app.add_subcommand("get", "Download charts given as ID=URL");
    std::vector<std::string> pairs;
    std::vector<std::string> checksums;
    std::string priority = "normal";
    get->add_option("charts", pairs, "ID=URL pairs")->required();
    get->add_option("--checksum", checksums, "Expected digest as ID=HEX (sha256, sha512 or md5)");
    get->add_option("--priority", priority, "high|normal|low")
        ->check(CLI::IsMember({"high", "normal", "low"}));

    auto* status = app.add_subcommand("status", "Print the persisted download state");
    auto* sweep = app.add_subcommand("sweep", "Reconcile resume records with files on disk");

    CLI11_PARSE(app, argc, argv);

    auto loaded = chartdl::config::loadDownloaderConfig(chartdl::config::get_config_path(configPath));
    if (!loaded.ok()) {
        fmt::print(stderr, "{}\n", loaded.error().message);
        return 2;
    }
    auto cfg = loaded.value();
    if (!chartsDir.empty())
        cfg.chartsDir = chartdl::config::expand_tilde(chartsDir);
    if (maxConcurrent > 0)
        cfg.maxConcurrent = maxConcurrent;
    if (!logLevel.empty())
        cfg.logLevel = logLevel;
    chartdl::logging::initLogging(cfg.logLevel);

    if (get->parsed())
        return runGet(cfg, pairs, checksums, priority);
    if (status->parsed())
        return runStatus(cfg);
    if (sweep->parsed())
        return runSweep(cfg);
    return 0;
}

#include "downloader.hpp"

#include "errors.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

Downloader::Downloader(Fetcher& fetcher, std::ostream& out, std::ostream& err)
    : fetcher_(fetcher), out_(out), err_(err) {}

void Downloader::flush(const std::vector<LogLine>& lines) {
    for (const auto& l : lines) (l.error ? err_ : out_) << l.text << std::endl;
}

std::vector<Downloader::LogLine> Downloader::process_entry(ManifestEntry& entry,
                                                           const std::string& output_dir,
                                                           bool dry_run) {
    std::vector<LogLine> log;

    if (entry.source_url.empty()) {
        entry.state = DownloadState::Failed;
        log.push_back({true, "Empty URL for " + entry.filename + ". Ignoring..."});
        return log;
    }

    entry.local_path = (fs::path(output_dir) / entry.filename).string();

    if (dry_run) {
        log.push_back({false, entry.local_path + ":  <--- " + entry.source_url});
        return log;
    }

    log.push_back({false, "Downloading: " + entry.source_url});

    // a link counts as taken even when it dangles
    std::error_code ec;
    if (fs::exists(fs::symlink_status(entry.local_path, ec))) {
        entry.state = DownloadState::Skipped;
        log.push_back({false, "  File " + entry.local_path + " already exists! Ignoring..."});
        return log;
    }

    FetchResult r = fetcher_.get(entry.source_url, kResourceTimeoutMs);
    if (!r.ok()) {
        entry.state = DownloadState::Failed;
        log.push_back({true, "  Failed: " + entry.source_url + " (" + r.error + ")"});
        return log;
    }

    std::ofstream ofs(entry.local_path, std::ios::binary);
    if (ofs) {
        ofs.write(r.body.data(), static_cast<std::streamsize>(r.body.size()));
        ofs.close();
    }
    if (!ofs) {
        entry.state = DownloadState::Failed;
        // never leave a truncated file behind
        fs::remove(entry.local_path, ec);
        log.push_back({true, "  Failed: could not write " + entry.local_path});
        return log;
    }

    entry.state = DownloadState::Success;
    log.push_back({false, "  Saved: " + entry.local_path + " (" + std::to_string(r.body.size()) + " bytes)"});
    return log;
}

std::vector<Downloader::LogLine> Downloader::run_entry(ManifestEntry& entry,
                                                       const std::string& output_dir,
                                                       bool dry_run) {
    try {
        return process_entry(entry, output_dir, dry_run);
    } catch (const std::exception& e) {
        entry.state = DownloadState::Failed;
        return {{true, "  Failed: " + entry.source_url + " (" + e.what() + ")"}};
    }
}

void Downloader::download(Manifest& manifest, const std::string& output_dir, const DownloadOptions& options) {
    std::error_code ec;
    if (output_dir.empty() || !fs::is_directory(output_dir, ec)) {
        throw OutputDirError("Target directory does not exist: " + output_dir);
    }

    auto& entries = manifest.entries();
    const unsigned jobs = std::min<unsigned>(std::max(1u, options.jobs), kMaxJobs);

    if (jobs == 1 || options.dry_run || entries.size() < 2) {
        for (auto& entry : entries) flush(run_entry(entry, output_dir, options.dry_run));
        return;
    }

    // Each worker claims whole entries, so no entry is touched by two threads.
    // Logs are held back and printed in manifest order once all workers finish.
    std::vector<std::vector<LogLine>> logs(entries.size());
    std::atomic<size_t> next{0};
    auto worker = [&] {
        for (;;) {
            size_t i = next++;
            if (i >= entries.size()) break;
            logs[i] = run_entry(entries[i], output_dir, false);
        }
    };

    const unsigned threads = std::min<unsigned>(jobs, static_cast<unsigned>(entries.size()));
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) pool.emplace_back(worker);
    for (auto& t : pool) t.join();

    for (const auto& l : logs) flush(l);
}

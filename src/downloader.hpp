#pragma once

#include "config.hpp"
#include "fetcher.hpp"
#include "manifest.hpp"

#include <iostream>
#include <string>
#include <vector>

struct DownloadOptions {
    bool dry_run = false;
    // Number of concurrent fetches; 1 keeps everything sequential.
    unsigned jobs = kDefaultJobs;
};

class Downloader {
public:
    Downloader(Fetcher& fetcher, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Fetches every entry into output_dir, setting local_path and state.
    // Throws OutputDirError before any fetch when output_dir is not a directory.
    // Per-entry failures are logged and never stop the pass.
    void download(Manifest& manifest, const std::string& output_dir, const DownloadOptions& options);

private:
    struct LogLine {
        bool error;
        std::string text;
    };

    std::vector<LogLine> process_entry(ManifestEntry& entry, const std::string& output_dir, bool dry_run);
    // process_entry() with any exception turned into a Failed entry.
    std::vector<LogLine> run_entry(ManifestEntry& entry, const std::string& output_dir, bool dry_run);
    void flush(const std::vector<LogLine>& lines);

    Fetcher& fetcher_;
    std::ostream& out_;
    std::ostream& err_;
};

#include "pipeline.hpp"

#include "downloader.hpp"
#include "errors.hpp"
#include "playlist.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

Pipeline::Pipeline(const ProviderRegistry& registry,
                   Fetcher& fetcher,
                   TagStore& tags,
                   std::ostream& out,
                   std::ostream& err)
    : registry_(registry), fetcher_(fetcher), tags_(tags), out_(out), err_(err) {}

Manifest Pipeline::create_manifest(const std::string& url, const std::vector<PatternSet>& rules) {
    out_ << "Visiting: " << url << std::endl;
    const std::string html = fetch_page(fetcher_, url);
    Manifest manifest = build_manifest(html, rules, err_);
    out_ << "  Chapters found on page: " << manifest.size() << std::endl;
    return manifest;
}

Manifest Pipeline::process(const std::string& url, const Options& options) {
    auto rules = registry_.match(url);

    std::error_code ec;
    if (options.output_dir.empty() || !fs::is_directory(options.output_dir, ec)) {
        throw OutputDirError("Target directory does not exist: " + options.output_dir);
    }

    Manifest manifest = create_manifest(url, rules);

    DownloadOptions dl;
    dl.dry_run = options.dry_run;
    dl.jobs = options.jobs;
    Downloader(fetcher_, out_, err_).download(manifest, options.output_dir, dl);

    if (options.playlist) {
        write_playlist(manifest, options.output_dir, options.playlist_format, options.dry_run, out_, err_);
    }

    if (options.write_manifest) {
        const std::string path = (fs::path(options.output_dir) / kManifestFileName).string();
        if (options.dry_run) {
            out_ << "Manifest would be written: " << path << std::endl;
        } else if (write_manifest_json(manifest, path)) {
            out_ << "Manifest written: " << path << ", items: " << manifest.size() << std::endl;
        } else {
            err_ << "Error writing to " << path << std::endl;
        }
    }

    if (!options.no_tag && !options.dry_run) TagRewriter(tags_, out_, err_).retag(manifest);

    return manifest;
}

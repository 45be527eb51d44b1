#pragma once

#include "config.hpp"
#include "fetcher.hpp"
#include "manifest.hpp"
#include "providers.hpp"
#include "tagger.hpp"

#include <iostream>
#include <string>
#include <vector>

struct Options {
    std::string output_dir;
    bool dry_run = false;
    bool playlist = false;
    std::string playlist_format = kDefaultPlaylistFormat;
    bool no_tag = false;
    bool write_manifest = false;
    unsigned jobs = kDefaultJobs;
};

// build -> download -> playlist -> tag, for one page URL.
class Pipeline {
public:
    Pipeline(const ProviderRegistry& registry,
             Fetcher& fetcher,
             TagStore& tags,
             std::ostream& out = std::cout,
             std::ostream& err = std::cerr);

    // Fetches the page and extracts its chapters with already matched rules.
    // Throws FetchError when the page cannot be read.
    Manifest create_manifest(const std::string& url, const std::vector<PatternSet>& rules);

    // Fatal conditions (unsupported provider, missing output directory,
    // unreadable page) throw before any entry is processed.
    Manifest process(const std::string& url, const Options& options);

private:
    const ProviderRegistry& registry_;
    Fetcher& fetcher_;
    TagStore& tags_;
    std::ostream& out_;
    std::ostream& err_;
};

#include "manifest.hpp"

#include "text_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <ostream>
#include <stdexcept>

using nlohmann::json;

const char* to_string(DownloadState state) {
    switch (state) {
        case DownloadState::Pending: return "pending";
        case DownloadState::Success: return "success";
        case DownloadState::Failed: return "failed";
        case DownloadState::Skipped: return "skipped";
    }
    return "unknown";
}

// -------------------- Manifest --------------------
void Manifest::insert(ManifestEntry entry) {
    auto it = index_.find(entry.filename);
    if (it != index_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    index_.emplace(entry.filename, entries_.size());
    entries_.push_back(std::move(entry));
}

const ManifestEntry* Manifest::find(const std::string& filename) const {
    auto it = index_.find(filename);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

// -------------------- builder --------------------
std::string derive_filename(const std::string& title, int ordinal, const std::string& extension) {
    char num[16];
    std::snprintf(num, sizeof(num), "%03d", ordinal);
    if (title.empty()) return std::string("Part ") + num + "." + extension;
    return sanitize_filename(title) + " (" + num + ")." + extension;
}

std::string title_from_href(const std::string& href) {
    auto slash = href.find_last_of('/');
    std::string last = (slash == std::string::npos) ? href : href.substr(slash + 1);
    auto dot = last.find('.');
    return dot == std::string::npos ? last : last.substr(0, dot);
}

Manifest build_manifest(const std::string& html, const std::vector<PatternSet>& rules, std::ostream& err) {
    Manifest manifest;
    int ordinal = 0;
    for (const auto& p : rules) {
        if (!p.chapter) continue;

        std::vector<std::string> fragments;
        try {
            fragments = find_all(html, *p.chapter);
        } catch (const std::runtime_error& e) {
            err << "Chapter pattern of " << p.provider << " failed on this page: " << e.what() << std::endl;
            continue;
        }

        for (const auto& fragment : fragments) {
            ++ordinal;

            std::string href;
            std::string title;
            try {
                href = p.href ? find_first(fragment, *p.href) : fragment;
                if (href.empty()) continue;
                if (p.title_from_href) title = title_from_href(href);
                else if (p.title) title = find_first(fragment, *p.title);
            } catch (const std::runtime_error& e) {
                err << "Chapter " << ordinal << " of " << p.provider << " skipped: " << e.what() << std::endl;
                continue;
            }

            ManifestEntry entry;
            entry.filename = derive_filename(title, ordinal, p.extension);
            entry.source_url = href;
            entry.title = title.empty() ? entry.filename : title;
            manifest.insert(std::move(entry));
        }
    }
    return manifest;
}

// -------------------- export --------------------
bool write_manifest_json(const Manifest& manifest, const std::string& filepath) {
    json j = json::array();
    for (const auto& m : manifest) {
        j.push_back({
            {"filename", m.filename},
            {"url", m.source_url},
            {"title", m.title},
            {"path", m.local_path},
            {"state", to_string(m.state)}
        });
    }
    std::string text;
    try {
        text = j.dump(2);
    } catch (const json::type_error&) {
        return false;
    }
    std::ofstream ofs(filepath);
    if (!ofs) return false;
    ofs << text;
    return static_cast<bool>(ofs);
}

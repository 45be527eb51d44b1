#pragma once

#include "providers.hpp"

#include <cstddef>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

enum class DownloadState {
    Pending,
    Success,
    Failed,
    // Target already existed; nothing was fetched.
    Skipped
};

const char* to_string(DownloadState state);

struct ManifestEntry {
    std::string filename;
    std::string source_url;
    std::string title;
    std::string local_path;
    DownloadState state = DownloadState::Pending;
};

// Chapter entries keyed by filename, kept in insertion order.
class Manifest {
public:
    // A filename that is already present is overwritten in place: the entry
    // keeps the position of its first insertion.
    void insert(ManifestEntry entry);

    const ManifestEntry* find(const std::string& filename) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Callers may update source_url, title, local_path and state. filename keys
    // the index and must not be changed in place; use insert() instead.
    std::vector<ManifestEntry>& entries() { return entries_; }
    const std::vector<ManifestEntry>& entries() const { return entries_; }

    std::vector<ManifestEntry>::iterator begin() { return entries_.begin(); }
    std::vector<ManifestEntry>::iterator end() { return entries_.end(); }
    std::vector<ManifestEntry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<ManifestEntry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<ManifestEntry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// "{title} ({ordinal:03}).{ext}", or "Part {ordinal:03}.{ext}" for an empty title.
std::string derive_filename(const std::string& title, int ordinal, const std::string& extension);

// Last path segment of the url, cut at its first '.'.
std::string title_from_href(const std::string& href);

// Applies each rule to the page in order. The ordinal counter runs across all
// rules and advances for every chapter fragment, including skipped ones.
// A pattern that exceeds the regex engine's limits is reported on err and
// drops only that rule (or that fragment).
Manifest build_manifest(const std::string& html, const std::vector<PatternSet>& rules, std::ostream& err = std::cerr);

// Writes the manifest as a JSON array. Returns false when the file cannot be written.
bool write_manifest_json(const Manifest& manifest, const std::string& filepath);

#pragma once

#include "manifest.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Tag fields of one opened audio file.
class TagHandle {
public:
    virtual ~TagHandle() = default;
    virtual std::optional<std::string> get(const std::string& field) const = 0;
    virtual void set(const std::string& field, const std::string& value) = 0;
    virtual bool save() = 0;
};

class TagStore {
public:
    virtual ~TagStore() = default;
    // Throws TagError when the file has no readable tags.
    virtual std::unique_ptr<TagHandle> load(const std::string& path) = 0;
};

// TagLib backed store. Field names are TagLib property keys, case-insensitive.
class TagLibTagStore : public TagStore {
public:
    std::unique_ptr<TagHandle> load(const std::string& path) override;
};

// Appends chapter titles to the title tag of downloaded files.
class TagRewriter {
public:
    explicit TagRewriter(TagStore& store, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Visits entries in manifest order. Only entries whose file is on disk
    // (Success or Skipped) are touched; a failing file is logged and skipped.
    void retag(const Manifest& manifest);

    // Returns true when the title tag was changed. Throws on load/save failure.
    bool retag_entry(const ManifestEntry& entry);

private:
    TagStore& store_;
    std::ostream& out_;
    std::ostream& err_;
};

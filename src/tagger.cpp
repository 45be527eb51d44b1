#include "tagger.hpp"

#include "errors.hpp"
#include "text_utils.hpp"

#include <taglib/fileref.h>
#include <taglib/tpropertymap.h>
#include <taglib/tstring.h>

namespace {

class TagLibHandle : public TagHandle {
public:
    explicit TagLibHandle(const std::string& path)
        : path_(path), file_(path.c_str()) {
        if (file_.isNull() || !file_.file()) throw TagError("cannot read tags from " + path);
    }

    std::optional<std::string> get(const std::string& field) const override {
        TagLib::PropertyMap props = file_.file()->properties();
        auto it = props.find(TagLib::String(to_upper(field), TagLib::String::UTF8));
        if (it == props.end() || it->second.isEmpty()) return std::nullopt;
        return std::string(it->second.front().toCString(true));
    }

    void set(const std::string& field, const std::string& value) override {
        TagLib::PropertyMap props = file_.file()->properties();
        props.replace(TagLib::String(to_upper(field), TagLib::String::UTF8),
                      TagLib::StringList(TagLib::String(value, TagLib::String::UTF8)));
        TagLib::PropertyMap rejected = file_.file()->setProperties(props);
        if (!rejected.isEmpty()) throw TagError("field " + field + " not supported by " + path_);
    }

    bool save() override { return file_.save(); }

private:
    std::string path_;
    TagLib::FileRef file_;
};

}  // namespace

std::unique_ptr<TagHandle> TagLibTagStore::load(const std::string& path) {
    return std::make_unique<TagLibHandle>(path);
}

// -------------------- rewriter --------------------
TagRewriter::TagRewriter(TagStore& store, std::ostream& out, std::ostream& err)
    : store_(store), out_(out), err_(err) {}

bool TagRewriter::retag_entry(const ManifestEntry& entry) {
    auto tags = store_.load(entry.local_path);
    const std::string current = tags->get("title").value_or("");
    if (current.find(entry.title) != std::string::npos) return false;

    const std::string title = current.empty() ? entry.title : current + " " + entry.title;
    tags->set("title", title);
    if (!tags->save()) throw TagError("could not save tags");
    out_ << "File " << entry.local_path << ": Title tag changed to \"" << title << "\"" << std::endl;
    return true;
}

void TagRewriter::retag(const Manifest& manifest) {
    for (const auto& entry : manifest) {
        if (entry.local_path.empty()) continue;
        if (entry.state != DownloadState::Success && entry.state != DownloadState::Skipped) continue;
        try {
            retag_entry(entry);
        } catch (const std::exception& e) {
            err_ << "Error tagging " << entry.local_path << ": " << e.what() << std::endl;
        }
    }
}

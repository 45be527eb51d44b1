#pragma once

#include "errors.hpp"
#include "fetcher.hpp"
#include "tagger.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

// In-memory Fetcher. Unknown URLs fail like an unreachable host.
class FakeFetcher : public Fetcher {
public:
    void add(const std::string& url, const std::string& body, long status = 200) {
        std::lock_guard<std::mutex> lk(mtx_);
        FetchResult r;
        r.status = status;
        if (status >= 400) r.error = "HTTP " + std::to_string(status);
        else r.body = body;
        responses_[url] = r;
    }

    FetchResult get(const std::string& url, int /*timeout_ms*/) override {
        std::lock_guard<std::mutex> lk(mtx_);
        calls_.push_back(url);
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            FetchResult r;
            r.error = "Could not resolve host";
            return r;
        }
        return it->second;
    }

    std::vector<std::string> calls() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_;
    }

private:
    mutable std::mutex mtx_;
    std::map<std::string, FetchResult> responses_;
    std::vector<std::string> calls_;
};

// Tags stored per path in a map shared by every handle.
class FakeTagStore : public TagStore {
public:
    struct FileTags {
        std::map<std::string, std::string> fields;
        bool fail_save = false;
        int saves = 0;
    };

    std::map<std::string, FileTags> files;

    std::unique_ptr<TagHandle> load(const std::string& path) override {
        auto it = files.find(path);
        if (it == files.end()) throw TagError("cannot read tags from " + path);
        return std::make_unique<Handle>(it->second);
    }

private:
    class Handle : public TagHandle {
    public:
        explicit Handle(FileTags& file) : file_(file), pending_(file.fields) {}

        std::optional<std::string> get(const std::string& field) const override {
            auto it = pending_.find(field);
            if (it == pending_.end()) return std::nullopt;
            return it->second;
        }
        void set(const std::string& field, const std::string& value) override { pending_[field] = value; }
        bool save() override {
            if (file_.fail_save) return false;
            file_.fields = pending_;
            ++file_.saves;
            return true;
        }

    private:
        FileTags& file_;
        std::map<std::string, std::string> pending_;
    };
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("audiobook_dl_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    size_t file_count() const {
        size_t n = 0;
        for (auto it = std::filesystem::directory_iterator(path_); it != std::filesystem::directory_iterator(); ++it) ++n;
        return n;
    }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::filesystem::path& p, const std::string& data) {
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
}

#include "downloader.hpp"
#include "errors.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

namespace {

Manifest make_manifest(size_t n) {
    Manifest m;
    for (size_t i = 1; i <= n; ++i) {
        ManifestEntry e;
        e.filename = "Ch" + std::to_string(i) + " (00" + std::to_string(i) + ").mp3";
        e.source_url = "https://cdn.example.com/" + std::to_string(i) + ".mp3";
        e.title = "Ch" + std::to_string(i);
        m.insert(e);
    }
    return m;
}

size_t count_lines(const std::string& s) {
    size_t n = 0;
    for (char c : s) if (c == '\n') ++n;
    return n;
}

}  // namespace

TEST(Downloader, FetchesEveryEntry) {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.add("https://cdn.example.com/1.mp3", std::string("ID3\0\x01", 5));
    fetcher.add("https://cdn.example.com/2.mp3", "second");
    Manifest m = make_manifest(2);
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    for (const auto& e : m) {
        EXPECT_EQ(e.state, DownloadState::Success);
        EXPECT_EQ(e.local_path, (dir.path() / e.filename).string());
    }
    EXPECT_EQ(read_file(dir.path() / "Ch1 (001).mp3"), std::string("ID3\0\x01", 5));
    EXPECT_EQ(read_file(dir.path() / "Ch2 (002).mp3"), "second");
    EXPECT_TRUE(err.str().empty());
}

TEST(Downloader, MissingOutputDirectoryFailsBeforeAnyFetch) {
    TempDir dir;
    FakeFetcher fetcher;
    Manifest m = make_manifest(2);
    std::ostringstream out, err;

    EXPECT_THROW(Downloader(fetcher, out, err).download(m, (dir.path() / "nope").string(), {}), OutputDirError);
    EXPECT_TRUE(fetcher.calls().empty());
    EXPECT_EQ(dir.file_count(), 0u);

    write_file(dir.path() / "plain_file", "x");
    EXPECT_THROW(Downloader(fetcher, out, err).download(m, (dir.path() / "plain_file").string(), {}), OutputDirError);
}

TEST(Downloader, ExistingTargetIsLeftUntouched) {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.add("https://cdn.example.com/1.mp3", "new bytes");
    fetcher.add("https://cdn.example.com/2.mp3", "two");
    write_file(dir.path() / "Ch1 (001).mp3", "old bytes");
    Manifest m = make_manifest(2);
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    EXPECT_EQ(m.entries()[0].state, DownloadState::Skipped);
    EXPECT_EQ(read_file(dir.path() / "Ch1 (001).mp3"), "old bytes");
    EXPECT_EQ(m.entries()[1].state, DownloadState::Success);
    EXPECT_EQ(fetcher.calls(), (std::vector<std::string>{"https://cdn.example.com/2.mp3"}));
    EXPECT_NE(out.str().find("already exists"), std::string::npos);
}

TEST(Downloader, ExistingDirectoryAtTargetIsSkipped) {
    TempDir dir;
    FakeFetcher fetcher;
    std::filesystem::create_directory(dir.path() / "Ch1 (001).mp3");
    Manifest m = make_manifest(1);
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    EXPECT_EQ(m.entries()[0].state, DownloadState::Skipped);
    EXPECT_TRUE(fetcher.calls().empty());
}

TEST(Downloader, FailedFetchDoesNotStopThePass) {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.add("https://cdn.example.com/1.mp3", "", 404);
    fetcher.add("https://cdn.example.com/3.mp3", "three");
    Manifest m = make_manifest(3);
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    EXPECT_EQ(m.entries()[0].state, DownloadState::Failed);
    EXPECT_EQ(m.entries()[1].state, DownloadState::Failed);
    EXPECT_EQ(m.entries()[2].state, DownloadState::Success);
    EXPECT_EQ(fetcher.calls().size(), 3u);
    EXPECT_EQ(dir.file_count(), 1u);
    EXPECT_NE(err.str().find("HTTP 404"), std::string::npos);
    EXPECT_NE(err.str().find("Could not resolve host"), std::string::npos);
}

TEST(Downloader, EmptyUrlFailsWithoutNetwork) {
    TempDir dir;
    FakeFetcher fetcher;
    Manifest m;
    m.insert({"Part 001.mp3", "", "Part 001.mp3", "", DownloadState::Pending});
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    EXPECT_EQ(m.entries()[0].state, DownloadState::Failed);
    EXPECT_TRUE(m.entries()[0].local_path.empty());
    EXPECT_TRUE(fetcher.calls().empty());
    EXPECT_NE(err.str().find("Empty URL for Part 001.mp3"), std::string::npos);
}

TEST(Downloader, DryRunOnlyReportsPlan) {
    TempDir dir;
    FakeFetcher fetcher;
    Manifest m = make_manifest(2);
    std::ostringstream out, err;
    DownloadOptions options;
    options.dry_run = true;

    Downloader(fetcher, out, err).download(m, dir.str(), options);

    EXPECT_TRUE(fetcher.calls().empty());
    EXPECT_EQ(dir.file_count(), 0u);
    EXPECT_EQ(count_lines(out.str()), 2u);
    const std::string first = (dir.path() / "Ch1 (001).mp3").string() + ":  <--- https://cdn.example.com/1.mp3\n";
    EXPECT_EQ(out.str().substr(0, first.size()), first);
    for (const auto& e : m) EXPECT_EQ(e.state, DownloadState::Pending);
}

TEST(Downloader, ConcurrentJobsKeepLogOrder) {
    TempDir dir;
    FakeFetcher fetcher;
    for (int i = 1; i <= 6; ++i) {
        if (i == 4) continue;
        fetcher.add("https://cdn.example.com/" + std::to_string(i) + ".mp3", "body" + std::to_string(i));
    }
    Manifest m = make_manifest(6);
    std::ostringstream out, err;
    DownloadOptions options;
    options.jobs = 4;

    Downloader(fetcher, out, err).download(m, dir.str(), options);

    for (size_t i = 0; i < m.size(); ++i) {
        EXPECT_EQ(m.entries()[i].state, i == 3 ? DownloadState::Failed : DownloadState::Success);
    }
    EXPECT_EQ(fetcher.calls().size(), 6u);

    const std::string log = out.str();
    size_t last = 0;
    for (int i = 1; i <= 6; ++i) {
        size_t pos = log.find("Downloading: https://cdn.example.com/" + std::to_string(i) + ".mp3");
        ASSERT_NE(pos, std::string::npos);
        EXPECT_GE(pos, last);
        last = pos;
    }
}

namespace {

// Throws for one URL, delegates the rest.
class ThrowingFetcher : public Fetcher {
public:
    ThrowingFetcher(FakeFetcher& inner, std::string bad_url) : inner_(inner), bad_url_(std::move(bad_url)) {}

    FetchResult get(const std::string& url, int timeout_ms) override {
        if (url == bad_url_) throw std::runtime_error("connection pool exhausted");
        return inner_.get(url, timeout_ms);
    }

private:
    FakeFetcher& inner_;
    std::string bad_url_;
};

}  // namespace

TEST(Downloader, ThrowingFetchFailsOnlyThatEntryInWorkerPool) {
    TempDir dir;
    FakeFetcher inner;
    for (int i = 1; i <= 5; ++i) inner.add("https://cdn.example.com/" + std::to_string(i) + ".mp3", "b");
    ThrowingFetcher fetcher(inner, "https://cdn.example.com/2.mp3");
    Manifest m = make_manifest(5);
    std::ostringstream out, err;
    DownloadOptions options;
    options.jobs = 3;

    ASSERT_NO_THROW(Downloader(fetcher, out, err).download(m, dir.str(), options));

    for (size_t i = 0; i < m.size(); ++i) {
        EXPECT_EQ(m.entries()[i].state, i == 1 ? DownloadState::Failed : DownloadState::Success);
    }
    EXPECT_NE(err.str().find("connection pool exhausted"), std::string::npos);
    EXPECT_EQ(dir.file_count(), 4u);
}

TEST(Downloader, ThrowingFetchFailsOnlyThatEntrySequentially) {
    TempDir dir;
    FakeFetcher inner;
    inner.add("https://cdn.example.com/2.mp3", "two");
    ThrowingFetcher fetcher(inner, "https://cdn.example.com/1.mp3");
    Manifest m = make_manifest(2);
    std::ostringstream out, err;

    ASSERT_NO_THROW(Downloader(fetcher, out, err).download(m, dir.str(), {}));

    EXPECT_EQ(m.entries()[0].state, DownloadState::Failed);
    EXPECT_EQ(m.entries()[1].state, DownloadState::Success);
}

TEST(Downloader, DanglingSymlinkAtTargetIsSkipped) {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.add("https://cdn.example.com/1.mp3", "new bytes");
    const auto link = dir.path() / "Ch1 (001).mp3";
    const auto pointee = dir.path() / "elsewhere.mp3";
    std::filesystem::create_symlink(pointee, link);
    Manifest m = make_manifest(1);
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    EXPECT_EQ(m.entries()[0].state, DownloadState::Skipped);
    EXPECT_TRUE(fetcher.calls().empty());
    EXPECT_FALSE(std::filesystem::exists(pointee));
    EXPECT_TRUE(std::filesystem::is_symlink(std::filesystem::symlink_status(link)));
}

TEST(Downloader, LookupByFilenameStillWorksAfterDownload) {
    TempDir dir;
    FakeFetcher fetcher;
    fetcher.add("https://cdn.example.com/1.mp3", "one");
    Manifest m = make_manifest(2);
    std::ostringstream out, err;

    Downloader(fetcher, out, err).download(m, dir.str(), {});

    const ManifestEntry* first = m.find("Ch1 (001).mp3");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->state, DownloadState::Success);
    const ManifestEntry* second = m.find("Ch2 (002).mp3");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->state, DownloadState::Failed);
}

#pragma once

#include "config.hpp"

#include <string>

struct FetchResult {
    long status = 0;
    std::string body;
    // Empty on success.
    std::string error;

    bool ok() const { return error.empty(); }
};

// HTTP GET capability. Implementations must be safe to call from several
// threads at once when downloads run with more than one job.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual FetchResult get(const std::string& url, int timeout_ms) = 0;
};

class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(std::string user_agent = kUserAgent);

    FetchResult get(const std::string& url, int timeout_ms) override;

private:
    std::string user_agent_;
};

// Retrieves an HTML page as UTF-8 text. Any failure is fatal: throws FetchError.
std::string fetch_page(Fetcher& fetcher, const std::string& url);

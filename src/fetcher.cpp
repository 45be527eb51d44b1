#include "fetcher.hpp"

#include "errors.hpp"
#include "text_utils.hpp"

#include <cpr/cpr.h>

HttpFetcher::HttpFetcher(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

FetchResult HttpFetcher::get(const std::string& url, int timeout_ms) {
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"User-Agent", user_agent_}},
                               cpr::Timeout{timeout_ms},
                               cpr::Redirect{true});
    FetchResult result;
    result.status = r.status_code;
    if (r.error) {
        result.error = r.error.message.empty() ? "transport error" : r.error.message;
        return result;
    }
    if (r.status_code >= 400 || r.status_code == 0) {
        result.error = "HTTP " + std::to_string(r.status_code);
        if (!r.reason.empty()) result.error += " " + r.reason;
        return result;
    }
    result.body = std::move(r.text);
    return result;
}

std::string fetch_page(Fetcher& fetcher, const std::string& url) {
    FetchResult r = fetcher.get(url, kPageTimeoutMs);
    if (!r.ok()) throw FetchError("Error downloading main page from " + url + ": " + r.error);
    if (!is_valid_utf8(r.body)) throw FetchError("Error downloading main page from " + url + ": response is not valid UTF-8");
    return std::move(r.body);
}

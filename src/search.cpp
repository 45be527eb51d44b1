#include "search.hpp"

#include "errors.hpp"
#include "text_utils.hpp"

#include <ostream>
#include <stdexcept>

std::string prepare_phrase(const std::string& phrase) {
    std::string p = phrase;
    for (char& c : p) {
        if (c == ' ' || c == '/') c = '+';
    }
    return p;
}

std::vector<SearchResult> collect_results(const std::vector<std::string>& links,
                                          const std::vector<std::string>& titles,
                                          const std::string& link_prefix) {
    std::vector<SearchResult> out;
    for (size_t i = 0; i < links.size(); ++i) {
        if (links[i].empty()) continue;
        SearchResult r;
        r.link = link_prefix + links[i];
        r.title = strip_char_refs(i < titles.size() ? titles[i] : std::string(kMissingTitle));
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<SearchResult> search_providers(const std::string& phrase,
                                           const ProviderRegistry& registry,
                                           Fetcher& fetcher,
                                           std::ostream& err) {
    if (phrase.empty()) throw UsageError("No search phrase given!");
    const std::string q = prepare_phrase(phrase);

    std::vector<SearchResult> results;
    for (const auto& s : registry.search_providers()) {
        std::string url = s.url_template;
        size_t pos = 0;
        while ((pos = url.find("%q", pos)) != std::string::npos) {
            url.replace(pos, 2, q);
            pos += q.size();
        }

        const std::string html = fetch_page(fetcher, url);
        std::vector<std::string> links, titles;
        try {
            links = find_all(html, s.link);
            titles = find_all(html, s.title);
        } catch (const std::runtime_error& e) {
            err << "Search patterns of " << s.provider << " failed on " << url << ": " << e.what() << std::endl;
            continue;
        }
        auto found = collect_results(links, titles, s.link_prefix);
        results.insert(results.end(), found.begin(), found.end());
    }
    return results;
}

void print_search_results(const std::vector<SearchResult>& results, std::ostream& out) {
    if (results.empty()) {
        out << "No matching audiobooks found!" << std::endl;
        return;
    }
    out << "Found " << results.size() << " matching audiobooks:\n" << std::endl;
    for (const auto& r : results) out << r.title << "  ---->" << r.link << std::endl;
}

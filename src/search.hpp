#pragma once

#include "fetcher.hpp"
#include "providers.hpp"

#include <iostream>
#include <string>
#include <vector>

struct SearchResult {
    std::string link;
    std::string title;
};

// Title used when a provider yields more links than titles.
inline constexpr char kMissingTitle[] = "<ERROR>";

// Spaces and path separators become '+'.
std::string prepare_phrase(const std::string& phrase);

// Queries every provider with a search template, in registry order, and
// concatenates their results. An empty phrase throws UsageError; a search page
// that cannot be fetched throws FetchError. A provider whose patterns exceed the
// regex engine's limits is reported on err and contributes nothing.
std::vector<SearchResult> search_providers(const std::string& phrase,
                                           const ProviderRegistry& registry,
                                           Fetcher& fetcher,
                                           std::ostream& err = std::cerr);

// Pairs links[k] with titles[k].
std::vector<SearchResult> collect_results(const std::vector<std::string>& links,
                                          const std::vector<std::string>& titles,
                                          const std::string& link_prefix);

void print_search_results(const std::vector<SearchResult>& results, std::ostream& out);

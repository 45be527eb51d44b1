#include "providers.hpp"

#include "errors.hpp"
#include "text_utils.hpp"

#include <stdexcept>
#include <unordered_set>

// -------------------- builtin table --------------------
std::vector<ProviderRule> builtin_provider_rules() {
    std::vector<ProviderRule> rules;

    ProviderRule full;
    full.url_prefix = "https://fulllengthaudiobooks.com/";
    full.extension = "mp3";
    full.chapter_pattern = R"re( src="(https://.*?mp3.*?)")re";
    full.search_template = "https://fulllengthaudiobooks.com/?s=%q";
    full.search_link_pattern = R"re(<h2 class="entry-title post-title"><a href="(.*?)".*?rel="bookmark">.*?</a></h2>)re";
    full.search_title_pattern = R"re(<h2 class="entry-title post-title"><a href=".*?".*?rel="bookmark">(.*?)</a></h2>)re";
    rules.push_back(full);

    ProviderRule librivox;
    librivox.url_prefix = "https://librivox.org/";
    librivox.extension = "mp3";
    librivox.chapter_pattern = R"re(<tr>([\s\S]*?)</tr>)re";
    librivox.href_pattern = R"re(</td>[\s\S]*?<td><a href="([\s\S]*?\.mp3[\s\S]*?)" class="chapter-name">)re";
    librivox.title_pattern = R"re(class="chapter-name">([\s\S]*?)</a></td>)re";
    librivox.title_from_href = true;
    rules.push_back(librivox);

    ProviderRule golden;
    golden.url_prefix = "https://goldenaudiobooks.com/";
    golden.alias_of = full.url_prefix;
    golden.search_template = "https://goldenaudiobooks.com/?s=%q";
    golden.search_link_pattern = R"re(<h2 class="entry-title"><a href="(.*?)".*?rel="bookmark">.*?</a></h2>)re";
    golden.search_title_pattern = R"re(<h2 class="entry-title"><a href=".*?".*?rel="bookmark">(.*?)</a></h2>)re";
    rules.push_back(golden);

    ProviderRule book = golden;
    book.url_prefix = "https://bookaudiobooks.com/";
    book.search_template = "https://bookaudiobooks.com/?s=%q";
    rules.push_back(book);

    ProviderRule archive;
    archive.url_prefix = "https://archive.org";
    archive.extension = "mp3";
    archive.chapter_pattern = R"re(<div itemprop="([\s\S]*?)</div>)re";
    archive.href_pattern = R"re(<link itemprop="associatedMedia" href="([^<]*?\.mp3)">)re";
    archive.title_pattern = R"re(content="(.*?)")re";
    archive.search_template = "https://archive.org/search.php?query=%q&and[]=mediatype%3A%22audio%22&and[]=subject%3A%22audiobook%22";
    archive.search_link_pattern = R"re(<a href="([^<]*?)" title="[\s\S]*?"[\s\S]*?data-event-click-tracking="GenericNonCollection\|ItemTile">)re";
    archive.search_title_pattern = R"re(<a href="[^<]*?" title="([\s\S]*?)"[\s\S]*?data-event-click-tracking="GenericNonCollection\|ItemTile">)re";
    archive.search_link_prefix = "https://archive.org";
    rules.push_back(archive);

    return rules;
}

// -------------------- registry --------------------
ProviderRegistry::ProviderRegistry(std::vector<ProviderRule> rules)
    : rules_(std::move(rules)) {
    std::unordered_set<std::string> prefixes;
    for (const auto& r : rules_) {
        if (r.url_prefix.empty()) throw std::invalid_argument("Provider with empty URL prefix");
        if (!prefixes.insert(r.url_prefix).second) throw std::invalid_argument("Duplicate provider: " + r.url_prefix);
    }
    // Everything is compiled once here; broken aliases and patterns fail at startup.
    compiled_.reserve(rules_.size());
    for (const auto& r : rules_) {
        try {
            compiled_.push_back(compile(r, resolve(r)));
            if (r.search_template.empty() || r.search_link_pattern.empty() || r.search_title_pattern.empty()) continue;
            SearchPatterns s;
            s.provider = r.url_prefix;
            s.url_template = r.search_template;
            s.link = make_pattern(r.search_link_pattern);
            s.title = make_pattern(r.search_title_pattern);
            s.link_prefix = r.search_link_prefix;
            search_.push_back(std::move(s));
        } catch (const boost::regex_error& e) {
            throw std::invalid_argument("Invalid pattern in provider " + r.url_prefix + ": " + e.what());
        }
    }
}

const ProviderRegistry& ProviderRegistry::builtin() {
    static const ProviderRegistry registry(builtin_provider_rules());
    return registry;
}

const ProviderRule* ProviderRegistry::find(const std::string& prefix) const {
    for (const auto& r : rules_) {
        if (r.url_prefix == prefix) return &r;
    }
    return nullptr;
}

const ProviderRule& ProviderRegistry::resolve(const ProviderRule& rule) const {
    const ProviderRule* current = &rule;
    for (size_t hops = 0; !current->alias_of.empty(); ++hops) {
        if (hops >= rules_.size()) throw std::invalid_argument("Alias cycle at provider " + rule.url_prefix);
        const ProviderRule* target = find(current->alias_of);
        if (!target) {
            throw std::invalid_argument("Provider " + current->url_prefix + " is an alias of unknown provider " + current->alias_of);
        }
        current = target;
    }
    return *current;
}

PatternSet ProviderRegistry::compile(const ProviderRule& own, const ProviderRule& resolved) {
    PatternSet p;
    p.provider = own.url_prefix;
    p.extension = resolved.extension.empty() ? "unknown" : resolved.extension;
    if (!resolved.chapter_pattern.empty()) p.chapter = make_pattern(resolved.chapter_pattern);
    if (!resolved.href_pattern.empty()) p.href = make_pattern(resolved.href_pattern);
    if (!resolved.title_pattern.empty()) p.title = make_pattern(resolved.title_pattern);
    p.title_from_href = resolved.title_from_href;
    return p;
}

std::vector<PatternSet> ProviderRegistry::match(const std::string& url) const {
    std::vector<PatternSet> out;
    for (size_t i = 0; i < rules_.size(); ++i) {
        if (starts_with(url, rules_[i].url_prefix)) out.push_back(compiled_[i]);
    }
    if (out.empty()) throw UnsupportedProviderError("Provider not supported: " + url);
    return out;
}

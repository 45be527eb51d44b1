#pragma once

#include <boost/regex.hpp>

#include <optional>
#include <string>
#include <vector>

// One site definition. Patterns use Perl syntax with '.' not matching a newline; where a pattern has a
// capture group, the first group is the extracted value.
struct ProviderRule {
    std::string url_prefix;
    // url_prefix of another rule whose extraction fields replace ours.
    std::string alias_of;

    std::string extension;
    std::string chapter_pattern;
    std::string href_pattern;
    std::string title_pattern;
    bool title_from_href = false;

    // "%q" is replaced by the prepared phrase.
    std::string search_template;
    std::string search_link_pattern;
    std::string search_title_pattern;
    std::string search_link_prefix;
};

// Compiled, alias-free extraction rules for one matched provider.
struct PatternSet {
    std::string provider;
    std::string extension;
    // Absent for search-only providers; such a provider yields no chapters.
    std::optional<boost::regex> chapter;
    std::optional<boost::regex> href;
    std::optional<boost::regex> title;
    bool title_from_href = false;
};

struct SearchPatterns {
    std::string provider;
    std::string url_template;
    boost::regex link;
    boost::regex title;
    std::string link_prefix;
};

class ProviderRegistry {
public:
    // Throws std::invalid_argument on duplicate prefixes, dangling or cyclic
    // aliases and patterns that do not compile.
    explicit ProviderRegistry(std::vector<ProviderRule> rules);

    static const ProviderRegistry& builtin();

    const std::vector<ProviderRule>& rules() const { return rules_; }
    const ProviderRule* find(const std::string& prefix) const;

    // Follows alias_of until a rule with its own extraction fields is reached.
    const ProviderRule& resolve(const ProviderRule& rule) const;

    // Every rule whose prefix starts the url, resolved and compiled, in
    // registry order. Throws UnsupportedProviderError when nothing matches.
    std::vector<PatternSet> match(const std::string& url) const;

    // Rules that carry a search template and both search patterns, in registry order.
    const std::vector<SearchPatterns>& search_providers() const { return search_; }

private:
    static PatternSet compile(const ProviderRule& own, const ProviderRule& resolved);

    std::vector<ProviderRule> rules_;
    // compiled_[i] belongs to rules_[i].
    std::vector<PatternSet> compiled_;
    std::vector<SearchPatterns> search_;
};

std::vector<ProviderRule> builtin_provider_rules();

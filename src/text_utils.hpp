#pragma once

#include <boost/regex.hpp>

#include <string>
#include <vector>

bool starts_with(const std::string& s, const std::string& pre);
std::string to_upper(const std::string& s);

// Replaces characters that are not allowed in file names with '_'.
std::string sanitize_filename(const std::string& name);

bool is_valid_utf8(const std::string& s);

// Removes numeric character references such as "&#8217;".
std::string strip_char_refs(const std::string& s);

// Perl syntax; '.' does not match a newline. Throws boost::regex_error on a
// malformed pattern.
boost::regex make_pattern(const std::string& pattern);

// All non-overlapping matches in order. Each item is the first capture group,
// or the whole match when the pattern has no groups. Throws std::runtime_error
// when a match exceeds the engine's complexity or memory limits.
std::vector<std::string> find_all(const std::string& text, const boost::regex& re);

// First item of find_all(), empty when nothing matches.
std::string find_first(const std::string& text, const boost::regex& re);

#include "text_utils.hpp"

#include <cctype>

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

std::string to_upper(const std::string& s) {
    std::string r = s;
    for (auto& ch : r) ch = static_cast<char>(::toupper(static_cast<unsigned char>(ch)));
    return r;
}

std::string sanitize_filename(const std::string& name) {
    std::string s = name;
    for (char& c : s) {
        if (c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|') c = '_';
    }
    return s;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len;
        unsigned int cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

boost::regex make_pattern(const std::string& pattern) {
    return boost::regex(pattern, boost::regex::perl | boost::regex::no_mod_s);
}

std::string strip_char_refs(const std::string& s) {
    static const boost::regex char_ref_re = make_pattern("&#.*?;");
    return boost::regex_replace(s, char_ref_re, "");
}

std::vector<std::string> find_all(const std::string& text, const boost::regex& re) {
    std::vector<std::string> out;
    for (boost::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
        out.push_back(it->size() > 1 ? (*it)[1].str() : (*it)[0].str());
    }
    return out;
}

std::string find_first(const std::string& text, const boost::regex& re) {
    boost::smatch m;
    if (!boost::regex_search(text, m, re)) return {};
    return m.size() > 1 ? m[1].str() : m[0].str();
}

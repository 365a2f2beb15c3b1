#include "strings.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace tabmux {

bool split_words(const std::string &line, std::vector<std::string> &out, std::string *error) {
    out.clear();
    std::string cur;
    bool in_word = false;
    char quote = 0;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote == '\'') {
            if (c == '\'') quote = 0; else cur += c;
            continue;
        }
        if (c == '\\') {
            if (i + 1 >= line.size()) {
                if (error) *error = "trailing backslash";
                return false;
            }
            cur += line[++i];
            in_word = true;
            continue;
        }
        if (quote == '"') {
            if (c == '"') quote = 0; else cur += c;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            in_word = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (in_word) { out.push_back(cur); cur.clear(); in_word = false; }
        } else {
            cur += c;
            in_word = true;
        }
    }
    if (quote) {
        if (error) *error = "unterminated quote";
        return false;
    }
    if (in_word) out.push_back(cur);
    return true;
}

std::string quote_word(const std::string &word) {
    if (word.empty()) return "''";
    bool plain = true;
    for (char c : word) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' || c == '"' || c == '\\') { plain = false; break; }
    }
    if (plain) return word;
    return shell_quote(word);
}

std::string shell_quote(const std::string &word) {
    std::string q = "'";
    for (char c : word) {
        if (c == '\'') q += "'\\''"; else q += c;
    }
    q += "'";
    return q;
}

std::string latin1_to_utf8(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x80) {
            out += ch;
        } else {
            out += static_cast<char>(0xc0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3f));
        }
    }
    return out;
}

std::string join_words(const std::vector<std::string> &words) {
    std::string s;
    for (auto &w : words) {
        if (!s.empty()) s += ' ';
        s += quote_word(w);
    }
    return s;
}

std::string trim(const std::string &s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::optional<long long> parse_integer(const std::string &s) {
    if (s.empty()) return std::nullopt;
    errno = 0;
    char *end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return std::nullopt;
    return v;
}

std::optional<bool> parse_bool(const std::string &s) {
    if (s == "true" || s == "yes" || s == "on" || s == "1") return true;
    if (s == "false" || s == "no" || s == "off" || s == "0") return false;
    return std::nullopt;
}

std::optional<uint32_t> parse_window_id(const std::string &s) {
    if (s.empty() || s[0] == '-') return std::nullopt;
    errno = 0;
    char *end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 0);
    if (errno != 0 || *end != '\0' || v == 0 || v > 0xffffffffULL) return std::nullopt;
    return static_cast<uint32_t>(v);
}

}  // namespace tabmux

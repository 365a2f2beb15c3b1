#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tabmux {

// Shell-like word splitting: whitespace separated, single and double quotes,
// backslash escapes outside single quotes. Returns false on an unterminated
// quote or trailing backslash.
bool split_words(const std::string &line, std::vector<std::string> &out, std::string *error = nullptr);

// Quotes a word so split_words gives it back unchanged.
std::string quote_word(const std::string &word);
std::string join_words(const std::vector<std::string> &words);

// Always single-quoted, safe to paste into a /bin/sh command line.
std::string shell_quote(const std::string &word);

// ISO-8859-1, as in STRING-typed properties such as WM_NAME, to UTF-8.
std::string latin1_to_utf8(const std::string &s);

std::string trim(const std::string &s);

std::optional<long long> parse_integer(const std::string &s);
std::optional<bool> parse_bool(const std::string &s);

// Decimal or 0x-prefixed hex, like the window ids printed by xwininfo.
std::optional<uint32_t> parse_window_id(const std::string &s);

}  // namespace tabmux

#ifndef NASAMCP_UTF8_SANITIZE_HPP
#define NASAMCP_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// Upstream services occasionally return text that is not valid UTF-8, and
// nlohmann::json refuses to dump such strings. Everything that ends up in a
// text content block goes through here first.

// Replaces invalid UTF-8 (bad lead bytes, truncated or broken multibyte
// sequences, overlong forms, UTF-16 surrogates, code points above U+10FFFF)
// with U+FFFD. In-place version.
void sanitize(std::string &text);

// Same as above, returns a new string.
std::string sanitize(const std::string &text);

// True when text contains no sequence sanitize() would replace.
bool is_valid(const std::string &text);

} // namespace utf8_sanitize

#endif // NASAMCP_UTF8_SANITIZE_HPP

// =============================================================================
// FILE: include/http/form_codec.h
// =============================================================================
#ifndef HTTP_FORM_CODEC_H
#define HTTP_FORM_CODEC_H

#include <string>
#include <unordered_map>

namespace turbo_dialer {

using FormMap = std::unordered_map<std::string, std::string>;

// Percent-decoding with '+' as space (application/x-www-form-urlencoded).
// Malformed escapes are kept literally.
std::string url_decode(const std::string& s);

// Percent-encoding of everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& s);

// "a=1&b=two+words" -> {a:1, b:"two words"}. First occurrence of a key wins.
FormMap parse_form(const std::string& body);

// Value or "" when absent.
inline std::string form_value(const FormMap& form, const std::string& key) {
    auto it = form.find(key);
    return it == form.end() ? std::string() : it->second;
}

} // namespace turbo_dialer
#endif // HTTP_FORM_CODEC_H

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace resparse {

// ---------------------------------------------------------------------------
// HttpHeaders — header name to value, as delivered by the transport.
// Keys keep their wire casing; use the *Ci helpers below for
// case-insensitive lookups.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse — a fully buffered HTTP response handed to the parsers.
// The body is a byte sequence; it is never assumed to be valid text.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

[[nodiscard]] bool IEquals(std::string_view lhs, std::string_view rhs);

[[nodiscard]] bool IStartsWith(std::string_view value, std::string_view prefix);

/// First header whose name matches `key` ignoring ASCII case.
[[nodiscard]] std::optional<std::string> FindHeaderValueCi(const HttpHeaders& headers,
                                                           std::string_view key);

/// Standard reason phrase for a status code ("Not Found" for 404), or an
/// empty string for codes without one.
[[nodiscard]] std::string_view ReasonPhrase(int status_code);

} // namespace resparse

#pragma once

#include <toolbridge/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace toolbridge {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// ---------------------------------------------------------------------------
// HttpUrl: an absolute http/https URL split into the parts httplib needs:
// an origin for the client and a path (with query) for the request.
// ---------------------------------------------------------------------------
struct HttpUrl {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 80;
    std::string path = "/";

    /// "scheme://host:port", suitable for httplib::Client.
    [[nodiscard]] std::string Origin() const;

    /// Join a path onto this URL's path, avoiding a doubled '/'.
    [[nodiscard]] std::string JoinPath(std::string_view suffix) const;
};

/// Parse "http[s]://host[:port][/path][?query]". Fragments are dropped.
Result<HttpUrl, std::string> ParseHttpUrl(std::string_view url);

} // namespace toolbridge

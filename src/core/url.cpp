#include <toolbridge/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace toolbridge {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string HttpUrl::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::string HttpUrl::JoinPath(std::string_view suffix) const {
    std::string base = path;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (suffix.empty() || suffix.front() != '/') {
        base += '/';
    }
    base.append(suffix.data(), suffix.size());
    return base;
}

Result<HttpUrl, std::string> ParseHttpUrl(std::string_view url) {
    using R = Result<HttpUrl, std::string>;

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return R::Err("missing scheme in URL: " + std::string(url));
    }

    HttpUrl out;
    out.scheme = std::string(url.substr(0, scheme_end));
    for (auto& c : out.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (out.scheme == "http") {
        out.port = 80;
    } else if (out.scheme == "https") {
        out.port = 443;
    } else {
        return R::Err("unsupported URL scheme: " + out.scheme);
    }

    auto rest = url.substr(scheme_end + 3);
    const auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }

    const auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos) {
        out.path = std::string(rest.substr(path_start));
        if (out.path.front() == '?') {
            out.path.insert(out.path.begin(), '/');
        }
    }

    if (authority.find('@') != std::string_view::npos) {
        return R::Err("credentials in URL are not supported");
    }

    // Bracketed IPv6 literal: [::1]:8080
    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return R::Err("unterminated IPv6 literal in URL");
        }
        out.host = std::string(authority.substr(1, close - 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return R::Err("unexpected characters after IPv6 literal");
            }
            port_text = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
        } else {
            out.host = std::string(authority);
        }
    }

    if (out.host.empty()) {
        return R::Err("missing host in URL: " + std::string(url));
    }

    if (!port_text.empty()) {
        unsigned long port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return R::Err("invalid port in URL: " + std::string(port_text));
            }
            port = port * 10 + static_cast<unsigned long>(c - '0');
            if (port > 65535) {
                return R::Err("port out of range in URL: " + std::string(port_text));
            }
        }
        if (port == 0) {
            return R::Err("port out of range in URL: " + std::string(port_text));
        }
        out.port = static_cast<uint16_t>(port);
    }

    return R::Ok(std::move(out));
}

} // namespace toolbridge

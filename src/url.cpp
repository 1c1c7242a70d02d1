#include "url.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

Url Url::parse(const std::string& text) {
    Url url;

    size_t schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL without scheme: " + text);
    }
    url.scheme = lowered(text.substr(0, schemeEnd));
    if (url.scheme != "http" && url.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme: " + url.scheme);
    }

    size_t authorityStart = schemeEnd + 3;
    size_t pathStart = text.find_first_of("/?#", authorityStart);
    std::string authority = text.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);

    // Drop userinfo
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string portText;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("unterminated IPv6 literal: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            portText = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }

    if (url.host.empty()) {
        throw std::invalid_argument("URL without host: " + text);
    }
    url.host = lowered(url.host);

    if (portText.empty()) {
        url.port = url.isTls() ? 443 : 80;
    } else {
        if (!std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c); }) || portText.size() > 5) {
            throw std::invalid_argument("invalid port in URL: " + text);
        }
        int port = std::stoi(portText);
        if (port < 1 || port > 65535) {
            throw std::invalid_argument("port out of range in URL: " + text);
        }
        url.port = static_cast<uint16_t>(port);
    }

    if (pathStart != std::string::npos) {
        std::string rest = text.substr(pathStart);
        size_t fragment = rest.find('#');
        if (fragment != std::string::npos) {
            rest = rest.substr(0, fragment);
        }
        if (rest.empty() || rest.front() == '?') {
            rest = "/" + rest;
        }
        url.target = rest;
    }

    return url;
}

bool Url::hasDefaultPort() const {
    return (isTls() && port == 443) || (!isTls() && port == 80);
}

std::string Url::authority() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (hasDefaultPort()) {
        return h;
    }
    return h + ":" + std::to_string(port);
}

std::string Url::toString() const {
    return scheme + "://" + authority() + target;
}

Url Url::resolve(const std::string& location) const {
    if (location.find("://") != std::string::npos) {
        return parse(location);
    }
    if (location.compare(0, 2, "//") == 0) {
        return parse(scheme + ":" + location);
    }

    Url next = *this;
    if (!location.empty() && location.front() == '/') {
        next.target = location;
    } else if (!location.empty() && location.front() == '?') {
        size_t query = target.find('?');
        next.target = target.substr(0, query) + location;
    } else {
        std::string path = target.substr(0, target.find('?'));
        size_t slash = path.rfind('/');
        next.target = path.substr(0, slash + 1) + location;
    }
    return next;
}

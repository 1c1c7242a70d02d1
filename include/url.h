#ifndef URL_H
#define URL_H

#include <cstdint>
#include <string>

// Absolute http/https URL. parse() throws std::invalid_argument.
struct Url {
    std::string scheme; // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target = "/"; // path + query

    static Url parse(const std::string& text);

    bool isTls() const { return scheme == "https"; }
    bool hasDefaultPort() const;

    // "host" or "host:port" as sent in the Host header
    std::string authority() const;
    std::string toString() const;

    // Resolves a Location header value (absolute, scheme-relative,
    // absolute-path or relative-path) against this URL
    Url resolve(const std::string& location) const;
};

#endif // URL_H

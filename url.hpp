#pragma once

#include <cstdint>
#include <string>

namespace page_recorder {

// Enhanced URL parsing that preserves protocol information
struct ParsedUrl {
    std::string protocol;  // "ws", "wss", "http", "https"
    std::string host;
    uint16_t port = 0;
    std::string path;      // starts with '/', includes the query
    bool use_ssl = false;

    std::string hostHeader() const;  // "host" or "host:port" for non-default ports
};

// Throws std::invalid_argument on a URL without host or with a bad port.
ParsedUrl parseUrl(const std::string& url);

// Percent-encodes everything outside RFC 3986 unreserved characters, keeping '/'.
std::string encodePath(const std::string& path);

} // namespace page_recorder

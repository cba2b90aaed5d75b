#include "url.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace page_recorder {

static uint16_t default_port(const std::string& protocol) {
    if (protocol == "https" || protocol == "wss") return 443;
    return 80;
}

std::string ParsedUrl::hostHeader() const {
    if (port == default_port(protocol)) return host;
    return host + ":" + std::to_string(port);
}

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl result;
    result.protocol = "http";

    std::string u = url;
    auto pos_protocol = u.find("://");
    if (pos_protocol != std::string::npos) {
        result.protocol = u.substr(0, pos_protocol);
        for (auto& c : result.protocol) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        u = u.substr(pos_protocol + 3);
    }
    result.use_ssl = (result.protocol == "wss" || result.protocol == "https");
    result.port = default_port(result.protocol);

    auto slash = u.find('/');
    std::string authority = (slash == std::string::npos) ? u : u.substr(0, slash);
    result.path = (slash == std::string::npos) ? "/" : u.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        std::string p = authority.substr(colon + 1);
        if (p.empty() || p.size() > 5) throw std::invalid_argument("bad port in URL: " + url);
        for (char c : p) {
            if (!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("bad port in URL: " + url);
        }
        int port = std::stoi(p);
        if (port <= 0 || port > 65535) throw std::invalid_argument("bad port in URL: " + url);
        result.port = static_cast<uint16_t>(port);
    } else {
        result.host = authority;
    }
    if (result.host.empty()) throw std::invalid_argument("no host in URL: " + url);

    return result;
}

std::string encodePath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // namespace page_recorder

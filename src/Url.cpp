#include "Url.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

int defaultPort(const std::string & scheme) {
    return scheme == "https" ? 443 : 80;
}

}

Url Url::parse(const std::string & url) {
    size_t pos = url.find("://");
    if (pos == std::string::npos) {
        throw std::runtime_error("Not an absolute URL: " + url);
    }

    Url result;
    result.scheme = toLower(url.substr(0, pos));
    if (result.scheme != "http" && result.scheme != "https") {
        throw std::runtime_error("Unsupported URL scheme: " + result.scheme);
    }

    std::string rest = url.substr(pos + 3);
    size_t path_pos = rest.find_first_of("/?#");
    std::string host_str = rest.substr(0, path_pos);
    if (path_pos == std::string::npos) {
        result.target = "/";
    } else {
        result.target = rest.substr(path_pos);
        // fragments never reach the server
        size_t fragment = result.target.find('#');
        if (fragment != std::string::npos) {
            result.target.erase(fragment);
        }
        if (result.target.empty() || result.target[0] != '/') {
            result.target.insert(0, "/");
        }
    }

    // drop userinfo
    size_t at = host_str.rfind('@');
    if (at != std::string::npos) {
        host_str = host_str.substr(at + 1);
    }

    size_t colon_pos = host_str.rfind(':');
    size_t bracket = host_str.rfind(']');
    if (colon_pos != std::string::npos && (bracket == std::string::npos || colon_pos > bracket)) {
        std::string port_str = host_str.substr(colon_pos + 1);
        host_str = host_str.substr(0, colon_pos);
        if (port_str.empty()) {
            result.port = defaultPort(result.scheme);
        } else {
            if (!std::all_of(port_str.begin(), port_str.end(),
                             [](unsigned char c) { return std::isdigit(c); }) ||
                port_str.size() > 5) {
                throw std::runtime_error("Invalid port in URL: " + url);
            }
            result.port = std::stoi(port_str);
            if (result.port <= 0 || result.port > 65535) {
                throw std::runtime_error("Invalid port in URL: " + url);
            }
        }
    } else {
        result.port = defaultPort(result.scheme);
    }

    if (host_str.empty()) {
        throw std::runtime_error("Missing host in URL: " + url);
    }
    result.host = toLower(host_str);
    return result;
}

bool Url::isDefaultPort() const {
    return port == defaultPort(scheme);
}

std::string Url::getAuthority() const {
    if (isDefaultPort()) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string Url::toString() const {
    if (host.empty()) {
        return "";
    }
    return scheme + "://" + getAuthority() + target;
}

#include "Request.hpp"
#include <algorithm>
#include <cctype>

std::atomic<int> Request::next_id(0);

Request::Request(http::verb method, const std::string & url)
    : Request(method, Url::parse(url)) {}

Request::Request(http::verb method, const Url & url)
    : id(next_id++), url(url), request(method, url.getTarget(), 11) {}

std::string Request::getHeader(const std::string & key) const {
    auto it = request.find(key);
    return (it != request.end()) ? std::string(it->value()) : "";
}

bool Request::hasHeader(const std::string & key) const {
    return request.find(key) != request.end();
}

void Request::setHeader(const std::string & key, const std::string & value) {
    request.set(key, value);
}

void Request::removeHeader(const std::string & key) {
    request.erase(key);
}

std::map<std::string, std::string> Request::getHeaderMap() const {
    std::map<std::string, std::string> headers;
    for (const auto & field : request) {
        std::string name(field.name_string());
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        auto it = headers.find(name);
        if (it == headers.end()) {
            headers.emplace(name, std::string(field.value()));
        } else {
            it->second += ", " + std::string(field.value());
        }
    }
    return headers;
}

http::request<http::string_body> Request::toBeast() const {
    http::request<http::string_body> req = request;
    req.target(url.getTarget());
    if (req.find(http::field::host) == req.end()) {
        req.set(http::field::host, url.getAuthority());
    }
    if (req.find(http::field::user_agent) == req.end()) {
        req.set(http::field::user_agent, "http-cache");
    }
    if (!req.body().empty() || req.method() == http::verb::post || req.method() == http::verb::put) {
        req.prepare_payload();
    }
    return req;
}

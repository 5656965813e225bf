#include "Response.hpp"
#include "HttpDate.hpp"
#include "Url.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

}

HttpVersion versionFromNumber(unsigned version) {
    switch (version) {
        case 9: return HttpVersion::HTTP_09;
        case 10: return HttpVersion::HTTP_10;
        case 20: return HttpVersion::HTTP_2;
        case 30: return HttpVersion::HTTP_3;
        default: return HttpVersion::HTTP_11;
    }
}

unsigned versionToNumber(HttpVersion version) {
    switch (version) {
        case HttpVersion::HTTP_09: return 9;
        case HttpVersion::HTTP_10: return 10;
        case HttpVersion::HTTP_11: return 11;
        case HttpVersion::HTTP_2: return 20;
        case HttpVersion::HTTP_3: return 30;
    }
    return 11;
}

Response::Response(uint16_t status, const std::string & url, const std::string & body)
    : status(status), body(body), url(url), version(HttpVersion::HTTP_11) {}

Response::Response(const http::response<http::string_body> & res, const std::string & url)
    : status(static_cast<uint16_t>(res.result_int())),
      body(res.body()),
      url(url),
      version(versionFromNumber(res.version())) {
    for (const auto & field : res) {
        std::string name = toLower(std::string(field.name_string()));
        auto it = headers.find(name);
        if (it == headers.end()) {
            headers.emplace(name, std::string(field.value()));
        } else {
            it->second += ", " + std::string(field.value());
        }
    }
}

std::string Response::getHeader(const std::string & key) const {
    auto it = headers.find(toLower(key));
    return (it != headers.end()) ? it->second : "";
}

bool Response::hasHeader(const std::string & key) const {
    return headers.find(toLower(key)) != headers.end();
}

void Response::setHeader(const std::string & key, const std::string & value) {
    headers[toLower(key)] = value;
}

void Response::removeHeader(const std::string & key) {
    headers.erase(toLower(key));
}

void Response::setCacheStatus(bool hit) {
    setHeader("x-cache", hit ? "HIT" : "MISS");
}

void Response::setCacheLookupStatus(bool hit) {
    setHeader("x-cache-lookup", hit ? "HIT" : "MISS");
}

void Response::addWarning(int code, const std::string & message) {
    std::string host;
    try {
        host = Url::parse(url).getHost();
    } catch (const std::runtime_error &) {
        host = "-";
    }
    std::string value = std::to_string(code) + " " + host + " \"" + message + "\" \"" +
                        HttpDate::format(time(nullptr)) + "\"";
    // warnings accumulate instead of replacing each other
    auto it = headers.find("warning");
    if (it == headers.end()) {
        headers.emplace("warning", value);
    } else {
        it->second += ", " + value;
    }
}

void Response::removeWarning() {
    headers.erase("warning");
}

int Response::getWarningCode() const {
    auto it = headers.find("warning");
    if (it == headers.end() || it->second.size() < 3) {
        return 0;
    }
    const std::string & value = it->second;
    if (!std::isdigit(static_cast<unsigned char>(value[0])) ||
        !std::isdigit(static_cast<unsigned char>(value[1])) ||
        !std::isdigit(static_cast<unsigned char>(value[2]))) {
        return 0;
    }
    return std::stoi(value.substr(0, 3));
}

http::response<http::string_body> Response::toBeast() const {
    http::response<http::string_body> res;
    res.result(status);
    res.version(versionToNumber(version));
    for (const auto & header : headers) {
        res.set(header.first, header.second);
    }
    res.body() = body;
    // the stored length may be stale after a merge, recompute it
    bool bodyless = status < 200 || status == 204 || status == 304;
    if (!bodyless && headers.find("transfer-encoding") == headers.end()) {
        res.prepare_payload();
    }
    return res;
}

bool Response::operator==(const Response & other) const {
    return status == other.status &&
           headers == other.headers &&
           body == other.body &&
           url == other.url &&
           version == other.version;
}

#ifndef REQUEST_HPP
#define REQUEST_HPP

#include <string>
#include <map>
#include <atomic>
#include <boost/beast/http.hpp>
#include "Url.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;

// Outgoing request as seen by the cache. Copies keep the id so that log lines
// of a conditional request can be matched with the original.
class Request {
private:
    static std::atomic<int> next_id;
    int id;
    Url url;
    http::request<http::string_body> request;

public:
    Request() : id(-1) {}
    Request(http::verb method, const std::string & url);
    Request(http::verb method, const Url & url);

    int getId() const { return id; }

    std::string getMethod() const { return std::string(request.method_string()); }
    http::verb getVerb() const { return request.method(); }
    void setVerb(http::verb method) { request.method(method); }

    std::string getUrl() const { return url.toString(); }
    const Url & getParsedUrl() const { return url; }

    std::string getVersion() const {
        return "HTTP/"
        + std::to_string(request.version() / 10)
        + "."
        + std::to_string(request.version() % 10);
    }

    std::string getHeader(const std::string & key) const;
    bool hasHeader(const std::string & key) const;
    void setHeader(const std::string & key, const std::string & value);
    void removeHeader(const std::string & key);

    // headers with lower-cased names, repeated fields joined with ", "
    std::map<std::string, std::string> getHeaderMap() const;
    const http::fields & getHeaders() const { return request.base(); }

    bool isGet() const { return request.method() == http::verb::get; }
    bool isGetOrHead() const {
        return request.method() == http::verb::get || request.method() == http::verb::head;
    }

    const std::string & getBody() const { return request.body(); }
    void setBody(const std::string & body) { request.body() = body; }

    // wire form: origin-form target, Host header and payload size filled in
    http::request<http::string_body> toBeast() const;
};

#endif

#ifndef RESPONSE_HPP
#define RESPONSE_HPP

#include <string>
#include <map>
#include <cstdint>
#include <boost/beast/http.hpp>
#include <boost/serialization/access.hpp>

namespace beast = boost::beast;
namespace http = boost::beast::http;

enum class HttpVersion {
    HTTP_09,
    HTTP_10,
    HTTP_11,
    HTTP_2,
    HTTP_3
};

HttpVersion versionFromNumber(unsigned version);
unsigned versionToNumber(HttpVersion version);

// A response as it is stored in the cache. Header names are kept lower-cased,
// so lookups are case-insensitive as HTTP requires.
class Response {
private:
    uint16_t status;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string url;
    HttpVersion version;

    friend class boost::serialization::access;
    template<class Archive>
    void serialize(Archive & ar, const unsigned int) {
        ar & status;
        ar & headers;
        ar & body;
        ar & url;
        ar & version;
    }

public:
    Response() : status(0), version(HttpVersion::HTTP_11) {}
    Response(uint16_t status, const std::string & url, const std::string & body = "");
    Response(const http::response<http::string_body> & res, const std::string & url);

    uint16_t getStatus() const { return status; }

    std::string getHeader(const std::string & key) const;
    bool hasHeader(const std::string & key) const;
    void setHeader(const std::string & key, const std::string & value);
    void removeHeader(const std::string & key);
    const std::map<std::string, std::string> & getHeaders() const { return headers; }

    const std::string & getBody() const { return body; }
    void setBody(const std::string & data) { body = data; }

    const std::string & getUrl() const { return url; }
    HttpVersion getVersion() const { return version; }

    // x-cache and x-cache-lookup diagnostics
    void setCacheStatus(bool hit);
    void setCacheLookupStatus(bool hit);

    // RFC 7234 section 5.5 warnings
    void addWarning(int code, const std::string & message);
    void removeWarning();
    int getWarningCode() const;

    http::response<http::string_body> toBeast() const;

    bool operator==(const Response & other) const;
    bool operator!=(const Response & other) const { return !(*this == other); }
};

#endif

#ifndef URL_HPP
#define URL_HPP

#include <string>

// Absolute http(s) URL, normalized so that equal resources print equally:
// scheme and host are lower-cased, the default port is dropped and an empty
// path becomes "/".
class Url {
private:
    std::string scheme;
    std::string host;
    int port;
    std::string target;

public:
    Url() : port(0) {}

    // throws std::runtime_error if the string is not an absolute http(s) URL
    static Url parse(const std::string & url);

    const std::string & getScheme() const { return scheme; }
    const std::string & getHost() const { return host; }
    int getPort() const { return port; }
    // path plus query, always starting with '/'
    const std::string & getTarget() const { return target; }

    // host, with ":port" when the port is not the scheme default
    std::string getAuthority() const;
    bool isDefaultPort() const;

    std::string toString() const;
};

#endif

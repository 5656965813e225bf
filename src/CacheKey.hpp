#ifndef CACHEKEY_HPP
#define CACHEKEY_HPP

#include <functional>
#include <string>

#include "Request.hpp"

// Caller supplied key derivation. Must be pure: two requests for the same
// resource have to map to the same key.
typedef std::function<std::string(const Request &)> CacheKeyFn;

class CacheKey {
public:
    // "{METHOD}:{URL}", e.g. "GET:http://example.com/"
    static std::string create(const Request & request);

    // key of request under fn, or the default key when fn is empty
    static std::string create(const Request & request, const CacheKeyFn & fn);

    // key the request would have if it were sent with another method
    static std::string createFor(const Request & request, http::verb method, const CacheKeyFn & fn);
};

#endif

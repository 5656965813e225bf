#include "CacheKey.hpp"

std::string CacheKey::create(const Request & request) {
    return request.getMethod() + ":" + request.getUrl();
}

std::string CacheKey::create(const Request & request, const CacheKeyFn & fn) {
    if (fn) {
        return fn(request);
    }
    return create(request);
}

std::string CacheKey::createFor(const Request & request, http::verb method, const CacheKeyFn & fn) {
    Request copy = request;
    copy.setVerb(method);
    return create(copy, fn);
}

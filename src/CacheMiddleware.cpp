#include "CacheMiddleware.hpp"
#include <stdexcept>
#include <utility>

CacheMiddleware::CacheMiddleware(std::shared_ptr<HttpCache> cache, std::shared_ptr<Transport> next)
    : cache(std::move(cache)), next(std::move(next)) {
    if (!this->cache || !this->next) {
        throw std::invalid_argument("CacheMiddleware needs a cache and a next transport");
    }
}

Response CacheMiddleware::fetch(const Request & request) {
    return cache->run(request, *next);
}

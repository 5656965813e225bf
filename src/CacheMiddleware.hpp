#ifndef CACHEMIDDLEWARE_HPP
#define CACHEMIDDLEWARE_HPP

#include <memory>

#include "HttpCache.hpp"
#include "Transport.hpp"

// Transport that answers through an HttpCache and sends whatever has to reach
// the origin to the next transport, so caches stack in front of any client.
class CacheMiddleware : public Transport {
public:
    CacheMiddleware(std::shared_ptr<HttpCache> cache, std::shared_ptr<Transport> next);

    Response fetch(const Request & request) override;

private:
    std::shared_ptr<HttpCache> cache;
    std::shared_ptr<Transport> next;
};

#endif

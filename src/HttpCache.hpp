#ifndef HTTPCACHE_HPP
#define HTTPCACHE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "CacheDecision.hpp"
#include "CacheKey.hpp"
#include "CacheManager.hpp"
#include "CachePolicy.hpp"
#include "Logger.hpp"
#include "Request.hpp"
#include "Response.hpp"
#include "Transport.hpp"

// per-request mode, replaces the configured one
typedef std::function<CacheMode(const Request &)> CacheModeFn;

struct HttpCacheOptions {
    // empty for "{METHOD}:{URL}"
    CacheKeyFn cacheKey;
    // empty for CacheOptions defaults
    std::optional<CacheOptions> cacheOptions;
    CacheModeFn cacheModeFn;
};

// Decides per request whether to answer from the cache manager, revalidate
// with the origin or go to the origin, and keeps the manager up to date.
//
// Storage failures never fail a request: a failed lookup is a miss and a
// failed write is logged. NetworkError from the transport propagates.
class HttpCache {
public:
    HttpCache(CacheMode mode,
              std::shared_ptr<CacheManager> manager,
              const HttpCacheOptions & options = HttpCacheOptions());

    Response run(const Request & request, Transport & transport);

    // drops the entry of request; throws StorageError
    void remove(const Request & request);

    std::string cacheKey(const Request & request) const;
    CacheMode modeFor(const Request & request) const;

private:
    CacheMode mode;
    std::shared_ptr<CacheManager> manager;
    HttpCacheOptions options;
    CacheDecision decision;
    static inline Logger & logger = Logger::getInstance();

    CacheOptions policyOptions() const {
        return options.cacheOptions ? *options.cacheOptions : CacheOptions();
    }

    Response bypass(const Request & request, Transport & transport, CacheMode mode);
    Response remoteFetch(const Request & request,
                         Transport & transport,
                         const std::string & key,
                         CacheMode mode,
                         bool inCache);
    Response conditionalFetch(const Request & request,
                              Transport & transport,
                              const std::string & key,
                              const CachedEntry & cached);
    Response fromCache(const CachedEntry & cached, CacheMode mode, time_t now, int id);
    Response gatewayTimeout(const Request & request);
    void logDecision(const Request & request, CacheMode mode, CacheDecision::Decision action);

    // store response if the rules (or IGNORE_RULES) allow it
    void storeIfCacheable(const Request & request,
                          const std::string & key,
                          const Response & response,
                          CacheMode mode);

    std::optional<CachedEntry> lookup(const std::string & key, int id);
    void store(const std::string & key, const Response & response, const CachePolicy & policy, int id);
    void invalidate(const Request & request);
};

#endif

#include "HttpCache.hpp"
#include <ctime>
#include <stdexcept>
#include <utility>

HttpCache::HttpCache(CacheMode mode,
                     std::shared_ptr<CacheManager> manager,
                     const HttpCacheOptions & options)
    : mode(mode), manager(std::move(manager)), options(options) {
    if (!this->manager) {
        throw std::invalid_argument("HttpCache needs a cache manager");
    }
}

std::string HttpCache::cacheKey(const Request & request) const {
    return CacheKey::create(request, options.cacheKey);
}

CacheMode HttpCache::modeFor(const Request & request) const {
    if (options.cacheModeFn) {
        return options.cacheModeFn(request);
    }
    return mode;
}

Response HttpCache::run(const Request & request, Transport & transport) {
    CacheMode requestMode = modeFor(request);
    if (CacheDecision::isBypass(request, requestMode)) {
        logDecision(request, requestMode, CacheDecision::BYPASS);
        return bypass(request, transport, requestMode);
    }

    std::string key = cacheKey(request);
    std::optional<CachedEntry> cached = lookup(key, request.getId());
    time_t now = time(nullptr);

    CacheDecision::Decision action = decision.makeDecision(request, requestMode, cached, now);
    logDecision(request, requestMode, action);
    switch (action) {
        case CacheDecision::RETURN_504:
            return gatewayTimeout(request);
        case CacheDecision::RETURN_CACHE:
            return fromCache(*cached, requestMode, now, request.getId());
        case CacheDecision::REVALIDATE:
            return conditionalFetch(request, transport, key, *cached);
        default:
            return remoteFetch(request, transport, key, requestMode, cached.has_value());
    }
}

void HttpCache::logDecision(const Request & request, CacheMode requestMode, CacheDecision::Decision action) {
    std::string message = modeToString(requestMode) + ": " + CacheDecision::toString(action);
    if (CacheDecision::needToSend(action)) {
        message += ", contacting origin";
    }
    logger.debug(request.getId(), message);
}

void HttpCache::remove(const Request & request) {
    std::string key = cacheKey(request);
    manager->remove(key);
    logger.info(request.getId(), "removed " + key);
}

Response HttpCache::bypass(const Request & request, Transport & transport, CacheMode requestMode) {
    Response response = transport.fetch(request);
    response.setCacheStatus(false);
    response.setCacheLookupStatus(false);

    if (!request.isGetOrHead()) {
        http::verb verb = request.getVerb();
        bool safe = verb == http::verb::options || verb == http::verb::trace;
        // a successful unsafe request makes the stored representation suspect
        if (!safe && response.getStatus() < 400) {
            invalidate(request);
        }
        return response;
    }
    if (requestMode == CacheMode::RELOAD) {
        storeIfCacheable(request, cacheKey(request), response, requestMode);
    }
    return response;
}

Response HttpCache::remoteFetch(const Request & request,
                                Transport & transport,
                                const std::string & key,
                                CacheMode requestMode,
                                bool inCache) {
    Response response;
    if (requestMode == CacheMode::NO_CACHE) {
        Request forwarded = request;
        std::string directives = request.getHeader("cache-control");
        if (directives.find("no-cache") == std::string::npos) {
            directives = directives.empty() ? "no-cache" : directives + ", no-cache";
        }
        forwarded.setHeader("cache-control", directives);
        response = transport.fetch(forwarded);
    } else {
        response = transport.fetch(request);
    }
    response.setCacheStatus(false);
    response.setCacheLookupStatus(inCache);
    storeIfCacheable(request, key, response, requestMode);
    return response;
}

Response HttpCache::conditionalFetch(const Request & request,
                                     Transport & transport,
                                     const std::string & key,
                                     const CachedEntry & cached) {
    const CachePolicy & policy = cached.second;
    Request conditional = policy.buildConditionalRequest(request);
    Response response = transport.fetch(conditional);
    time_t now = time(nullptr);

    if (response.getStatus() != 304) {
        logger.info(request.getId(), "revalidation replaced the entry (" + std::to_string(response.getStatus()) + ")");
        response.setCacheStatus(false);
        response.setCacheLookupStatus(true);
        storeIfCacheable(request, key, response, CacheMode::DEFAULT);
        return response;
    }

    logger.info(request.getId(), "revalidated, not modified");
    try {
        std::pair<Response, CachePolicy> merged = policy.mergeRevalidation(cached.first, response, now);
        merged.first.setCacheStatus(true);
        merged.first.setCacheLookupStatus(true);
        store(key, merged.first, merged.second, request.getId());
        return merged.first;
    } catch (const PolicyError & e) {
        logger.warning(request.getId(), "not storing revalidated " + key + ": " + e.what());
        Response merged = CachePolicy::mergeHeaders(cached.first, response);
        merged.setCacheStatus(true);
        merged.setCacheLookupStatus(true);
        return merged;
    }
}

Response HttpCache::fromCache(const CachedEntry & cached, CacheMode requestMode, time_t now, int id) {
    Response response = cached.first;
    int warning = response.getWarningCode();
    if (warning >= 100 && warning < 200) {
        response.removeWarning();
    }
    response.setHeader("age", std::to_string(cached.second.age(now)));
    if (requestMode == CacheMode::FORCE_CACHE || requestMode == CacheMode::ONLY_IF_CACHED) {
        response.addWarning(112, "Disconnected operation");
    }
    response.setCacheStatus(true);
    response.setCacheLookupStatus(true);
    logger.info(id, "responding from cache, status " + std::to_string(response.getStatus()));
    return response;
}

Response HttpCache::gatewayTimeout(const Request & request) {
    Response response(504, request.getUrl(), "GatewayTimeout");
    response.setHeader("content-type", "text/plain");
    response.setCacheStatus(false);
    response.setCacheLookupStatus(false);
    return response;
}

void HttpCache::storeIfCacheable(const Request & request,
                                 const std::string & key,
                                 const Response & response,
                                 CacheMode requestMode) {
    time_t now = time(nullptr);
    if (requestMode == CacheMode::IGNORE_RULES) {
        if (response.getStatus() != 200) {
            return;
        }
        try {
            store(key, response, CachePolicy(request, response, policyOptions(), now), request.getId());
        } catch (const PolicyError & e) {
            logger.warning(request.getId(), "not caching " + key + ": " + e.what());
        }
        return;
    }

    std::optional<CachePolicy> policy = CachePolicy::assessStorability(request, response, policyOptions(), now);
    if (policy) {
        store(key, response, *policy, request.getId());
    }
}

std::optional<CachedEntry> HttpCache::lookup(const std::string & key, int id) {
    try {
        return manager->get(key);
    } catch (const StorageError & e) {
        logger.warning(id, "lookup of " + key + " failed, treating as miss: " + e.what());
    } catch (const SerializationError & e) {
        logger.warning(id, "entry " + key + " is unreadable, treating as miss: " + e.what());
    }
    return std::nullopt;
}

void HttpCache::store(const std::string & key, const Response & response, const CachePolicy & policy, int id) {
    try {
        manager->put(key, response, policy);
        logger.info(id, "cached " + key + ", expires in " + std::to_string(policy.timeToLive(time(nullptr))) + "s");
    } catch (const StorageError & e) {
        logger.warning(id, "failed to cache " + key + ": " + e.what());
    }
}

void HttpCache::invalidate(const Request & request) {
    std::string key = CacheKey::createFor(request, http::verb::get, options.cacheKey);
    try {
        manager->remove(key);
        logger.debug(request.getId(), "invalidated " + key + " after " + request.getMethod());
    } catch (const StorageError & e) {
        logger.warning(request.getId(), "failed to invalidate " + key + ": " + e.what());
    }
}

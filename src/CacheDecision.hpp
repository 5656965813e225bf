#ifndef CACHEDECISION_HPP
#define CACHEDECISION_HPP

#include <ctime>
#include <optional>
#include <string>

#include "CachePolicy.hpp"
#include "Logger.hpp"
#include "Request.hpp"

enum class CacheMode {
    // standard freshness rules, revalidate stale entries that have validators
    DEFAULT,
    // always go to the origin, but keep the store up to date
    NO_CACHE,
    // never read or write the store
    NO_STORE,
    // serve any stored entry, fresh or not
    FORCE_CACHE,
    // serve any stored entry, never contact the origin
    ONLY_IF_CACHED,
    // skip the lookup, store what comes back
    RELOAD,
    // serve any stored entry, store every 200
    IGNORE_RULES
};

std::string modeToString(CacheMode mode);
// accepts the names above in any case, with '-' or '_'; throws std::invalid_argument
CacheMode modeFromString(const std::string & name);

class CacheDecision {
public:
    enum Decision {
        // forward without looking at the store
        BYPASS,
        // forward and store what comes back
        DIRECT,
        // forward a conditional request built from the stored validators
        REVALIDATE,
        RETURN_CACHE,
        RETURN_504
    };

    // request skips the lookup entirely under mode
    static bool isBypass(const Request & request, CacheMode mode);

    Decision makeDecision(const Request & request,
                          CacheMode mode,
                          const std::optional<CachedEntry> & cached,
                          time_t now);

    // the decision needs an origin round trip
    static bool needToSend(Decision decision);

    static std::string toString(Decision decision);

private:
    static inline Logger & logger = Logger::getInstance();

    Decision handleDefault(const CachePolicy & policy, time_t now, int id);

    static std::string timeToStr(time_t time);
};

#endif

#ifndef CACHEPOLICY_HPP
#define CACHEPOLICY_HPP

#include <ctime>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <boost/serialization/access.hpp>
#include <boost/serialization/split_member.hpp>

#include "CacheControl.hpp"
#include "Request.hpp"
#include "Response.hpp"

struct CacheOptions {
    // a shared cache honours s-maxage and refuses private responses
    bool shared = true;
    // fraction of (Date - Last-Modified) used as lifetime when nothing explicit is given
    double cacheHeuristic = 0.1;
    // lower bound, in seconds, for responses marked immutable
    int64_t immutableMinTimeToLive = 24 * 3600;
    // drop no-cache/no-store/must-revalidate when paired with pre-check/post-check
    bool ignoreCargoCult = false;

    bool operator==(const CacheOptions & other) const {
        return shared == other.shared &&
               cacheHeuristic == other.cacheHeuristic &&
               immutableMinTimeToLive == other.immutableMinTimeToLive &&
               ignoreCargoCult == other.ignoreCargoCult;
    }

    template<class Archive>
    void serialize(Archive & ar, const unsigned int) {
        ar & shared;
        ar & cacheHeuristic;
        ar & immutableMinTimeToLive;
        ar & ignoreCargoCult;
    }
};

// Freshness policy of one stored response.
//
// The policy keeps a snapshot of the request and response headers taken when
// the response was received. Storability and the freshness lifetime are derived
// from that snapshot once; everything that depends on the clock (age, time to
// live, staleness) is computed from it on every call.
class CachePolicy {
public:
    enum Freshness {
        FRESH,
        STALE,
        STALE_REVALIDATABLE
    };

    typedef std::map<std::string, std::string> Headers;

    CachePolicy();

    // Throws PolicyError when a freshness header is malformed.
    CachePolicy(const Request & request,
                const Response & response,
                const CacheOptions & options = CacheOptions(),
                time_t responseTime = time(nullptr));

    // Policy for a response that may be stored, or nothing. Malformed headers
    // make a response non-cacheable, they are never an error.
    static std::optional<CachePolicy> assessStorability(const Request & request,
                                                        const Response & response,
                                                        const CacheOptions & options = CacheOptions(),
                                                        time_t now = time(nullptr));

    bool isStorable() const { return storable; }

    // freshness lifetime in seconds
    int64_t maxAge() const { return lifetime; }
    int64_t age(time_t now) const;
    // negative once the response has expired
    int64_t timeToLive(time_t now) const;
    bool isStale(time_t now) const;
    Freshness evaluate(time_t now) const;

    // the stored response carries an ETag or Last-Modified validator
    bool isRevalidatable() const;
    bool isShared() const { return options.shared; }

    time_t getResponseTime() const { return responseTime; }
    // instant at which the age of the response was zero
    time_t bornAt() const { return responseTime - ageHeader; }
    // instant at which the response becomes stale
    time_t expiresAt() const { return bornAt() + lifetime; }

    // base plus If-None-Match / If-Modified-Since built from the stored validators
    Request buildConditionalRequest(const Request & base) const;

    // stored response updated with the headers of a 304
    static Response mergeHeaders(const Response & stored, const Response & notModified);

    // Folds a 304 into the stored response: its headers win, body and status
    // are kept and the freshness clock restarts at now. Throws PolicyError when
    // the merged headers are malformed.
    std::pair<Response, CachePolicy> mergeRevalidation(const Response & stored,
                                                       const Response & notModified,
                                                       time_t now = time(nullptr)) const;

    bool operator==(const CachePolicy & other) const;
    bool operator!=(const CachePolicy & other) const { return !(*this == other); }

private:
    std::string method;
    std::string url;
    Headers requestHeaders;
    uint16_t status;
    Headers responseHeaders;
    time_t responseTime;
    CacheOptions options;

    CacheControl::Directives requestDirectives;
    CacheControl::Directives responseDirectives;
    bool storable;
    int64_t lifetime;
    int64_t ageHeader;

    CachePolicy(const std::string & method,
                const std::string & url,
                const Headers & requestHeaders,
                uint16_t status,
                const Headers & responseHeaders,
                const CacheOptions & options,
                time_t responseTime);

    // recompute everything below the snapshot
    void derive();
    bool computeStorable() const;
    int64_t computeMaxAge() const;
    bool hasExplicitExpiration() const;
    bool allowsStoringAuthenticated() const;
    time_t serverDate() const;
    std::string header(const Headers & headers, const std::string & name) const;
    bool hasDirective(const CacheControl::Directives & directives, const std::string & name) const {
        return directives.find(name) != directives.end();
    }

    friend class boost::serialization::access;

    template<class Archive>
    void save(Archive & ar, const unsigned int) const {
        ar & method;
        ar & url;
        ar & requestHeaders;
        ar & status;
        ar & responseHeaders;
        ar & responseTime;
        ar & options;
    }

    template<class Archive>
    void load(Archive & ar, const unsigned int) {
        ar & method;
        ar & url;
        ar & requestHeaders;
        ar & status;
        ar & responseHeaders;
        ar & responseTime;
        ar & options;
        derive();
    }

    BOOST_SERIALIZATION_SPLIT_MEMBER()
};

typedef std::pair<Response, CachePolicy> CachedEntry;

#endif

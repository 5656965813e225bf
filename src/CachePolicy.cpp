#include "CachePolicy.hpp"
#include "HttpDate.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace {

// status codes a cache understands well enough to store
const std::set<uint16_t> UNDERSTOOD_STATUSES = {
    200, 203, 204, 206, 300, 301, 302, 303, 307, 308, 404, 405, 410, 414, 501
};

// status codes that are storable without any explicit freshness information
const std::set<uint16_t> CACHEABLE_BY_DEFAULT = {
    200, 203, 204, 206, 300, 301, 404, 405, 410, 414, 501
};

// describe the payload of the stored response, not the 304 that revalidated it
const std::set<std::string> EXCLUDED_FROM_REVALIDATION_UPDATE = {
    "content-length", "content-encoding", "transfer-encoding", "content-range"
};

Logger & logger = Logger::getInstance();

bool isWeakEtag(const std::string & etag) {
    return etag.size() >= 2 && etag[0] == 'W' && etag[1] == '/';
}

int64_t parseAgeHeader(const std::string & value) {
    if (value.empty() || value.size() > 10 ||
        !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return 0;
    }
    return std::stoll(value);
}

}

CachePolicy::CachePolicy()
    : status(0), responseTime(0), storable(false), lifetime(0), ageHeader(0) {}

CachePolicy::CachePolicy(const Request & request,
                         const Response & response,
                         const CacheOptions & options,
                         time_t responseTime)
    : CachePolicy(request.getMethod(),
                  request.getUrl(),
                  request.getHeaderMap(),
                  response.getStatus(),
                  response.getHeaders(),
                  options,
                  responseTime) {}

CachePolicy::CachePolicy(const std::string & method,
                         const std::string & url,
                         const Headers & requestHeaders,
                         uint16_t status,
                         const Headers & responseHeaders,
                         const CacheOptions & options,
                         time_t responseTime)
    : method(method),
      url(url),
      requestHeaders(requestHeaders),
      status(status),
      responseHeaders(responseHeaders),
      responseTime(responseTime),
      options(options),
      storable(false),
      lifetime(0),
      ageHeader(0) {
    derive();
}

std::optional<CachePolicy> CachePolicy::assessStorability(const Request & request,
                                                          const Response & response,
                                                          const CacheOptions & options,
                                                          time_t now) {
    try {
        CachePolicy policy(request, response, options, now);
        if (!policy.isStorable()) {
            logger.debug(request.getId(), "response to " + request.getUrl() + " is not storable");
            return std::nullopt;
        }
        return policy;
    } catch (const PolicyError & e) {
        logger.warning(request.getId(), "not caching " + request.getUrl() + ": " + e.what());
        return std::nullopt;
    }
}

std::string CachePolicy::header(const Headers & headers, const std::string & name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

void CachePolicy::derive() {
    requestDirectives = CacheControl::parse(header(requestHeaders, "cache-control"));
    responseDirectives = CacheControl::parse(header(responseHeaders, "cache-control"));

    // HTTP/1.0 servers only know Pragma
    if (responseHeaders.find("cache-control") == responseHeaders.end() &&
        header(responseHeaders, "pragma").find("no-cache") != std::string::npos) {
        responseDirectives["no-cache"] = "";
    }

    if (options.ignoreCargoCult &&
        (hasDirective(responseDirectives, "pre-check") || hasDirective(responseDirectives, "post-check"))) {
        responseDirectives.erase("pre-check");
        responseDirectives.erase("post-check");
        responseDirectives.erase("no-cache");
        responseDirectives.erase("no-store");
        responseDirectives.erase("must-revalidate");
        responseHeaders["cache-control"] = CacheControl::format(responseDirectives);
        if (responseHeaders["cache-control"].empty()) {
            responseHeaders.erase("cache-control");
        }
        responseHeaders.erase("expires");
        responseHeaders.erase("pragma");
    }

    ageHeader = parseAgeHeader(header(responseHeaders, "age"));
    storable = computeStorable();
    lifetime = computeMaxAge();
}

bool CachePolicy::hasExplicitExpiration() const {
    return (options.shared && hasDirective(responseDirectives, "s-maxage")) ||
           hasDirective(responseDirectives, "max-age") ||
           responseHeaders.find("expires") != responseHeaders.end();
}

bool CachePolicy::allowsStoringAuthenticated() const {
    return hasDirective(responseDirectives, "must-revalidate") ||
           hasDirective(responseDirectives, "public") ||
           hasDirective(responseDirectives, "s-maxage");
}

bool CachePolicy::computeStorable() const {
    if (hasDirective(requestDirectives, "no-store") || hasDirective(responseDirectives, "no-store")) {
        return false;
    }
    if (!(method == "GET" || method == "HEAD" || (method == "POST" && hasExplicitExpiration()))) {
        return false;
    }
    if (UNDERSTOOD_STATUSES.count(status) == 0) {
        return false;
    }
    if (options.shared && hasDirective(responseDirectives, "private")) {
        return false;
    }
    if (options.shared && requestHeaders.find("authorization") != requestHeaders.end() &&
        !allowsStoringAuthenticated()) {
        return false;
    }
    return responseHeaders.find("expires") != responseHeaders.end() ||
           hasDirective(responseDirectives, "max-age") ||
           (options.shared && hasDirective(responseDirectives, "s-maxage")) ||
           hasDirective(responseDirectives, "public") ||
           CACHEABLE_BY_DEFAULT.count(status) > 0;
}

time_t CachePolicy::serverDate() const {
    std::optional<time_t> date = HttpDate::parse(header(responseHeaders, "date"));
    return date ? *date : responseTime;
}

int64_t CachePolicy::computeMaxAge() const {
    if (!storable || hasDirective(responseDirectives, "no-cache")) {
        return 0;
    }

    // cookies in a shared cache need an explicit opt-in
    if (options.shared && responseHeaders.find("set-cookie") != responseHeaders.end() &&
        !hasDirective(responseDirectives, "public") && !hasDirective(responseDirectives, "immutable")) {
        return 0;
    }

    if (header(responseHeaders, "vary") == "*") {
        return 0;
    }

    if (options.shared) {
        if (hasDirective(responseDirectives, "proxy-revalidate")) {
            return 0;
        }
        // s-maxage overrides both max-age and Expires
        if (hasDirective(responseDirectives, "s-maxage")) {
            return CacheControl::seconds(responseDirectives, "s-maxage", 0);
        }
    }

    // max-age overrides Expires
    if (hasDirective(responseDirectives, "max-age")) {
        return CacheControl::seconds(responseDirectives, "max-age", 0);
    }

    int64_t defaultMinTtl = hasDirective(responseDirectives, "immutable") ? options.immutableMinTimeToLive : 0;
    time_t date = serverDate();

    auto expires = responseHeaders.find("expires");
    if (expires != responseHeaders.end()) {
        std::optional<time_t> expiresTime = HttpDate::parse(expires->second);
        // invalid dates, "0" included, mean already expired
        if (!expiresTime) {
            return 0;
        }
        return std::max<int64_t>(defaultMinTtl, static_cast<int64_t>(*expiresTime - date));
    }

    std::optional<time_t> lastModified = HttpDate::parse(header(responseHeaders, "last-modified"));
    if (lastModified && date > *lastModified) {
        int64_t heuristic = static_cast<int64_t>(static_cast<double>(date - *lastModified) * options.cacheHeuristic);
        return std::max<int64_t>(defaultMinTtl, heuristic);
    }

    return defaultMinTtl;
}

int64_t CachePolicy::age(time_t now) const {
    int64_t resident = now > responseTime ? static_cast<int64_t>(now - responseTime) : 0;
    return ageHeader + resident;
}

int64_t CachePolicy::timeToLive(time_t now) const {
    return lifetime - age(now);
}

bool CachePolicy::isStale(time_t now) const {
    return lifetime <= age(now);
}

CachePolicy::Freshness CachePolicy::evaluate(time_t now) const {
    if (!isStale(now)) {
        return FRESH;
    }
    return isRevalidatable() ? STALE_REVALIDATABLE : STALE;
}

bool CachePolicy::isRevalidatable() const {
    return responseHeaders.find("etag") != responseHeaders.end() ||
           responseHeaders.find("last-modified") != responseHeaders.end();
}

Request CachePolicy::buildConditionalRequest(const Request & base) const {
    Request conditional = base;
    // weak validators are only allowed on plain GETs
    bool forbidsWeakValidators = !base.isGet() || base.hasHeader("range");

    std::string etag = header(responseHeaders, "etag");
    if (!etag.empty() && !(forbidsWeakValidators && isWeakEtag(etag))) {
        std::string existing = conditional.getHeader("if-none-match");
        conditional.setHeader("if-none-match", existing.empty() ? etag : existing + ", " + etag);
    }

    if (forbidsWeakValidators) {
        // Last-Modified is a weak validator
        conditional.removeHeader("if-modified-since");
    } else {
        std::string lastModified = header(responseHeaders, "last-modified");
        if (!lastModified.empty() && !conditional.hasHeader("if-modified-since")) {
            conditional.setHeader("if-modified-since", lastModified);
        }
    }
    return conditional;
}

Response CachePolicy::mergeHeaders(const Response & stored, const Response & notModified) {
    Response merged = stored;
    for (const auto & field : notModified.getHeaders()) {
        if (EXCLUDED_FROM_REVALIDATION_UPDATE.count(field.first) == 0) {
            merged.setHeader(field.first, field.second);
        }
    }
    // 1xx warnings must be deleted after a successful revalidation
    int warning = merged.getWarningCode();
    if (warning >= 100 && warning < 200) {
        merged.removeWarning();
    }
    return merged;
}

std::pair<Response, CachePolicy> CachePolicy::mergeRevalidation(const Response & stored,
                                                                const Response & notModified,
                                                                time_t now) const {
    Response merged = mergeHeaders(stored, notModified);
    CachePolicy policy(method, url, requestHeaders, merged.getStatus(), merged.getHeaders(), options, now);
    return std::make_pair(merged, policy);
}

bool CachePolicy::operator==(const CachePolicy & other) const {
    return method == other.method &&
           url == other.url &&
           requestHeaders == other.requestHeaders &&
           status == other.status &&
           responseHeaders == other.responseHeaders &&
           responseTime == other.responseTime &&
           options == other.options;
}

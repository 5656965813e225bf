#include "CacheDecision.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string modeToString(CacheMode mode) {
    switch (mode) {
        case CacheMode::DEFAULT: return "default";
        case CacheMode::NO_CACHE: return "no-cache";
        case CacheMode::NO_STORE: return "no-store";
        case CacheMode::FORCE_CACHE: return "force-cache";
        case CacheMode::ONLY_IF_CACHED: return "only-if-cached";
        case CacheMode::RELOAD: return "reload";
        case CacheMode::IGNORE_RULES: return "ignore-rules";
    }
    return "unknown";
}

CacheMode modeFromString(const std::string & name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    for (CacheMode mode : {CacheMode::DEFAULT, CacheMode::NO_CACHE, CacheMode::NO_STORE,
                           CacheMode::FORCE_CACHE, CacheMode::ONLY_IF_CACHED,
                           CacheMode::RELOAD, CacheMode::IGNORE_RULES}) {
        if (modeToString(mode) == normalized) {
            return mode;
        }
    }
    throw std::invalid_argument("unknown cache mode: " + name);
}

bool CacheDecision::isBypass(const Request & request, CacheMode mode) {
    return mode == CacheMode::NO_STORE ||
           mode == CacheMode::RELOAD ||
           !request.isGetOrHead();
}

CacheDecision::Decision CacheDecision::makeDecision(const Request & request,
                                                    CacheMode mode,
                                                    const std::optional<CachedEntry> & cached,
                                                    time_t now) {
    if (isBypass(request, mode)) {
        logger.info(request.getId(), "bypassing cache (" + modeToString(mode) + ", " + request.getMethod() + ")");
        return CacheDecision::BYPASS;
    }

    // no entry
    if (!cached) {
        if (mode == CacheMode::ONLY_IF_CACHED) {
            logger.info(request.getId(), "not in cache, but only-if-cached");
            return CacheDecision::RETURN_504;
        }
        logger.info(request.getId(), "not in cache");
        return CacheDecision::DIRECT;
    }

    switch (mode) {
        case CacheMode::NO_CACHE:
            logger.info(request.getId(), "in cache, requires validation");
            return CacheDecision::DIRECT;
        case CacheMode::FORCE_CACHE:
        case CacheMode::ONLY_IF_CACHED:
        case CacheMode::IGNORE_RULES:
            logger.info(request.getId(), "in cache, served regardless of freshness");
            return CacheDecision::RETURN_CACHE;
        default:
            return handleDefault(cached->second, now, request.getId());
    }
}

CacheDecision::Decision CacheDecision::handleDefault(const CachePolicy & policy, time_t now, int id) {
    switch (policy.evaluate(now)) {
        case CachePolicy::FRESH:
            logger.info(id, "in cache, valid");
            return CacheDecision::RETURN_CACHE;
        case CachePolicy::STALE_REVALIDATABLE:
            logger.info(id, "in cache, but expired at " + timeToStr(policy.expiresAt()) + ", revalidating");
            return CacheDecision::REVALIDATE;
        case CachePolicy::STALE:
            break;
    }
    logger.info(id, "in cache, but expired at " + timeToStr(policy.expiresAt()));
    return CacheDecision::DIRECT;
}

bool CacheDecision::needToSend(Decision decision) {
    return decision == CacheDecision::BYPASS ||
           decision == CacheDecision::DIRECT ||
           decision == CacheDecision::REVALIDATE;
}

std::string CacheDecision::toString(Decision decision) {
    switch (decision) {
        case CacheDecision::BYPASS: return "BYPASS";
        case CacheDecision::DIRECT: return "DIRECT";
        case CacheDecision::REVALIDATE: return "REVALIDATE";
        case CacheDecision::RETURN_CACHE: return "RETURN_CACHE";
        case CacheDecision::RETURN_504: return "RETURN_504";
    }
    return "UNKNOWN";
}

std::string CacheDecision::timeToStr(time_t time) {
    std::tm tm;
    std::ostringstream oss;
    gmtime_r(&time, &tm);
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

#include <gtest/gtest.h>
#include "../src/CacheDecision.hpp"
#include "../src/HttpCache.hpp"
#include "../src/Logger.hpp"
#include "../src/MemoryCacheManager.hpp"
#include "MockTransport.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace {

const std::string URL = "http://example.com/resource";

Response respond(const Request & request, uint16_t status, const std::string & cacheControl, const std::string & body) {
    Response response(status, request.getUrl(), body);
    if (!cacheControl.empty()) {
        response.setHeader("cache-control", cacheControl);
    }
    return response;
}

// every operation fails as if the backing store were unreachable
class FailingCacheManager : public CacheManager {
public:
    std::optional<CachedEntry> get(const std::string & key) override {
        throw StorageError("store unavailable: " + key);
    }
    void put(const std::string & key, const Response &, const CachePolicy &) override {
        throw StorageError("store unavailable: " + key);
    }
    void remove(const std::string & key) override {
        throw StorageError("store unavailable: " + key);
    }
    void clear() override {
        throw StorageError("store unavailable");
    }
};

}

class HttpCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsole(false);
        manager = std::make_shared<MemoryCacheManager>();
    }

    Response get(HttpCache & cache, const std::string & url = URL) {
        return cache.run(Request(http::verb::get, url), origin);
    }

    std::shared_ptr<MemoryCacheManager> manager;
    MockTransport origin;
};

// ============== Test #1: Default mode ==============
TEST_F(HttpCacheTest, DefaultModeServesRepeatFromCache) {
    std::cout << "\n=== Starting DefaultModeServesRepeatFromCache ===" << std::endl;
    try {
        HttpCache cache(CacheMode::DEFAULT, manager);

        Response first = get(cache);
        EXPECT_EQ(origin.getCalls(), 1);
        EXPECT_EQ(first.getBody(), "test");
        EXPECT_EQ(first.getHeader("x-cache"), "MISS");
        EXPECT_EQ(first.getHeader("x-cache-lookup"), "MISS");
        EXPECT_TRUE(manager->get("GET:" + URL));

        Response second = get(cache);
        EXPECT_EQ(origin.getCalls(), 1);
        EXPECT_EQ(second.getBody(), "test");
        EXPECT_EQ(second.getStatus(), 200);
        EXPECT_EQ(second.getHeader("x-cache"), "HIT");
        EXPECT_EQ(second.getHeader("x-cache-lookup"), "HIT");
        EXPECT_TRUE(second.hasHeader("age"));
        EXPECT_FALSE(second.hasHeader("warning"));
    } catch (const std::exception & e) {
        FAIL() << "Exception in DefaultModeServesRepeatFromCache: " << e.what();
    }
}

TEST_F(HttpCacheTest, NonCacheableResponseIsNotStored) {
    origin.setHandler([](const Request & request) {
        return respond(request, 200, "no-store", "secret");
    });
    HttpCache cache(CacheMode::DEFAULT, manager);

    get(cache);
    get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_FALSE(manager->get("GET:" + URL));
}

// ============== Test #2: NoCache mode ==============
TEST_F(HttpCacheTest, NoCacheModeAlwaysAsksOrigin) {
    std::cout << "\n=== Starting NoCacheModeAlwaysAsksOrigin ===" << std::endl;
    HttpCache cache(CacheMode::NO_CACHE, manager);

    get(cache);
    Response second = get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(second.getHeader("x-cache"), "MISS");
    EXPECT_EQ(second.getHeader("x-cache-lookup"), "HIT");
    EXPECT_EQ(origin.lastRequest().getHeader("cache-control"), "no-cache");
    EXPECT_TRUE(manager->get("GET:" + URL));
}

TEST_F(HttpCacheTest, NoCacheModeKeepsCallerDirectives) {
    HttpCache cache(CacheMode::NO_CACHE, manager);
    Request request(http::verb::get, URL);
    request.setHeader("Cache-Control", "max-stale=60");

    cache.run(request, origin);
    EXPECT_EQ(origin.lastRequest().getHeader("cache-control"), "max-stale=60, no-cache");
    // the caller's request is not modified
    EXPECT_EQ(request.getHeader("cache-control"), "max-stale=60");

    request.setHeader("Cache-Control", "no-cache");
    cache.run(request, origin);
    EXPECT_EQ(origin.lastRequest().getHeader("cache-control"), "no-cache");
}

// ============== Test #3: key override ==============
TEST_F(HttpCacheTest, CustomCacheKey) {
    HttpCacheOptions options;
    options.cacheKey = [](const Request & request) {
        return request.getMethod() + ":" + request.getUrl() + ":" + request.getVersion() + ":test";
    };
    HttpCache cache(CacheMode::DEFAULT, manager, options);

    get(cache);
    EXPECT_FALSE(manager->get("GET:" + URL));
    EXPECT_TRUE(manager->get("GET:" + URL + ":HTTP/1.1:test"));

    get(cache);
    EXPECT_EQ(origin.getCalls(), 1);
}

TEST_F(HttpCacheTest, PrivateResponsesNeedPrivateCache) {
    origin.setHandler([](const Request & request) {
        return respond(request, 200, "private, max-age=86400", "mine");
    });

    HttpCache shared(CacheMode::DEFAULT, manager);
    get(shared);
    get(shared);
    EXPECT_EQ(origin.getCalls(), 2);

    HttpCacheOptions options;
    CacheOptions privateCache;
    privateCache.shared = false;
    options.cacheOptions = privateCache;
    HttpCache personal(CacheMode::DEFAULT, manager, options);
    get(personal);
    get(personal);
    EXPECT_EQ(origin.getCalls(), 3);
    EXPECT_TRUE(manager->get("GET:" + URL));
}

// ============== Test #4: revalidation ==============
TEST_F(HttpCacheTest, StaleEntryIsRevalidated) {
    std::cout << "\n=== Starting StaleEntryIsRevalidated ===" << std::endl;
    origin.setHandler([](const Request & request) {
        if (request.getHeader("if-none-match") == "\"v1\"") {
            Response notModified = respond(request, 304, "max-age=600", "");
            notModified.setHeader("etag", "\"v1\"");
            notModified.setHeader("x-revalidated", "yes");
            return notModified;
        }
        Response response = respond(request, 200, "max-age=0", "test");
        response.setHeader("etag", "\"v1\"");
        return response;
    });
    HttpCache cache(CacheMode::DEFAULT, manager);

    get(cache);
    Response revalidated = get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(revalidated.getStatus(), 200);
    EXPECT_EQ(revalidated.getBody(), "test");
    EXPECT_EQ(revalidated.getHeader("x-revalidated"), "yes");
    EXPECT_EQ(revalidated.getHeader("x-cache"), "HIT");

    std::optional<CachedEntry> stored = manager->get("GET:" + URL);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored->second.maxAge(), 600);
    EXPECT_EQ(stored->first.getBody(), "test");

    // fresh again after the merge
    get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
}

TEST_F(HttpCacheTest, RevalidationWithNewContentReplacesEntry) {
    int version = 0;
    origin.setHandler([&version](const Request & request) {
        version++;
        Response response = respond(request, 200, "max-age=0", "v" + std::to_string(version));
        response.setHeader("last-modified", "Sun, 06 Nov 1994 08:49:37 GMT");
        return response;
    });
    HttpCache cache(CacheMode::DEFAULT, manager);

    get(cache);
    Response second = get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(origin.lastRequest().getHeader("if-modified-since"), "Sun, 06 Nov 1994 08:49:37 GMT");
    EXPECT_EQ(second.getBody(), "v2");
    EXPECT_EQ(second.getHeader("x-cache"), "MISS");
    EXPECT_EQ(manager->get("GET:" + URL)->first.getBody(), "v2");
}

TEST_F(HttpCacheTest, StaleWithoutValidatorsIsRefetched) {
    int version = 0;
    origin.setHandler([&version](const Request & request) {
        version++;
        return respond(request, 200, "max-age=0", "v" + std::to_string(version));
    });
    HttpCache cache(CacheMode::DEFAULT, manager);

    get(cache);
    Response second = get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_FALSE(origin.lastRequest().hasHeader("if-none-match"));
    EXPECT_EQ(second.getBody(), "v2");
    EXPECT_EQ(second.getHeader("x-cache-lookup"), "HIT");
    EXPECT_EQ(manager->get("GET:" + URL)->first.getBody(), "v2");
}

// ============== Test #5: offline modes ==============
TEST_F(HttpCacheTest, OnlyIfCachedMissIsGatewayTimeout) {
    HttpCache cache(CacheMode::ONLY_IF_CACHED, manager);

    Response response = get(cache);
    EXPECT_EQ(origin.getCalls(), 0);
    EXPECT_EQ(response.getStatus(), 504);
    EXPECT_EQ(response.getBody(), "GatewayTimeout");
    EXPECT_FALSE(manager->get("GET:" + URL));
}

TEST_F(HttpCacheTest, OfflineModesServeStaleEntries) {
    std::cout << "\n=== Starting OfflineModesServeStaleEntries ===" << std::endl;
    origin.setHandler([](const Request & request) {
        return respond(request, 200, "max-age=0", "old");
    });
    HttpCache online(CacheMode::DEFAULT, manager);
    get(online);

    HttpCache forced(CacheMode::FORCE_CACHE, manager);
    Response fromForce = get(forced);
    EXPECT_EQ(fromForce.getBody(), "old");
    EXPECT_EQ(fromForce.getWarningCode(), 112);
    EXPECT_NE(fromForce.getHeader("warning").find("Disconnected operation"), std::string::npos);

    HttpCache offline(CacheMode::ONLY_IF_CACHED, manager);
    Response fromOffline = get(offline);
    EXPECT_EQ(fromOffline.getBody(), "old");
    EXPECT_EQ(fromOffline.getWarningCode(), 112);
    EXPECT_EQ(fromOffline.getHeader("x-cache"), "HIT");

    EXPECT_EQ(origin.getCalls(), 1);
}

TEST_F(HttpCacheTest, ForceCacheMissGoesToOrigin) {
    HttpCache cache(CacheMode::FORCE_CACHE, manager);
    get(cache);
    EXPECT_EQ(origin.getCalls(), 1);
    EXPECT_TRUE(manager->get("GET:" + URL));
}

// ============== Test #6: store bypassing modes ==============
TEST_F(HttpCacheTest, NoStoreNeverTouchesStore) {
    HttpCache cache(CacheMode::NO_STORE, manager);
    get(cache);
    Response second = get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(second.getHeader("x-cache"), "MISS");
    EXPECT_FALSE(manager->get("GET:" + URL));
}

TEST_F(HttpCacheTest, ReloadWritesThrough) {
    int version = 0;
    origin.setHandler([&version](const Request & request) {
        version++;
        return respond(request, 200, "max-age=86400", "v" + std::to_string(version));
    });
    HttpCache normal(CacheMode::DEFAULT, manager);
    HttpCache reload(CacheMode::RELOAD, manager);

    get(normal);
    Response reloaded = get(reload);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(reloaded.getBody(), "v2");
    EXPECT_EQ(get(normal).getBody(), "v2");
    EXPECT_EQ(origin.getCalls(), 2);
}

TEST_F(HttpCacheTest, IgnoreRulesStoresAnyOk) {
    origin.setHandler([](const Request & request) {
        return respond(request, 200, "no-store", "whatever");
    });
    HttpCache cache(CacheMode::IGNORE_RULES, manager);

    get(cache);
    Response second = get(cache);
    EXPECT_EQ(origin.getCalls(), 1);
    EXPECT_EQ(second.getBody(), "whatever");
    EXPECT_EQ(second.getHeader("x-cache"), "HIT");
}

TEST_F(HttpCacheTest, ModeFunctionOverridesPerRequest) {
    HttpCacheOptions options;
    options.cacheModeFn = [](const Request & request) {
        return request.getUrl().find("/live") != std::string::npos ? CacheMode::NO_STORE : CacheMode::DEFAULT;
    };
    HttpCache cache(CacheMode::DEFAULT, manager, options);

    get(cache, "http://example.com/live");
    get(cache, "http://example.com/live");
    get(cache, URL);
    get(cache, URL);
    EXPECT_EQ(origin.getCalls(), 3);
    EXPECT_FALSE(manager->get("GET:http://example.com/live"));
    EXPECT_TRUE(manager->get("GET:" + URL));
}

// ============== Test #7: invalidation ==============
TEST_F(HttpCacheTest, UnsafeMethodInvalidatesGetEntry) {
    HttpCache cache(CacheMode::DEFAULT, manager);
    get(cache);
    ASSERT_TRUE(manager->get("GET:" + URL));

    Response posted = cache.run(Request(http::verb::post, URL), origin);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(posted.getHeader("x-cache"), "MISS");
    EXPECT_FALSE(manager->get("GET:" + URL));
    EXPECT_FALSE(manager->get("POST:" + URL));
}

TEST_F(HttpCacheTest, FailedUnsafeMethodKeepsEntry) {
    HttpCache cache(CacheMode::DEFAULT, manager);
    get(cache);

    origin.setHandler([](const Request & request) {
        return respond(request, 500, "", "boom");
    });
    cache.run(Request(http::verb::put, URL), origin);
    EXPECT_TRUE(manager->get("GET:" + URL));
}

TEST_F(HttpCacheTest, RemoveDeletesEntry) {
    HttpCache cache(CacheMode::DEFAULT, manager);
    Request request(http::verb::get, URL);
    cache.run(request, origin);

    cache.remove(request);
    EXPECT_FALSE(manager->get("GET:" + URL));
    EXPECT_NO_THROW(cache.remove(request));

    cache.run(request, origin);
    EXPECT_EQ(origin.getCalls(), 2);
}

// ============== Test #8: failures ==============
TEST_F(HttpCacheTest, StorageFailureFallsBackToOrigin) {
    std::cout << "\n=== Starting StorageFailureFallsBackToOrigin ===" << std::endl;
    HttpCache cache(CacheMode::DEFAULT, std::make_shared<FailingCacheManager>());

    Response first = get(cache);
    Response second = get(cache);
    EXPECT_EQ(origin.getCalls(), 2);
    EXPECT_EQ(first.getBody(), "test");
    EXPECT_EQ(second.getBody(), "test");
    EXPECT_EQ(second.getHeader("x-cache-lookup"), "MISS");

    // the caller asked for the delete, so the caller sees the failure
    EXPECT_THROW(cache.remove(Request(http::verb::get, URL)), StorageError);
}

TEST_F(HttpCacheTest, NetworkErrorPropagates) {
    origin.setHandler([](const Request &) -> Response {
        throw NetworkError("connection refused");
    });
    HttpCache cache(CacheMode::DEFAULT, manager);

    EXPECT_THROW(get(cache), NetworkError);
    EXPECT_FALSE(manager->get("GET:" + URL));
}

TEST_F(HttpCacheTest, MalformedHeadersAreNotCached) {
    origin.setHandler([](const Request & request) {
        return respond(request, 200, "max-age=forever", "test");
    });
    HttpCache cache(CacheMode::DEFAULT, manager);

    EXPECT_EQ(get(cache).getBody(), "test");
    EXPECT_FALSE(manager->get("GET:" + URL));
}

TEST_F(HttpCacheTest, RequiresManager) {
    EXPECT_THROW(HttpCache cache(CacheMode::DEFAULT, nullptr), std::invalid_argument);
}

// ============== decisions ==============
TEST(CacheDecisionTest, DecisionTable) {
    Logger::getInstance().setConsole(false);
    CacheDecision decision;
    Request request(http::verb::get, URL);
    time_t now = 1700000000;

    Response stale(200, URL, "test");
    stale.setHeader("cache-control", "max-age=10");
    stale.setHeader("etag", "\"v1\"");
    CachedEntry entry(stale, CachePolicy(request, stale, CacheOptions(), now));
    std::optional<CachedEntry> hit = entry;
    std::optional<CachedEntry> miss;

    EXPECT_EQ(decision.makeDecision(request, CacheMode::DEFAULT, miss, now), CacheDecision::DIRECT);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::DEFAULT, hit, now), CacheDecision::RETURN_CACHE);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::DEFAULT, hit, now + 10), CacheDecision::REVALIDATE);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::NO_CACHE, hit, now), CacheDecision::DIRECT);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::NO_STORE, hit, now), CacheDecision::BYPASS);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::RELOAD, hit, now), CacheDecision::BYPASS);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::FORCE_CACHE, hit, now + 100), CacheDecision::RETURN_CACHE);
    EXPECT_EQ(decision.makeDecision(request, CacheMode::ONLY_IF_CACHED, miss, now), CacheDecision::RETURN_504);
    EXPECT_EQ(decision.makeDecision(Request(http::verb::delete_, URL), CacheMode::DEFAULT, hit, now),
              CacheDecision::BYPASS);

    EXPECT_TRUE(CacheDecision::needToSend(CacheDecision::REVALIDATE));
    EXPECT_FALSE(CacheDecision::needToSend(CacheDecision::RETURN_504));
    EXPECT_EQ(CacheDecision::toString(CacheDecision::REVALIDATE), "REVALIDATE");
    EXPECT_EQ(CacheDecision::toString(CacheDecision::RETURN_504), "RETURN_504");
}

TEST(CacheDecisionTest, ModeNames) {
    EXPECT_EQ(modeFromString("only-if-cached"), CacheMode::ONLY_IF_CACHED);
    EXPECT_EQ(modeFromString("NO_CACHE"), CacheMode::NO_CACHE);
    EXPECT_EQ(modeToString(CacheMode::FORCE_CACHE), "force-cache");
    EXPECT_THROW(modeFromString("sometimes"), std::invalid_argument);
}

#include <gtest/gtest.h>
#include "../src/CacheKey.hpp"
#include "../src/Request.hpp"
#include "../src/Response.hpp"
#include "../src/Url.hpp"
#include <stdexcept>

TEST(UrlTest, Normalizes) {
    EXPECT_EQ(Url::parse("HTTP://Example.COM").toString(), "http://example.com/");
    EXPECT_EQ(Url::parse("http://example.com:80/a?b=1#frag").toString(), "http://example.com/a?b=1");
    EXPECT_EQ(Url::parse("https://example.com:443/x").toString(), "https://example.com/x");
    EXPECT_EQ(Url::parse("http://user:pw@example.com:8080/x").toString(), "http://example.com:8080/x");
    EXPECT_EQ(Url::parse("http://example.com?q").getTarget(), "/?q");
}

TEST(UrlTest, Components) {
    Url url = Url::parse("http://127.0.0.1:8080/path");
    EXPECT_EQ(url.getScheme(), "http");
    EXPECT_EQ(url.getHost(), "127.0.0.1");
    EXPECT_EQ(url.getPort(), 8080);
    EXPECT_EQ(url.getAuthority(), "127.0.0.1:8080");
    EXPECT_FALSE(url.isDefaultPort());
}

TEST(UrlTest, RejectsBadUrls) {
    EXPECT_THROW(Url::parse("example.com/"), std::runtime_error);
    EXPECT_THROW(Url::parse("ftp://example.com/"), std::runtime_error);
    EXPECT_THROW(Url::parse("http://:80/"), std::runtime_error);
    EXPECT_THROW(Url::parse("http://example.com:99999/"), std::runtime_error);
}

TEST(CacheKeyTest, DefaultFormat) {
    Request request(http::verb::get, "http://example.com");
    EXPECT_EQ(CacheKey::create(request), "GET:http://example.com/");

    Request head(http::verb::head, "http://Example.com:80/a");
    EXPECT_EQ(CacheKey::create(head), "HEAD:http://example.com/a");
}

TEST(CacheKeyTest, CustomFunction) {
    CacheKeyFn fn = [](const Request & request) {
        return request.getMethod() + ":" + request.getUrl() + ":" + request.getVersion() + ":test";
    };
    Request request(http::verb::get, "http://example.com/");

    EXPECT_EQ(CacheKey::create(request, fn), "GET:http://example.com/:HTTP/1.1:test");
    EXPECT_EQ(CacheKey::create(request, CacheKeyFn()), "GET:http://example.com/");
}

TEST(CacheKeyTest, KeyForAnotherMethod) {
    Request post(http::verb::post, "http://example.com/items");
    EXPECT_EQ(CacheKey::createFor(post, http::verb::get, CacheKeyFn()), "GET:http://example.com/items");
    // the original request is left alone
    EXPECT_EQ(post.getMethod(), "POST");
}

TEST(RequestTest, WireForm) {
    Request request(http::verb::post, "http://example.com:8080/items?x=1");
    request.setBody("payload");

    http::request<http::string_body> wire = request.toBeast();
    EXPECT_EQ(std::string(wire.target()), "/items?x=1");
    EXPECT_EQ(std::string(wire[http::field::host]), "example.com:8080");
    EXPECT_EQ(std::string(wire[http::field::content_length]), "7");
}

TEST(RequestTest, HeaderMapIsLowerCase) {
    Request request(http::verb::get, "http://example.com/");
    request.setHeader("Accept", "text/html");
    request.setHeader("X-Trace", "1");

    std::map<std::string, std::string> headers = request.getHeaderMap();
    EXPECT_EQ(headers.at("accept"), "text/html");
    EXPECT_EQ(headers.at("x-trace"), "1");
    EXPECT_EQ(headers.count("Accept"), 0u);
}

TEST(RequestTest, IdsAreUnique) {
    Request first(http::verb::get, "http://example.com/");
    Request second(http::verb::get, "http://example.com/");
    EXPECT_NE(first.getId(), second.getId());
    Request copy = first;
    EXPECT_EQ(copy.getId(), first.getId());
}

TEST(ResponseTest, HeadersAreCaseInsensitive) {
    Response response(200, "http://example.com/", "test");
    response.setHeader("Content-Type", "text/plain");
    EXPECT_EQ(response.getHeader("content-type"), "text/plain");
    EXPECT_TRUE(response.hasHeader("CONTENT-TYPE"));
    response.removeHeader("content-TYPE");
    EXPECT_FALSE(response.hasHeader("content-type"));
}

TEST(ResponseTest, FromAndToWire) {
    http::response<http::string_body> wire(http::status::ok, 10);
    wire.set(http::field::cache_control, "max-age=60");
    wire.insert("X-Multi", "a");
    wire.insert("X-Multi", "b");
    wire.body() = "test";

    Response response(wire, "http://example.com/");
    EXPECT_EQ(response.getStatus(), 200);
    EXPECT_EQ(response.getVersion(), HttpVersion::HTTP_10);
    EXPECT_EQ(response.getHeader("x-multi"), "a, b");
    EXPECT_EQ(response.getHeader("cache-control"), "max-age=60");

    http::response<http::string_body> back = response.toBeast();
    EXPECT_EQ(back.result_int(), 200u);
    EXPECT_EQ(back.version(), 10u);
    EXPECT_EQ(std::string(back[http::field::content_length]), "4");
    EXPECT_EQ(back.body(), "test");

    // no payload headers for a 304
    http::response<http::string_body> notModified = Response(304, "http://example.com/").toBeast();
    EXPECT_TRUE(notModified.find(http::field::content_length) == notModified.end());
}

TEST(ResponseTest, Warnings) {
    Response response(200, "http://example.com/", "test");
    EXPECT_EQ(response.getWarningCode(), 0);
    response.addWarning(112, "Disconnected operation");
    EXPECT_EQ(response.getWarningCode(), 112);
    EXPECT_EQ(response.getHeader("warning").find("112 example.com \"Disconnected operation\""), 0u);
    response.removeWarning();
    EXPECT_FALSE(response.hasHeader("warning"));
}

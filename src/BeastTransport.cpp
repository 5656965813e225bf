#include "BeastTransport.hpp"
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

BeastTransport::BeastTransport(std::chrono::seconds timeout, uint64_t bodyLimit)
    : timeout(timeout), bodyLimit(bodyLimit) {}

Response BeastTransport::fetch(const Request & request) {
    const Url & url = request.getParsedUrl();
    if (url.getScheme() != "http") {
        throw NetworkError("TLS is not supported: " + request.getUrl());
    }

    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    asio::steady_timer resolveDeadline(ioc, timeout);
    beast::flat_buffer buffer;
    http::request<http::string_body> req = request.toBeast();
    http::response_parser<http::string_body> parser;
    parser.body_limit(bodyLimit);
    // a HEAD response announces a body that never comes
    if (request.getVerb() == http::verb::head) {
        parser.skip(true);
    }
    beast::error_code result;
    std::string stage = "resolve";

    logger.info(request.getId(), "Requesting \"" + request.getMethod() + " " +
                request.getUrl() + " " + request.getVersion() + "\" from " + url.getAuthority());

    // the resolver has no deadline of its own
    resolveDeadline.async_wait([&](beast::error_code ec) {
        if (!ec) {
            resolver.cancel();
        }
    });

    resolver.async_resolve(url.getHost(), std::to_string(url.getPort()),
        [&](beast::error_code ec, tcp::resolver::results_type results) {
            resolveDeadline.cancel();
            if (ec) {
                result = ec == asio::error::operation_aborted ? beast::error::timeout : ec;
                return;
            }
            stage = "connect";
            stream.expires_after(timeout);
            stream.async_connect(results, [&](beast::error_code ec, tcp::endpoint) {
                if (ec) {
                    result = ec;
                    return;
                }
                stage = "write";
                http::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
                    if (ec) {
                        result = ec;
                        return;
                    }
                    stage = "read";
                    http::async_read(stream, buffer, parser, [&](beast::error_code ec, std::size_t) {
                        result = ec;
                    });
                });
            });
        });

    ioc.run();

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        logger.debug(request.getId(), "shutdown: " + ec.message());
    }

    if (result) {
        std::string reason = result == beast::error::timeout
            ? "timed out after " + std::to_string(timeout.count()) + "s"
            : result.message();
        logger.error(request.getId(), "ERROR in " + stage + " for " + request.getUrl() + ": " + reason);
        throw NetworkError(stage + " failed for " + request.getUrl() + ": " + reason);
    }

    http::response<http::string_body> res = parser.release();
    logger.info(request.getId(), "Received \"" + std::to_string(res.result_int()) + " " +
                std::string(res.reason()) + "\" from " + url.getAuthority() +
                " bodyLen(" + std::to_string(res.body().size()) + ")");
    return Response(res, request.getUrl());
}

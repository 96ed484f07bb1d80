#include "api/transport/impl/http/beast_http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

namespace masumi::api {

outcome::result<std::shared_ptr<BeastHttpClient>> BeastHttpClient::New(const std::string& base_url) {
    BOOST_OUTCOME_TRY(endpoint, parseUrl(base_url));
    return std::shared_ptr<BeastHttpClient>(new BeastHttpClient(std::move(endpoint)));
}

BeastHttpClient::BeastHttpClient(Endpoint endpoint) : endpoint_(std::move(endpoint)) {}

outcome::result<HttpResponse> BeastHttpClient::send(const HttpRequest& request) {
    Request req{request.method, endpoint_.base_path + request.target, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (!request.body.empty()) {
        req.body() = request.body;
    }
    req.prepare_payload();

    logger_->debug("{} {}://{}{}", std::string(http::to_string(request.method)), endpoint_.scheme, endpoint_.host,
                   std::string(req.target()));

    return endpoint_.secure() ? sendSecure(req) : sendPlain(req);
}

template <typename Stream>
outcome::result<HttpResponse> BeastHttpClient::exchange(Stream& stream, Request& req) {
    beast::error_code ec;
    http::write(stream, req, ec);
    if (ec) {
        reportError(ec, "write");
        return HttpTransportError::WRITE_FAILED;
    }

    // This buffer is used for reading and must be persisted
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec) {
        reportError(ec, "read");
        return HttpTransportError::READ_FAILED;
    }

    HttpResponse response;
    response.status = res.result_int();
    response.body = std::move(res.body());
    logger_->debug("Response status {} ({} bytes)", response.status, response.body.size());
    return response;
}

outcome::result<HttpResponse> BeastHttpClient::sendPlain(Request& req) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    beast::error_code ec;
    auto const results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        reportError(ec, "resolve");
        return HttpTransportError::RESOLVE_FAILED;
    }
    stream.connect(results, ec);
    if (ec) {
        reportError(ec, "connect");
        return HttpTransportError::CONNECT_FAILED;
    }

    auto response = exchange(stream, req);

    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
        logger_->debug("Socket shutdown: {}", ec.message());
    }
    return response;
}

outcome::result<HttpResponse> BeastHttpClient::sendSecure(Request& req) {
    net::io_context ioc;

    // The SSL context is required, and holds certificates
    ssl::context ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // Set SNI Hostname (many hosts need this to handshake successfully)
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        reportError(ec, "SNI");
        return HttpTransportError::TLS_HANDSHAKE_FAILED;
    }

    beast::error_code ec;
    auto const results = resolver.resolve(endpoint_.host, endpoint_.port, ec);
    if (ec) {
        reportError(ec, "resolve");
        return HttpTransportError::RESOLVE_FAILED;
    }
    beast::get_lowest_layer(stream).connect(results, ec);
    if (ec) {
        reportError(ec, "connect");
        return HttpTransportError::CONNECT_FAILED;
    }
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        reportError(ec, "SSL handshake");
        return HttpTransportError::TLS_HANDSHAKE_FAILED;
    }

    auto response = exchange(stream, req);

    // Gracefully close the stream
    stream.shutdown(ec);
    if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
        // Rationale:
        // http://stackoverflow.com/questions/25587403/boost-asio-ssl-async-shutdown-always-finishes-with-an-error
        ec = {};
    }
    if (ec) {
        logger_->debug("TLS shutdown: {}", ec.message());
    }
    return response;
}

void BeastHttpClient::reportError(const boost::system::error_code& ec, const std::string& context) {
    logger_->error("{} {}:{} failed: {}", context, endpoint_.host, endpoint_.port, ec.message());
}

}  // namespace masumi::api

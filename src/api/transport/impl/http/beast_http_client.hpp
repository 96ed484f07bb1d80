#ifndef MASUMI_BEAST_HTTP_CLIENT_HPP
#define MASUMI_BEAST_HTTP_CLIENT_HPP

#include <memory>
#include <string>

#include <boost/beast/http.hpp>

#include "api/transport/http_client.hpp"
#include "api/transport/url.hpp"
#include "base/logger.hpp"

namespace masumi::api {

/**
 * HTTP/1.1 client over Boost.Beast. Opens one connection per request, with
 * TLS (SNI and peer verification against the default trust store) for https.
 */
class BeastHttpClient : public HttpClient {
public:
    static outcome::result<std::shared_ptr<BeastHttpClient>> New(const std::string& base_url);

    outcome::result<HttpResponse> send(const HttpRequest& request) override;

    const Endpoint& endpoint() const {
        return endpoint_;
    }

private:
    explicit BeastHttpClient(Endpoint endpoint);

    using Request = boost::beast::http::request<boost::beast::http::string_body>;

    // Write the request and read the response on a connected stream
    template <typename Stream>
    outcome::result<HttpResponse> exchange(Stream& stream, Request& req);

    outcome::result<HttpResponse> sendPlain(Request& req);
    outcome::result<HttpResponse> sendSecure(Request& req);

    void reportError(const boost::system::error_code& ec, const std::string& context);

    Endpoint endpoint_;
    base::Logger logger_ = base::createLogger("HttpClient");
};

}  // namespace masumi::api

#endif // MASUMI_BEAST_HTTP_CLIENT_HPP

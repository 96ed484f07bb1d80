#ifndef MASUMI_SRC_API_TRANSPORT_HTTP_CLIENT_HPP
#define MASUMI_SRC_API_TRANSPORT_HTTP_CLIENT_HPP

#include <string>
#include <utility>
#include <vector>

#include <boost/beast/http/verb.hpp>

#include "outcome/outcome.hpp"

namespace masumi::api {

  /**
   * One request against a service endpoint. The target is relative to the
   * endpoint base path, e.g. "/payment/".
   */
  struct HttpRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    std::string target;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
  };

  struct HttpResponse {
    unsigned status = 0;
    std::string body;
  };

  /**
   * Blocking request/response exchange with a single service endpoint.
   * Any HTTP status is a successful exchange; only transport failures are
   * errors (see HttpTransportError).
   */
  class HttpClient {
   public:
    virtual ~HttpClient() = default;

    virtual outcome::result<HttpResponse> send(const HttpRequest &request) = 0;
  };

}  // namespace masumi::api

#endif  // MASUMI_SRC_API_TRANSPORT_HTTP_CLIENT_HPP

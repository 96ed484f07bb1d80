#ifndef MASUMI_TEST_MOCK_API_TRANSPORT_HTTP_CLIENT_MOCK_HPP
#define MASUMI_TEST_MOCK_API_TRANSPORT_HTTP_CLIENT_MOCK_HPP

#include <gmock/gmock.h>

#include "api/transport/http_client.hpp"

namespace masumi::api {

  class HttpClientMock : public HttpClient {
   public:
    ~HttpClientMock() override = default;

    MOCK_METHOD1(send, outcome::result<HttpResponse>(const HttpRequest &));
  };

  /// matches a request by verb and target
  MATCHER_P2(IsRequest, method, target, "") {
    return arg.method == method && arg.target == target;
  }

}  // namespace masumi::api

#endif  // MASUMI_TEST_MOCK_API_TRANSPORT_HTTP_CLIENT_MOCK_HPP

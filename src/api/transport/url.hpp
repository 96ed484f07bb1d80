#ifndef MASUMI_SRC_API_TRANSPORT_URL_HPP
#define MASUMI_SRC_API_TRANSPORT_URL_HPP

#include <string>

#include "api/transport/error.hpp"

namespace masumi::api {

  struct Endpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string base_path;  ///< without trailing slash, may be empty

    bool secure() const {
      return scheme == "https";
    }
  };

  /**
   * Split a service url such as https://payment.masumi.network/api/v1
   * @return endpoint, port defaults to 443/80 by scheme
   */
  outcome::result<Endpoint> parseUrl(const std::string &url);

}  // namespace masumi::api

#endif  // MASUMI_SRC_API_TRANSPORT_URL_HPP

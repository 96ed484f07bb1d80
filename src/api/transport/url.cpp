#include "api/transport/url.hpp"

#include <regex>

namespace masumi::api {

  outcome::result<Endpoint> parseUrl(const std::string &url) {
    static const std::regex url_regex(
        R"(^(http|https)://([^/:?#]+)(?::(\d+))?(/[^?#]*)?$)");
    std::smatch matches;

    if (!std::regex_match(url, matches, url_regex)) {
      return HttpTransportError::INVALID_URL;
    }

    Endpoint endpoint;
    endpoint.scheme = matches[1];
    endpoint.host = matches[2];
    if (matches[3].matched) {
      endpoint.port = matches[3];
    } else {
      endpoint.port = endpoint.secure() ? "443" : "80";
    }
    if (matches[4].matched) {
      endpoint.base_path = matches[4];
      while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
        endpoint.base_path.pop_back();
      }
    }
    return endpoint;
  }

}  // namespace masumi::api

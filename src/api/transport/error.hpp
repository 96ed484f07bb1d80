#ifndef MASUMI_SRC_API_TRANSPORT_ERROR_HPP
#define MASUMI_SRC_API_TRANSPORT_ERROR_HPP

#include "outcome/outcome.hpp"

namespace masumi::api {
  enum class HttpTransportError {
    INVALID_URL = 1,       // url is not http(s)://host[:port][/path]
    RESOLVE_FAILED,        // host name lookup failed
    CONNECT_FAILED,        // no resolved endpoint accepted the connection
    TLS_HANDSHAKE_FAILED,  // SNI setup or TLS handshake failed
    WRITE_FAILED,          // request could not be sent
    READ_FAILED,           // response could not be read or parsed
  };
}

MASUMI_OUTCOME_DECLARE_ERROR(masumi::api, HttpTransportError)

#endif  // MASUMI_SRC_API_TRANSPORT_ERROR_HPP

#include "api/transport/error.hpp"

MASUMI_OUTCOME_DEFINE_CATEGORY(masumi::api, HttpTransportError, e) {
  using masumi::api::HttpTransportError;
  switch (e) {
    case HttpTransportError::INVALID_URL:
      return "invalid service url, expected http(s)://host[:port][/path]";
    case HttpTransportError::RESOLVE_FAILED:
      return "cannot resolve service host";
    case HttpTransportError::CONNECT_FAILED:
      return "cannot connect to service host";
    case HttpTransportError::TLS_HANDSHAKE_FAILED:
      return "TLS handshake with service host failed";
    case HttpTransportError::WRITE_FAILED:
      return "cannot send request";
    case HttpTransportError::READ_FAILED:
      return "cannot read response";
  }
  return "unknown transport error";
}

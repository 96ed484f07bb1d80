#include "base/hexutil.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <boost/algorithm/hex.hpp>

MASUMI_OUTCOME_DEFINE_CATEGORY(masumi::base, UnhexError, e) {
  using masumi::base::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
    case UnhexError::UNKNOWN:
      return "Unknown error";
  }
  return "Unknown error";
}

namespace masumi::base {

  std::string hex_lower(const uint8_t *bytes, size_t len) noexcept {
    std::string res(len * 2, '\x00');
    boost::algorithm::hex_lower(bytes, bytes + len, res.begin());
    return res;
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> blob;
    blob.reserve((hex.size() + 1) / 2);

    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;

    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &e) {
      return UnhexError::UNKNOWN;
    }
  }

  bool isHex(std::string_view hex) noexcept {
    return !hex.empty()
        && std::all_of(hex.begin(), hex.end(), [](char c) {
             return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
  }
}  // namespace masumi::base

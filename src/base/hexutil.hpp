#ifndef MASUMI_HEXUTIL_HPP
#define MASUMI_HEXUTIL_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace masumi::base {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    UNKNOWN
  };

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes pointer to the first byte
   * @param len length of bytes
   * @return hexstring
   */
  std::string hex_lower(const uint8_t *bytes, size_t len) noexcept;

  template <typename Container>
  std::string hex_lower(const Container &bytes) noexcept {
    return hex_lower(bytes.data(), bytes.size());
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   *
   * @see
   * https://www.boost.org/doc/libs/1_74_0/libs/algorithm/doc/html/the_boost_algorithm_library/Misc/hex.html
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Checks that every character is a hex digit, of either case
   * @param hex candidate string, odd lengths allowed
   * @return false for an empty string
   */
  bool isHex(std::string_view hex) noexcept;
}  // namespace masumi::base

MASUMI_OUTCOME_DECLARE_ERROR(masumi::base, UnhexError)

#endif  // MASUMI_HEXUTIL_HPP

#ifndef MASUMI_SHA256_HPP
#define MASUMI_SHA256_HPP

#include <array>
#include <cstdint>
#include <string_view>

namespace masumi::crypto {
  using Hash256 = std::array<uint8_t, 32>;

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param data first byte to be hashed
   * @param size number of bytes
   * @return hashed bytes
   */
  Hash256 sha256(const uint8_t *data, size_t size);
}  // namespace masumi::crypto

#endif  // MASUMI_SHA256_HPP

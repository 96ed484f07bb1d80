

#include "base/hexutil.hpp"

#include <gtest/gtest.h>
#include "testutil/literals.hpp"

using namespace masumi::base;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_HexLower) {
  std::vector<uint8_t> bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  auto hexed = hex_lower(bin);
  ASSERT_EQ(hexed, "00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then no exception, result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  auto s = "00010204081020FF"s;

  std::vector<uint8_t> actual;
  ASSERT_NO_THROW(actual = unhex(s).value())
      << "unhex result does not contain expected std::vector<uint8_t>";

  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};

  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains NOT_ENOUGH_INPUT
 */
TEST(Common, Hexutil_UnhexOdd) {
  auto res = unhex("0");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains NON_HEX_INPUT
 */
TEST(Common, Hexutil_UnhexInvalid) {
  auto res = unhex("keks");
  ASSERT_FALSE(res);
  ASSERT_EQ(res.error(), UnhexError::NON_HEX_INPUT);
  ASSERT_EQ(res.error().category().name(), "masumi::base::UnhexError"s);
}

/**
 * @given Strings of hex and non-hex characters
 * @when isHex
 * @then only non-empty strings of hex digits pass, odd lengths included
 */
TEST(Common, Hexutil_IsHex) {
  EXPECT_TRUE(isHex("abcdef0123456789ABCDEF"));
  EXPECT_TRUE(isHex("abc"));
  EXPECT_FALSE(isHex(""));
  EXPECT_FALSE(isHex("0x12"));
  EXPECT_FALSE(isHex("12 34"));
}

/**
 * @given Bytes produced by the unhex literal
 * @when hex them again
 * @then the lowercase form of the input comes back
 */
TEST(Common, Hexutil_LiteralLowercases) {
  ASSERT_EQ(hex_lower("DEADbeef"_unhex), "deadbeef"s);
}

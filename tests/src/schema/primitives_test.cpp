#include <gtest/gtest.h>
#include <tessera/schema/primitives.hpp>

#include <cstdint>
#include <limits>
#include <string_view>

TEST(primitives, make_hash32_decodes_hex_identity) {
  auto hash = tessera::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_zero_hash_is_the_none_identity) {
  auto zero = tessera::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
  EXPECT_EQ(zero, tessera::schema::kNoneIdentity);
  EXPECT_TRUE(tessera::schema::is_none(zero));
}

TEST(primitives, identity_with_any_set_byte_is_not_none) {
  auto identity = tessera::schema::identity_t{};
  identity[31] = 1;
  EXPECT_FALSE(tessera::schema::is_none(identity));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = tessera::schema::bytes_t{0x00, 0x7F, 0x80, 0xFF};
  auto hex = tessera::schema::to_hex(
      tessera::schema::bytes_view_t{payload.data(), payload.size()});
  EXPECT_EQ(hex, "007f80ff");
  EXPECT_EQ(tessera::schema::try_from_hex(hex), payload);
  EXPECT_EQ(tessera::schema::try_from_hex("0x007F80FF"), payload);
  EXPECT_FALSE(tessera::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(tessera::schema::try_from_hex("zz").has_value());
}

TEST(primitives, base64_pads_partial_groups) {
  EXPECT_EQ(tessera::schema::to_base64(tessera::schema::bytes_t{}), "");
  EXPECT_EQ(tessera::schema::to_base64(tessera::schema::bytes_t{0x4D}),
            "TQ==");
  EXPECT_EQ(tessera::schema::to_base64(tessera::schema::bytes_t{0x4D, 0x61}),
            "TWE=");
  EXPECT_EQ(tessera::schema::to_base64(
                tessera::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF}),
            "AQID/v8=");
}

TEST(primitives, to_decimal_has_no_padding_or_sign) {
  EXPECT_EQ(tessera::schema::to_decimal(0), "0");
  EXPECT_EQ(tessera::schema::to_decimal(7), "7");
  EXPECT_EQ(tessera::schema::to_decimal(10), "10");
  EXPECT_EQ(tessera::schema::to_decimal(1234567890), "1234567890");
  EXPECT_EQ(
      tessera::schema::to_decimal(std::numeric_limits<uint64_t>::max()),
      "18446744073709551615");
}

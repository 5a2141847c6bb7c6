#include <gtest/gtest.h>
#include <cosign/schema/primitives.hpp>
#include <cosign/schema/session_status.hpp>
#include <cosign/schema/audit_action.hpp>

TEST(primitives, make_hash32_from_bytes_copies_input) {
  auto input = cosign::schema::bytes_t(32, 0xAB);
  auto hash = cosign::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_decodes_prefixed_hex) {
  auto hash = cosign::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(cosign::schema::to_hex(*hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(cosign::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(cosign::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_FALSE(cosign::schema::try_from_hex("abc").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = cosign::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, base64_matches_known_vectors) {
  EXPECT_EQ(cosign::schema::to_base64(cosign::schema::make_bytes(
                std::string_view{"foobar"})),
            "Zm9vYmFy");
  EXPECT_EQ(cosign::schema::to_base64(cosign::schema::make_bytes(
                std::string_view{"fooba"})),
            "Zm9vYmE=");
  EXPECT_EQ(cosign::schema::to_base64(cosign::schema::make_bytes(
                std::string_view{"foob"})),
            "Zm9vYg==");
  auto decoded = cosign::schema::try_from_base64("Zm9vYg==");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(cosign::schema::make_string(*decoded), "foob");
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  EXPECT_FALSE(cosign::schema::try_from_base64("not base64***").has_value());
  EXPECT_FALSE(cosign::schema::try_from_base64("Zm=v").has_value());
  EXPECT_FALSE(cosign::schema::try_from_base64("Zm9").has_value());
}

TEST(primitives, enum_strings_map_both_ways) {
  EXPECT_EQ(cosign::schema::to_string(
                cosign::schema::session_status_t::declined),
            "declined");
  EXPECT_EQ(cosign::schema::try_from_string<cosign::schema::session_status_t>(
                "completed"),
            cosign::schema::session_status_t::completed);
  EXPECT_FALSE(
      cosign::schema::try_from_string<cosign::schema::session_status_t>(
          "archived")
          .has_value());
  EXPECT_EQ(cosign::schema::to_string(
                cosign::schema::audit_action_t::timestamp_attached),
            "timestamp_attached");
}

#include <gtest/gtest.h>
#include <auditchain/schema/action_category.hpp>
#include <auditchain/schema/audit_action.hpp>
#include <auditchain/schema/export_format.hpp>
#include <auditchain/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = auditchain::schema::bytes_t(32, 0xAB);
  auto hash = auditchain::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = auditchain::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(auditchain::schema::to_hex(hash),
            "0102030405060708090a0b0c0d0e0f10"
            "1112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, try_make_hash32_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(auditchain::schema::try_make_hash32("abcd").has_value());
  EXPECT_FALSE(auditchain::schema::try_make_hash32(
                   std::string(63, 'a'))
                   .has_value());
  EXPECT_FALSE(auditchain::schema::try_make_hash32(std::string(64, 'g'))
                   .has_value());
  EXPECT_TRUE(auditchain::schema::try_make_hash32(std::string(64, 'F'))
                  .has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = auditchain::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, try_from_hex_rejects_odd_length) {
  EXPECT_FALSE(auditchain::schema::try_from_hex("abc").has_value());
  auto decoded = auditchain::schema::try_from_hex("00ff");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (auditchain::schema::bytes_t{0x00, 0xFF}));
}

TEST(primitives, action_names_match_wire_strings) {
  using auditchain::schema::audit_action_t;
  EXPECT_EQ(auditchain::schema::to_string(audit_action_t::remove), "delete");
  EXPECT_EQ(auditchain::schema::to_string(audit_action_t::exported), "export");
  EXPECT_EQ(auditchain::schema::try_parse_audit_action("logout"),
            audit_action_t::logout);
  EXPECT_FALSE(auditchain::schema::try_parse_audit_action("remove"));
  EXPECT_TRUE(auditchain::schema::is_session_action(audit_action_t::login));
  EXPECT_FALSE(auditchain::schema::is_session_action(audit_action_t::view));
}

TEST(primitives, category_and_format_names_parse) {
  EXPECT_EQ(auditchain::schema::try_parse_action_category("admin"),
            auditchain::schema::action_category_t::admin);
  EXPECT_FALSE(auditchain::schema::try_parse_action_category("billing"));
  EXPECT_EQ(auditchain::schema::try_parse_export_format("csv"),
            auditchain::schema::export_format_t::csv);
  EXPECT_FALSE(auditchain::schema::try_parse_export_format("xml"));
}

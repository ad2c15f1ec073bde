#include <gtest/gtest.h>
#include <auditchain/schema/encoding/scale/encoder.hpp>
#include <auditchain/testing/common.hpp>

#include <limits>

namespace {

using namespace auditchain::schema;
using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

}  // namespace

TEST(scale_encoding, audit_log_entry_round_trips) {
  auto entry = audit_log_entry_t{};
  entry.sequence = 42;
  entry.timestamp = auditchain::testing::kBaseTimestamp;
  entry.actor = auditchain::testing::make_actor("u1");
  entry.action = audit_action_t::remove;
  entry.action_category = action_category_t::admin;
  entry.entity_type = "policy";
  entry.entity_id = "POL-9";
  entry.old_values["title"] = make_text("Retention");
  entry.old_values["pages"] = make_integer(-3);
  entry.old_values["ratio"] = field_value_t{0.25};
  entry.old_values["archived"] = make_flag(false);
  entry.old_values["owner"] = make_null();
  entry.old_values["tags"] = field_value_t{list_value_t{
      scalar_value_t{std::string{"a"}}, scalar_value_t{std::string{"b"}}}};
  entry.metadata["reason"] = make_text("superseded");
  entry.session_id = "s-1";
  entry.is_sensitive = true;
  entry.prev_hash[0] = 0x01;
  entry.entry_hash[31] = 0x02;

  auto encoder = encoder_t{};
  auto decoded = encoder.decode<audit_log_entry_t>(
      make_bytes_view(encoder.encode(entry)));

  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.sequence, entry.sequence);
  EXPECT_EQ(decoded.timestamp, entry.timestamp);
  EXPECT_EQ(decoded.actor, entry.actor);
  EXPECT_EQ(decoded.action, entry.action);
  EXPECT_EQ(decoded.action_category, entry.action_category);
  EXPECT_EQ(decoded.entity_type, entry.entity_type);
  EXPECT_EQ(decoded.entity_id, entry.entity_id);
  EXPECT_FALSE(decoded.entity_name.has_value());
  EXPECT_EQ(decoded.old_values, entry.old_values);
  EXPECT_TRUE(decoded.new_values.empty());
  EXPECT_EQ(decoded.metadata, entry.metadata);
  EXPECT_EQ(decoded.session_id, entry.session_id);
  EXPECT_TRUE(decoded.is_sensitive);
  EXPECT_EQ(decoded.prev_hash, entry.prev_hash);
  EXPECT_EQ(decoded.entry_hash, entry.entry_hash);
}

TEST(scale_encoding, doubles_keep_their_exact_bits) {
  auto values = field_map_t{};
  values["tiny"] = field_value_t{std::numeric_limits<double>::denorm_min()};
  values["big"] = field_value_t{1.0e300};
  auto encoder = encoder_t{};
  auto decoded =
      encoder.decode<field_map_t>(make_bytes_view(encoder.encode(values)));
  EXPECT_EQ(decoded, values);
}

TEST(scale_encoding, unknown_value_tag_fails_to_decode) {
  auto bytes = bytes_t{0x09};
  auto encoder = encoder_t{};
  EXPECT_FALSE(
      encoder.try_decode<field_value_t>(make_bytes_view(bytes)).has_value());
}

TEST(scale_encoding, verification_and_tail_round_trip) {
  auto encoder = encoder_t{};

  auto result = audit_verification_t{};
  result.id = 3;
  result.is_valid = false;
  result.entries_verified = 10;
  result.first_invalid_sequence = 11;
  result.verified_at = auditchain::testing::kBaseTimestamp;
  result.start_sequence = 1;
  result.end_sequence = 20;
  result.reason = "entry_hash mismatch";
  auto decoded = encoder.decode<audit_verification_t>(
      make_bytes_view(encoder.encode(result)));
  EXPECT_EQ(decoded.id, 3u);
  EXPECT_FALSE(decoded.is_valid);
  EXPECT_EQ(decoded.first_invalid_sequence, uint64_t{11});
  EXPECT_EQ(decoded.end_sequence, 20u);
  EXPECT_EQ(decoded.reason, result.reason);
  EXPECT_FALSE(decoded.cancelled);

  auto tail = ledger_tail_t{.sequence = 5,
                            .entry_hash = make_zero_hash(),
                            .timestamp = auditchain::testing::kBaseTimestamp};
  tail.entry_hash[3] = 0x33;
  EXPECT_EQ(encoder.decode<ledger_tail_t>(make_bytes_view(encoder.encode(tail))),
            tail);
}

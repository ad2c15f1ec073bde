#include <gtest/gtest.h>
#include <auditchain/chain/hash_chain.hpp>
#include <auditchain/common/errors.hpp>
#include <auditchain/service/audit_trail.hpp>
#include <auditchain/testing/ledger_fixture.hpp>

#include <optional>

namespace {

using namespace auditchain::schema;
using auditchain::testing::make_create;
using auditchain::testing::make_update;

auditchain::service::audit_trail_options trail_options(
    auditchain::testing::manual_clock& clock,
    const bool freeze_on_violation = true) {
  auto options = auditchain::service::audit_trail_options{};
  options.freeze_on_violation = freeze_on_violation;
  options.clock = clock.fn();
  return options;
}

}  // namespace

TEST(audit_trail, incident_chain_detects_direct_edit) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  auto trail = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock)};

  auto created = trail.append(make_create("u1", "incident", "INC-1"));
  EXPECT_EQ(created.sequence, 1u);
  EXPECT_EQ(created.prev_hash, auditchain::chain::genesis_hash());

  clock.advance(1000);
  auto update = make_update("u1", "incident", "INC-1", "open", "closed");
  update.changed_fields = {"status"};
  auto updated = trail.append(update);
  EXPECT_EQ(updated.sequence, 2u);
  EXPECT_EQ(updated.prev_hash, created.entry_hash);

  auto clean = trail.verify();
  EXPECT_TRUE(clean.is_valid);
  EXPECT_EQ(clean.entries_verified, 2u);
  EXPECT_FALSE(trail.frozen());

  auto tampered = created;
  tampered.action_category = action_category_t::admin;
  fixture.overwrite_entry(tampered);

  auto broken = trail.verify();
  EXPECT_FALSE(broken.is_valid);
  EXPECT_EQ(broken.entries_verified, 0u);
  EXPECT_EQ(broken.first_invalid_sequence, std::optional<uint64_t>{1});
  EXPECT_TRUE(trail.frozen());
  EXPECT_THROW(trail.append(make_create("u2", "risk", "R-1")),
               auditchain::common::integrity_violation);
  EXPECT_EQ(trail.tail()->sequence, 2u);

  auto history = trail.verifications();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_FALSE(history[0].is_valid);
  EXPECT_TRUE(history[1].is_valid);
}

TEST(audit_trail, clean_full_verify_lifts_freeze) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  auto trail = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock)};

  auto first = trail.append(make_create("u1", "incident", "INC-1"));
  trail.append(make_create("u1", "incident", "INC-2"));

  auto tampered = first;
  tampered.entity_name = "renamed";
  fixture.overwrite_entry(tampered);
  EXPECT_FALSE(trail.verify().is_valid);
  EXPECT_TRUE(trail.frozen());

  fixture.overwrite_entry(first);
  auto ranged = trail.verify_range(1, 1, auditchain::chain::genesis_hash());
  EXPECT_TRUE(ranged.is_valid);
  EXPECT_TRUE(trail.frozen());

  EXPECT_TRUE(trail.verify().is_valid);
  EXPECT_FALSE(trail.frozen());
  EXPECT_EQ(trail.append(make_create("u2", "risk", "R-1")).sequence, 3u);
}

TEST(audit_trail, violation_without_freeze_keeps_appending) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  auto trail = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock, false)};

  auto first = trail.append(make_create("u1", "incident", "INC-1"));
  first.actor.id = "someone-else";
  fixture.overwrite_entry(first);

  EXPECT_FALSE(trail.verify().is_valid);
  EXPECT_FALSE(trail.frozen());
  EXPECT_EQ(trail.append(make_create("u2", "risk", "R-1")).sequence, 2u);
}

TEST(audit_trail, starts_frozen_after_recorded_violation) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  {
    auto trail = auditchain::service::audit_trail{
        fixture.encoder(), fixture.storage(), trail_options(clock)};
    auto first = trail.append(make_create("u1", "incident", "INC-1"));
    first.is_sensitive = !first.is_sensitive;
    first.new_values["status"] = make_text("closed");
    fixture.overwrite_entry(first);
    EXPECT_FALSE(trail.verify().is_valid);
  }

  auto reopened = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock)};
  EXPECT_TRUE(reopened.frozen());
  EXPECT_THROW(reopened.append(make_create("u2", "risk", "R-1")),
               auditchain::common::integrity_violation);

  auto relaxed = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock, false)};
  EXPECT_FALSE(relaxed.frozen());
}

TEST(audit_trail, wrong_anchor_does_not_freeze) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  {
    auto trail = auditchain::service::audit_trail{
        fixture.encoder(), fixture.storage(), trail_options(clock)};
    auto first = trail.append(make_create("u1", "incident", "INC-1"));
    trail.append(make_create("u1", "incident", "INC-2"));
    trail.append(make_create("u1", "incident", "INC-3"));

    auto wrong = trail.verify_range(3, 3, first.entry_hash);
    EXPECT_FALSE(wrong.is_valid);
    EXPECT_TRUE(wrong.anchor_mismatch);
    EXPECT_FALSE(trail.frozen());
    EXPECT_EQ(trail.append(make_create("u2", "risk", "R-1")).sequence, 4u);
    EXPECT_TRUE(trail.verifications().empty());
  }

  auto reopened = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock)};
  EXPECT_FALSE(reopened.frozen());
  EXPECT_EQ(reopened.append(make_create("u2", "risk", "R-2")).sequence, 5u);
}

TEST(audit_trail, display_policy_overrides_captured_flag) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  auto trail = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock)};

  auto candidate = make_create("u1", "incident", "INC-1");
  candidate.is_sensitive = true;
  auto entry = trail.append(candidate);
  EXPECT_TRUE(trail.is_sensitive(entry));

  EXPECT_FALSE(trail.set_display_policy(99, false));
  EXPECT_TRUE(trail.set_display_policy(entry.sequence, false));
  EXPECT_FALSE(trail.is_sensitive(*trail.get(entry.sequence)));
  EXPECT_TRUE(trail.get(entry.sequence)->is_sensitive);

  // Overrides live outside the chain.
  EXPECT_TRUE(trail.verify().is_valid);
  EXPECT_EQ(trail.tail()->sequence, 1u);
}

TEST(audit_trail, export_is_visible_through_queries) {
  auto fixture = auditchain::testing::ledger_fixture{"auditchain_trail"};
  auto clock = auditchain::testing::manual_clock{};
  auto trail = auditchain::service::audit_trail{
      fixture.encoder(), fixture.storage(), trail_options(clock)};

  trail.append(make_create("u1", "incident", "INC-1"));
  auto record = trail.export_entries(audit_filter_t{}, "audit",
                                     export_format_t::json,
                                     auditchain::testing::make_actor("a1"));
  ASSERT_TRUE(record.export_sequence.has_value());

  auto filter = audit_filter_t{};
  filter.action = audit_action_t::exported;
  auto page = trail.list(filter);
  ASSERT_EQ(page.entries.size(), 1u);
  EXPECT_EQ(page.entries[0].sequence, *record.export_sequence);
  EXPECT_EQ(trail.user_activity("a1").size(), 1u);
  EXPECT_EQ(trail.stats().total_entries, 2u);
}

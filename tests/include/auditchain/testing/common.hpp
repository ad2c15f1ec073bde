#pragma once

#include <auditchain/schema/actor.hpp>
#include <auditchain/schema/audit_candidate.hpp>
#include <auditchain/schema/field_value.hpp>
#include <auditchain/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace auditchain::testing {

// 2024-01-15T10:00:00Z
inline constexpr auto kBaseTimestamp =
    auditchain::schema::timestamp_milliseconds_t{1'705'312'800'000};

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Settable clock shared between a test and the services under test.
class manual_clock final {
 public:
  explicit manual_clock(
      const auditchain::schema::timestamp_milliseconds_t start = kBaseTimestamp)
      : now_{start} {}

  auditchain::schema::timestamp_milliseconds_t now() const { return now_; }
  void set(const auditchain::schema::timestamp_milliseconds_t value) {
    now_ = value;
  }
  void advance(const auditchain::schema::duration_milliseconds_t by) {
    now_ += by;
  }

  std::function<auditchain::schema::timestamp_milliseconds_t()> fn() {
    return [this] { return now_.load(); };
  }

 private:
  std::atomic<auditchain::schema::timestamp_milliseconds_t> now_;
};

inline auditchain::schema::actor_t make_actor(const std::string_view id) {
  return auditchain::schema::actor_t{
      .id = std::string{id},
      .name = "User " + std::string{id},
      .email = std::string{id} + "@example.com",
      .role = std::string{"auditor"}};
}

inline auditchain::schema::audit_candidate_t make_create(
    const std::string_view actor_id,
    const std::string_view entity_type,
    const std::string_view entity_id) {
  auto candidate = auditchain::schema::audit_candidate_t{};
  candidate.actor = make_actor(actor_id);
  candidate.action = auditchain::schema::audit_action_t::create;
  candidate.entity_type = std::string{entity_type};
  candidate.entity_id = std::string{entity_id};
  candidate.new_values["status"] = auditchain::schema::make_text("open");
  return candidate;
}

inline auditchain::schema::audit_candidate_t make_update(
    const std::string_view actor_id,
    const std::string_view entity_type,
    const std::string_view entity_id,
    const std::string_view from,
    const std::string_view to) {
  auto candidate = auditchain::schema::audit_candidate_t{};
  candidate.actor = make_actor(actor_id);
  candidate.action = auditchain::schema::audit_action_t::update;
  candidate.entity_type = std::string{entity_type};
  candidate.entity_id = std::string{entity_id};
  candidate.old_values["status"] = auditchain::schema::make_text(from);
  candidate.new_values["status"] = auditchain::schema::make_text(to);
  return candidate;
}

inline auditchain::schema::audit_candidate_t make_login(
    const std::string_view actor_id) {
  auto candidate = auditchain::schema::audit_candidate_t{};
  candidate.actor = make_actor(actor_id);
  candidate.action = auditchain::schema::audit_action_t::login;
  candidate.action_category = auditchain::schema::action_category_t::auth;
  return candidate;
}

}  // namespace auditchain::testing

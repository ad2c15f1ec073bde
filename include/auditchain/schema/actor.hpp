#pragma once

#include <optional>
#include <string>
#include <string_view>

// Schema type: actor.
// Audit workflow: the principal behind an entry. Name, email and role are
// denormalised at write time so the ledger stays readable after the user
// record changes.
namespace auditchain::schema {

inline constexpr std::string_view kSystemActorId{"system"};

struct actor final {
  std::string id;
  std::optional<std::string> name;
  std::optional<std::string> email;
  std::optional<std::string> role;

  bool operator==(const actor&) const = default;
};

using actor_t = actor;

inline actor_t make_system_actor() {
  return actor_t{.id = std::string{kSystemActorId},
                 .name = std::string{"System"},
                 .email = std::nullopt,
                 .role = std::nullopt};
}

inline bool is_system_actor(const actor_t& value) {
  return value.id == kSystemActorId;
}

}  // namespace auditchain::schema

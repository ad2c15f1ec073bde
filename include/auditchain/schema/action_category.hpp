#pragma once

#include <auditchain/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: action category.
// Audit workflow: coarse grouping used by the viewer filters (data changes,
// authentication, administration, system housekeeping).
namespace auditchain::schema {

enum class action_category_t : uint8_t {
  data = 0,
  auth = 1,
  admin = 2,
  system = 3,
};

inline constexpr auto kActionCategoryNames =
    std::array<std::pair<std::string_view, action_category_t>, 4>{{
        {"data", action_category_t::data},
        {"auth", action_category_t::auth},
        {"admin", action_category_t::admin},
        {"system", action_category_t::system},
    }};

constexpr std::string_view to_string(const action_category_t category) {
  return to_string(category, kActionCategoryNames).value_or("unknown");
}

constexpr std::optional<action_category_t> try_parse_action_category(
    const std::string_view value) {
  return from_string(value, kActionCategoryNames);
}

}  // namespace auditchain::schema

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Schema type: field value.
// Audit workflow: JSON-safe scalar captured in old_values/new_values/metadata.
// Lists hold scalars of a single type; nested lists are not representable.
namespace auditchain::schema {

struct null_value_t final {
  bool operator==(const null_value_t&) const = default;
};

using scalar_value_t =
    std::variant<null_value_t, bool, int64_t, double, std::string>;
using list_value_t = std::vector<scalar_value_t>;

// Alternative order is the canonical type tag; do not reorder.
using field_value_t =
    std::variant<null_value_t, bool, int64_t, double, std::string, list_value_t>;

using field_map_t = std::map<std::string, field_value_t>;

inline field_value_t make_null() {
  return field_value_t{null_value_t{}};
}

inline field_value_t make_text(const std::string_view value) {
  return field_value_t{std::string{value}};
}

inline field_value_t make_integer(const int64_t value) {
  return field_value_t{value};
}

inline field_value_t make_flag(const bool value) {
  return field_value_t{value};
}

}  // namespace auditchain::schema

#pragma once

#include <auditchain/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace auditchain::schema {

enum class export_format_t : uint8_t {
  json = 0,
  csv = 1,
};

inline constexpr auto kExportFormatNames =
    std::array<std::pair<std::string_view, export_format_t>, 2>{{
        {"json", export_format_t::json},
        {"csv", export_format_t::csv},
    }};

constexpr std::string_view to_string(const export_format_t format) {
  return to_string(format, kExportFormatNames).value_or("unknown");
}

constexpr std::optional<export_format_t> try_parse_export_format(
    const std::string_view value) {
  return from_string(value, kExportFormatNames);
}

}  // namespace auditchain::schema

#include <auditchain/canonical/encoder.hpp>
#include <auditchain/common/errors.hpp>
#include <bit>
#include <cmath>
#include <string>

using namespace auditchain::schema;

namespace auditchain::canonical {

namespace {

// Integers travel to clients as JSON numbers; beyond 2^53 they would round.
constexpr auto kMaxExactInteger = int64_t{1} << 53;

void check_text(const std::string_view& value, const std::string_view what) {
  if (!is_valid_utf8(value)) {
    throw common::encoding_error{std::string{what} + " is not valid UTF-8"};
  }
}

void check_name(const std::string_view& value, const std::string_view what) {
  if (value.empty()) {
    throw common::encoding_error{std::string{what} + " must not be empty"};
  }
  check_text(value, what);
}

void check_scalar(const scalar_value_t& value) {
  std::visit(overloaded{[](const null_value_t&) {}, [](const bool&) {},
                        [](const int64_t& arg) {
                          if (arg > kMaxExactInteger ||
                              arg < -kMaxExactInteger) {
                            throw common::encoding_error{
                                "integer " + std::to_string(arg) +
                                " is outside +/-2^53"};
                          }
                        },
                        [](const double& arg) {
                          if (!std::isfinite(arg)) {
                            throw common::encoding_error{
                                "non-finite number has no canonical form"};
                          }
                        },
                        [](const std::string& arg) {
                          check_text(arg, "string value");
                        }},
             value);
}

template <typename Writer, typename Variant>
void write_scalar(Writer& out, const Variant& value) {
  std::visit(overloaded{[&](const null_value_t&) {},
                        [&](const bool& arg) {
                          out.template write<uint8_t>(arg ? 1 : 0);
                        },
                        [&](const int64_t& arg) {
                          out.template write<uint64_t>(
                              static_cast<uint64_t>(arg));
                        },
                        [&](const double& arg) {
                          // -0.0 and 0.0 compare equal and must hash equal.
                          auto normalised = arg == 0.0 ? 0.0 : arg;
                          out.template write<uint64_t>(
                              std::bit_cast<uint64_t>(normalised));
                        },
                        [&](const std::string& arg) {
                          out.template write<uint32_t>(
                              static_cast<uint32_t>(arg.size()));
                          out.write(std::string_view{arg});
                        },
                        [&](const list_value_t&) {}},
             value);
}

}  // namespace

bool is_valid_utf8(const std::string_view& value) {
  auto i = size_t{0};
  while (i < value.size()) {
    auto lead = static_cast<uint8_t>(value[i]);
    auto length = size_t{0};
    auto code_point = uint32_t{0};
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > value.size()) {
      return false;
    }
    for (auto j = size_t{1}; j < length; ++j) {
      auto next = static_cast<uint8_t>(value[i + j]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((length == 2 && code_point < 0x80) ||
        (length == 3 && code_point < 0x800) ||
        (length == 4 && code_point < 0x10000) || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

void validate(const field_value_t& value) {
  std::visit(overloaded{[](const list_value_t& items) {
                          if (items.empty()) {
                            return;
                          }
                          auto index = items.front().index();
                          for (const auto& item : items) {
                            if (item.index() != index) {
                              throw common::encoding_error{
                                  "list mixes element types"};
                            }
                            check_scalar(item);
                          }
                        },
                        [](const auto& scalar) {
                          check_scalar(scalar_value_t{scalar});
                        }},
             value);
}

void validate(const field_map_t& values) {
  for (const auto& [key, value] : values) {
    check_name(key, "map key");
    validate(value);
  }
}

void validate(const audit_candidate_t& candidate) {
  check_text(candidate.actor.id, "actor.id");
  for (const auto& optional : {candidate.actor.name, candidate.actor.email,
                               candidate.actor.role, candidate.entity_type,
                               candidate.entity_id, candidate.entity_name,
                               candidate.ip_address, candidate.user_agent,
                               candidate.request_id, candidate.session_id}) {
    if (optional) {
      check_text(*optional, "string field");
    }
  }
  for (const auto& name : candidate.changed_fields) {
    check_name(name, "changed field name");
  }
  validate(candidate.old_values);
  validate(candidate.new_values);
  validate(candidate.metadata);
}

writer& writer::tag(const field_tag tag) {
  builder_.write(static_cast<uint8_t>(tag));
  return *this;
}

writer& writer::u16(const uint16_t value) {
  builder_.write(value);
  return *this;
}

writer& writer::u64(const uint64_t value) {
  builder_.write(value);
  return *this;
}

writer& writer::text(const std::string_view& value) {
  check_text(value, "string field");
  builder_.write(static_cast<uint32_t>(value.size()));
  builder_.write(value);
  return *this;
}

writer& writer::optional_text(const std::optional<std::string>& value) {
  if (!value) {
    builder_.write(uint8_t{0});
    return *this;
  }
  builder_.write(uint8_t{1});
  return text(*value);
}

writer& writer::names(const std::vector<std::string>& values) {
  builder_.write(static_cast<uint32_t>(values.size()));
  for (const auto& name : values) {
    check_name(name, "changed field name");
    text(name);
  }
  return *this;
}

writer& writer::values(const field_map_t& values) {
  // std::map orders std::string keys byte-wise already.
  builder_.write(static_cast<uint32_t>(values.size()));
  for (const auto& [key, item] : values) {
    check_name(key, "map key");
    text(key);
    value(item);
  }
  return *this;
}

writer& writer::value(const field_value_t& value) {
  validate(value);
  builder_.write(static_cast<uint8_t>(value.index()));
  if (const auto* items = std::get_if<list_value_t>(&value)) {
    builder_.write(static_cast<uint32_t>(items->size()));
    for (const auto& item : *items) {
      builder_.write(static_cast<uint8_t>(item.index()));
      write_scalar(builder_, item);
    }
    return *this;
  }
  write_scalar(builder_, value);
  return *this;
}

writer& writer::raw(const bytes_view_t& bytes) {
  builder_.write(bytes);
  return *this;
}

bytes_t encode(const audit_log_entry_t& entry) {
  auto out = writer{};
  out.tag(field_tag::version).u16(entry.version);
  out.tag(field_tag::sequence).u64(entry.sequence);
  out.tag(field_tag::timestamp).u64(entry.timestamp);
  out.tag(field_tag::actor_id).text(entry.actor.id);
  out.tag(field_tag::actor_name).optional_text(entry.actor.name);
  out.tag(field_tag::actor_email).optional_text(entry.actor.email);
  out.tag(field_tag::actor_role).optional_text(entry.actor.role);
  out.tag(field_tag::action).text(to_string(entry.action));
  out.tag(field_tag::action_category).text(to_string(entry.action_category));
  out.tag(field_tag::entity_type).optional_text(entry.entity_type);
  out.tag(field_tag::entity_id).optional_text(entry.entity_id);
  out.tag(field_tag::entity_name).optional_text(entry.entity_name);
  out.tag(field_tag::changed_fields).names(entry.changed_fields);
  out.tag(field_tag::old_values).values(entry.old_values);
  out.tag(field_tag::new_values).values(entry.new_values);
  out.tag(field_tag::metadata).values(entry.metadata);
  out.tag(field_tag::ip_address).optional_text(entry.ip_address);
  out.tag(field_tag::user_agent).optional_text(entry.user_agent);
  out.tag(field_tag::request_id).optional_text(entry.request_id);
  out.tag(field_tag::session_id).optional_text(entry.session_id);
  out.tag(field_tag::prev_hash).raw(entry.prev_hash);
  return out.take();
}

}  // namespace auditchain::canonical

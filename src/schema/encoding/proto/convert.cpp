#include <auditchain/common/critical.hpp>
#include <auditchain/common/errors.hpp>
#include <auditchain/schema/encoding/proto/convert.hpp>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <cmath>

using google::protobuf::util::TimeUtil;

namespace auditchain::schema::encoding::proto {

namespace {

// Largest magnitude a double holds without losing integer precision.
constexpr auto kMaxExactInteger = 9007199254740992.0;

void set_scalar(const scalar_value_t& value, google::protobuf::Value* out) {
  std::visit(overloaded{[out](const null_value_t&) {
                          out->set_null_value(
                              google::protobuf::NULL_VALUE);
                        },
                        [out](const bool& arg) { out->set_bool_value(arg); },
                        [out](const int64_t& arg) {
                          out->set_number_value(static_cast<double>(arg));
                        },
                        [out](const double& arg) {
                          out->set_number_value(arg);
                        },
                        [out](const std::string& arg) {
                          out->set_string_value(arg);
                        }},
             value);
}

scalar_value_t to_scalar(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return null_value_t{};
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue: {
      auto number = value.number_value();
      if (std::isfinite(number) && std::trunc(number) == number &&
          std::fabs(number) <= kMaxExactInteger) {
        return static_cast<int64_t>(number);
      }
      return number;
    }
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kStructValue:
    case google::protobuf::Value::kListValue:
    default:
      throw common::encoding_error{
          "nested objects and lists of lists are not supported"};
  }
}

field_value_t to_field(const google::protobuf::Value& value) {
  if (value.kind_case() != google::protobuf::Value::kListValue) {
    return std::visit([](auto&& arg) { return field_value_t{arg}; },
                      to_scalar(value));
  }
  auto items = list_value_t{};
  for (const auto& item : value.list_value().values()) {
    items.push_back(to_scalar(item));
  }
  return items;
}

template <typename Enum>
Enum parse_or_throw(const std::string& value,
                    std::optional<Enum> (*parse)(std::string_view),
                    const std::string_view what) {
  auto parsed = parse(value);
  if (!parsed) {
    throw common::validation_error{"unknown " + std::string{what} + " '" +
                                   value + "'"};
  }
  return *parsed;
}

std::optional<std::string> optional_of(const bool has,
                                       const std::string& value) {
  if (!has) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

google::protobuf::Timestamp to_timestamp(const timestamp_milliseconds_t value) {
  return TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(value));
}

timestamp_milliseconds_t from_timestamp(
    const google::protobuf::Timestamp& value) {
  auto milliseconds = TimeUtil::TimestampToMilliseconds(value);
  return milliseconds < 0 ? 0
                          : static_cast<timestamp_milliseconds_t>(milliseconds);
}

google::protobuf::Struct to_struct(const field_map_t& values,
                                   const bool redact) {
  auto out = google::protobuf::Struct{};
  auto& fields = *out.mutable_fields();
  for (const auto& [key, value] : values) {
    auto& slot = fields[key];
    if (redact) {
      slot.set_string_value(std::string{kRedacted});
      continue;
    }
    if (const auto* items = std::get_if<list_value_t>(&value)) {
      auto* list = slot.mutable_list_value();
      for (const auto& item : *items) {
        set_scalar(item, list->add_values());
      }
      continue;
    }
    std::visit(overloaded{[](const list_value_t&) {},
                          [&slot](const auto& scalar) {
                            set_scalar(scalar_value_t{scalar}, &slot);
                          }},
               value);
  }
  return out;
}

field_map_t from_struct(const google::protobuf::Struct& values) {
  auto out = field_map_t{};
  for (const auto& [key, value] : values.fields()) {
    out.emplace(key, to_field(value));
  }
  return out;
}

void to_proto(const audit_log_entry_t& entry,
              const bool redact,
              auditchain::v1::AuditLogEntry* out) {
  out->set_id(entry.sequence);
  *out->mutable_timestamp() = to_timestamp(entry.timestamp);
  out->set_user_id(entry.actor.id);
  if (entry.actor.name) {
    out->set_user_name(*entry.actor.name);
  }
  if (entry.actor.email) {
    out->set_user_email(*entry.actor.email);
  }
  if (entry.actor.role) {
    out->set_user_role(*entry.actor.role);
  }
  out->set_action(std::string{to_string(entry.action)});
  out->set_action_category(std::string{to_string(entry.action_category)});
  if (entry.entity_type) {
    out->set_entity_type(*entry.entity_type);
  }
  if (entry.entity_id) {
    out->set_entity_id(*entry.entity_id);
  }
  if (entry.entity_name) {
    out->set_entity_name(*entry.entity_name);
  }
  for (const auto& name : entry.changed_fields) {
    out->add_changed_fields(name);
  }
  *out->mutable_old_values() = to_struct(entry.old_values, redact);
  *out->mutable_new_values() = to_struct(entry.new_values, redact);
  *out->mutable_metadata() = to_struct(entry.metadata, false);
  if (entry.ip_address) {
    out->set_ip_address(*entry.ip_address);
  }
  if (entry.user_agent) {
    out->set_user_agent(*entry.user_agent);
  }
  if (entry.request_id) {
    out->set_request_id(*entry.request_id);
  }
  if (entry.session_id) {
    out->set_session_id(*entry.session_id);
  }
  out->set_entry_hash(to_hex(entry.entry_hash));
  out->set_prev_hash(to_hex(entry.prev_hash));
  out->set_sequence(entry.sequence);
  out->set_is_sensitive(entry.is_sensitive);
}

void to_proto(const audit_verification_t& result,
              auditchain::v1::Verification* out) {
  out->set_id(result.id);
  out->set_is_valid(result.is_valid);
  out->set_entries_verified(result.entries_verified);
  if (result.first_invalid_sequence) {
    out->set_first_invalid_sequence(*result.first_invalid_sequence);
  }
  *out->mutable_verified_at() = to_timestamp(result.verified_at);
  out->set_start_sequence(result.start_sequence);
  out->set_end_sequence(result.end_sequence);
  out->set_cancelled(result.cancelled);
  out->set_anchor_mismatch(result.anchor_mismatch);
  out->set_reason(result.reason);
}

void to_proto(const audit_stats_t& stats, auditchain::v1::Stats* out) {
  out->set_total_entries(stats.total_entries);
  for (const auto& [action, count] : stats.by_action) {
    (*out->mutable_by_action())[action] = count;
  }
  out->set_unique_users(stats.unique_users);
  for (const auto& [entity_type, count] : stats.by_entity_type) {
    (*out->mutable_by_entity_type())[entity_type] = count;
  }
  for (const auto& user : stats.top_users) {
    auto* item = out->add_top_users();
    item->set_user_id(user.actor_id);
    if (user.email) {
      item->set_email(*user.email);
    }
    if (user.name) {
      item->set_name(*user.name);
    }
    item->set_count(user.count);
  }
  out->set_period_days(stats.period_days);
}

actor_t from_proto(const auditchain::v1::Actor& actor) {
  return actor_t{.id = actor.id(),
                 .name = optional_of(actor.has_name(), actor.name()),
                 .email = optional_of(actor.has_email(), actor.email()),
                 .role = optional_of(actor.has_role(), actor.role())};
}

audit_filter_t from_proto(const auditchain::v1::AuditFilter& filter) {
  auto out = audit_filter_t{};
  out.entity_type = optional_of(filter.has_entity_type(), filter.entity_type());
  out.entity_id = optional_of(filter.has_entity_id(), filter.entity_id());
  out.actor_id = optional_of(filter.has_user_id(), filter.user_id());
  if (filter.has_action()) {
    out.action = parse_or_throw<audit_action_t>(
        filter.action(), try_parse_audit_action, "action");
  }
  if (filter.has_action_category()) {
    out.action_category = parse_or_throw<action_category_t>(
        filter.action_category(), try_parse_action_category,
        "action_category");
  }
  if (filter.has_date_from()) {
    out.date_from = from_timestamp(filter.date_from());
  }
  if (filter.has_date_to()) {
    out.date_to = from_timestamp(filter.date_to());
  }
  return out;
}

audit_candidate_t from_proto(const auditchain::v1::AppendRequest& request) {
  auto out = audit_candidate_t{};
  out.actor = from_proto(request.actor());
  out.action = parse_or_throw<audit_action_t>(
      request.action(), try_parse_audit_action, "action");
  if (!request.action_category().empty()) {
    out.action_category = parse_or_throw<action_category_t>(
        request.action_category(), try_parse_action_category,
        "action_category");
  }
  out.entity_type =
      optional_of(request.has_entity_type(), request.entity_type());
  out.entity_id = optional_of(request.has_entity_id(), request.entity_id());
  out.entity_name =
      optional_of(request.has_entity_name(), request.entity_name());
  out.changed_fields.assign(std::begin(request.changed_fields()),
                            std::end(request.changed_fields()));
  out.old_values = from_struct(request.old_values());
  out.new_values = from_struct(request.new_values());
  out.metadata = from_struct(request.metadata());
  out.ip_address = optional_of(request.has_ip_address(), request.ip_address());
  out.user_agent = optional_of(request.has_user_agent(), request.user_agent());
  out.request_id = optional_of(request.has_request_id(), request.request_id());
  out.session_id = optional_of(request.has_session_id(), request.session_id());
  out.is_sensitive = request.is_sensitive();
  return out;
}

std::string to_json(const google::protobuf::Message& message) {
  auto options = google::protobuf::util::JsonPrintOptions{};
  options.preserve_proto_field_names = true;
  options.always_print_primitive_fields = true;
  auto json = std::string{};
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    auditchain::common::critical("failed to print JSON: " +
                                 status.ToString());
  }
  return json;
}

std::string to_json(const std::vector<audit_log_entry_t>& entries) {
  auto list = auditchain::v1::EntryList{};
  for (const auto& entry : entries) {
    to_proto(entry, false, list.add_entries());
  }
  return to_json(list);
}

}  // namespace auditchain::schema::encoding::proto

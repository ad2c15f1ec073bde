#include <auditchain/common/errors.hpp>
#include <auditchain/crypto/sha256.hpp>
#include <auditchain/ledger/export_service.hpp>
#include <auditchain/ledger/query_service.hpp>
#include <auditchain/schema/encoding/proto/convert.hpp>
#include <google/protobuf/util/time_util.h>
#include <spdlog/spdlog.h>
#include <algorithm>

using namespace auditchain::schema;

namespace auditchain::ledger {

namespace {

std::string trim(const std::string_view value) {
  constexpr auto kWhitespace = std::string_view{" \t\r\n\f\v"};
  auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(kWhitespace);
  return std::string{value.substr(first, last - first + 1)};
}

std::string csv_field(const std::string_view value) {
  if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string{value};
  }
  auto quoted = std::string{"\""};
  for (auto c : value) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string values_json(const field_map_t& values) {
  return encoding::proto::to_json(encoding::proto::to_struct(values, false));
}

bool has_filter(const audit_filter_t& filter) {
  return filter.entity_type || filter.entity_id || filter.action ||
         filter.actor_id || filter.action_category || filter.date_from ||
         filter.date_to;
}

}  // namespace

std::string to_csv(const std::vector<audit_log_entry_t>& entries) {
  auto out = std::string{
      "sequence,timestamp,user_id,user_name,user_email,action,"
      "action_category,entity_type,entity_id,entity_name,changed_fields,"
      "old_values,new_values,ip_address,prev_hash,entry_hash\r\n"};
  for (const auto& entry : entries) {
    auto changed = std::string{};
    for (const auto& name : entry.changed_fields) {
      if (!changed.empty()) {
        changed.push_back(';');
      }
      changed.append(name);
    }
    auto row = std::vector<std::string>{
        std::to_string(entry.sequence),
        google::protobuf::util::TimeUtil::ToString(
            encoding::proto::to_timestamp(entry.timestamp)),
        entry.actor.id,
        entry.actor.name.value_or(""),
        entry.actor.email.value_or(""),
        std::string{to_string(entry.action)},
        std::string{to_string(entry.action_category)},
        entry.entity_type.value_or(""),
        entry.entity_id.value_or(""),
        entry.entity_name.value_or(""),
        changed,
        values_json(entry.old_values),
        values_json(entry.new_values),
        entry.ip_address.value_or(""),
        to_hex(entry.prev_hash),
        to_hex(entry.entry_hash)};
    for (auto i = size_t{0}; i < row.size(); ++i) {
      if (i != 0) {
        out.push_back(',');
      }
      out.append(csv_field(row[i]));
    }
    out.append("\r\n");
  }
  return out;
}

export_service::export_service(ledger_store& store,
                               append_service& appender,
                               clock_fn_t clock)
    : store_{store}, appender_{appender}, clock_{std::move(clock)} {
  if (!clock_) {
    clock_ = system_clock_milliseconds;
  }
}

export_record_t export_service::export_entries(const audit_filter_t& filter,
                                               const std::string& reason,
                                               const export_format_t format,
                                               const actor_t& actor) {
  auto trimmed = trim(reason);
  if (trimmed.empty()) {
    throw common::validation_error{"export reason is required"};
  }

  // Everything but the manifest is known up front, so a bad actor or filter
  // fails before the snapshot is read.
  auto candidate = audit_candidate_t{};
  candidate.actor = actor;
  candidate.action = audit_action_t::exported;
  candidate.action_category = action_category_t::data;
  candidate.entity_type = std::string{kExportEntityType};
  candidate.entity_id = to_hex(make_zero_hash());
  auto& metadata = candidate.metadata;
  metadata["reason"] = make_text(trimmed);
  metadata["format"] = make_text(to_string(format));
  metadata["export_type"] =
      make_text(has_filter(filter) ? "filtered" : "full");
  if (filter.entity_type) {
    metadata["filter_entity_type"] = make_text(*filter.entity_type);
  }
  if (filter.entity_id) {
    metadata["filter_entity_id"] = make_text(*filter.entity_id);
  }
  if (filter.action) {
    metadata["filter_action"] = make_text(to_string(*filter.action));
  }
  if (filter.actor_id) {
    metadata["filter_user_id"] = make_text(*filter.actor_id);
  }
  if (filter.action_category) {
    metadata["filter_action_category"] =
        make_text(to_string(*filter.action_category));
  }
  if (filter.date_from) {
    metadata["filter_date_from"] =
        make_integer(static_cast<int64_t>(*filter.date_from));
  }
  if (filter.date_to) {
    metadata["filter_date_to"] =
        make_integer(static_cast<int64_t>(*filter.date_to));
  }
  candidate = prepare_candidate(std::move(candidate));

  auto entries = collect(store_.view(), filter);

  auto record = export_record_t{};
  record.filter = filter;
  record.reason = trimmed;
  record.format = format;
  record.payload = format == export_format_t::csv
                       ? to_csv(entries)
                       : encoding::proto::to_json(entries);
  record.manifest_hash = to_hex(crypto::sha256::hash(record.payload));
  record.entries_exported = entries.size();
  record.export_type = has_filter(filter) ? "filtered" : "full";
  record.exported_at = clock_();

  candidate.entity_id = record.manifest_hash;
  metadata["entries_exported"] =
      make_integer(static_cast<int64_t>(record.entries_exported));
  metadata["manifest_hash"] = make_text(record.manifest_hash);

  try {
    auto logged = appender_.append(candidate);
    record.export_sequence = logged.sequence;
    spdlog::info("Exported {} entries as {} (manifest {}), logged at {}",
                 record.entries_exported, to_string(format),
                 record.manifest_hash, logged.sequence);
  } catch (const common::append_error& e) {
    record.warning = std::string{"export was not recorded on the ledger: "} +
                     e.what();
    spdlog::warn("Export {} could not be logged: {}", record.manifest_hash,
                 e.what());
  } catch (const common::integrity_violation& e) {
    record.warning = std::string{"export was not recorded on the ledger: "} +
                     e.what();
    spdlog::warn("Export {} could not be logged: {}", record.manifest_hash,
                 e.what());
  }
  return record;
}

}  // namespace auditchain::ledger

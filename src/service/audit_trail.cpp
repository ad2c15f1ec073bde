#include <auditchain/service/audit_trail.hpp>
#include <spdlog/spdlog.h>

using namespace auditchain::schema;

namespace auditchain::service {

audit_trail::audit_trail(auditchain::ledger::encoder_t& encoder,
                         auditchain::ledger::storage_t& storage,
                         audit_trail_options options)
    : options_{std::move(options)},
      store_{encoder, storage},
      display_{encoder, storage},
      verifier_{store_, options_.clock},
      query_{store_, options_.clock},
      appender_{store_,
                auditchain::ledger::append_options{
                    .timeout = options_.append_timeout,
                    .clock = options_.clock}},
      exporter_{store_, appender_, options_.clock} {
  auto latest = verifier_.latest();
  if (latest && !latest->is_valid && options_.freeze_on_violation) {
    appender_.freeze(latest->first_invalid_sequence.value_or(0),
                     "last recorded verification #" +
                         std::to_string(latest->id) + " failed: " +
                         latest->reason);
  }
  auto current = store_.tail();
  spdlog::info("Audit trail ready: {} entries{}",
               current ? current->sequence : 0,
               appender_.frozen() ? " (frozen)" : "");
}

audit_log_entry_t audit_trail::append(const audit_candidate_t& candidate) {
  return appender_.append(candidate);
}

audit_page_t audit_trail::list(const audit_filter_t& filter,
                               const uint32_t page,
                               const uint32_t per_page) const {
  return query_.list(filter, page, per_page);
}

std::optional<audit_log_entry_t> audit_trail::get(
    const uint64_t sequence) const {
  return query_.get(sequence);
}

std::vector<audit_log_entry_t> audit_trail::entity_history(
    const std::string& entity_type,
    const std::string& entity_id) const {
  return query_.entity_history(entity_type, entity_id);
}

std::vector<audit_log_entry_t> audit_trail::user_activity(
    const std::string& actor_id,
    const uint32_t days) const {
  return query_.user_activity(actor_id, days);
}

audit_stats_t audit_trail::stats(const uint32_t days) const {
  return query_.stats(days);
}

audit_verification_t audit_trail::verify(std::stop_token stop) {
  auto result = verifier_.verify(std::move(stop));
  apply(result, true);
  return result;
}

audit_verification_t audit_trail::verify_range(const uint64_t from,
                                               const uint64_t to,
                                               const hash32_t& anchor,
                                               std::stop_token stop) {
  auto result = verifier_.verify_range(from, to, anchor, std::move(stop));
  apply(result, false);
  return result;
}

std::vector<audit_verification_t> audit_trail::verifications(
    const uint32_t limit) const {
  return verifier_.history(limit);
}

export_record_t audit_trail::export_entries(const audit_filter_t& filter,
                                            const std::string& reason,
                                            const export_format_t format,
                                            const actor_t& actor) {
  return exporter_.export_entries(filter, reason, format, actor);
}

bool audit_trail::set_display_policy(const uint64_t sequence,
                                     const bool sensitive) {
  if (!store_.get(sequence)) {
    return false;
  }
  display_.set_sensitive(sequence, sensitive);
  return true;
}

bool audit_trail::is_sensitive(const audit_log_entry_t& entry) const {
  return display_.is_sensitive(entry);
}

std::optional<ledger_tail_t> audit_trail::tail() const {
  return store_.tail();
}

bool audit_trail::frozen() const {
  return appender_.frozen();
}

void audit_trail::apply(const audit_verification_t& result,
                        const bool full_run) {
  if (result.cancelled || result.anchor_mismatch) {
    return;
  }
  if (!result.is_valid) {
    if (options_.freeze_on_violation) {
      appender_.freeze(result.first_invalid_sequence.value_or(0),
                       result.reason);
    }
    return;
  }
  if (full_run && appender_.frozen()) {
    appender_.unfreeze();
  }
}

}  // namespace auditchain::service

#include <auditchain/common/errors.hpp>
#include <auditchain/ledger/display_policy.hpp>
#include <auditchain/schema/key/ledger_keys.hpp>
#include <spdlog/spdlog.h>

using namespace auditchain::schema;

namespace auditchain::ledger {

display_policy::display_policy(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

void display_policy::set_sensitive(const uint64_t sequence,
                                   const bool sensitive) {
  auto policy_key = key::make_display_sensitive_key(sequence);
  auto status = storage_.put(encoder_, make_bytes_view(policy_key), sensitive);
  if (!status.ok) {
    throw common::append_error{"failed to persist display policy: " +
                               status.message};
  }
  spdlog::info("Display policy for sequence {} set to {}", sequence,
               sensitive ? "sensitive" : "visible");
}

std::optional<bool> display_policy::override_for(
    const uint64_t sequence) const {
  auto policy_key = key::make_display_sensitive_key(sequence);
  return storage_.get<bool>(encoder_, make_bytes_view(policy_key));
}

bool display_policy::is_sensitive(const audit_log_entry_t& entry) const {
  return override_for(entry.sequence).value_or(entry.is_sensitive);
}

}  // namespace auditchain::ledger

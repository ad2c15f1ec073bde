#pragma once

#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/schema/audit_candidate.hpp>
#include <auditchain/schema/audit_log_entry.hpp>
#include <auditchain/schema/ledger_tail.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace auditchain::ledger {

using clock_fn_t = std::function<auditchain::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the Unix epoch.
auditchain::schema::timestamp_milliseconds_t system_clock_milliseconds();

struct append_options final {
  /// How long a caller waits for its request to reach the durable write.
  std::chrono::milliseconds timeout{5000};
  clock_fn_t clock{system_clock_milliseconds};
};

/// Apply the per-action field rules and reject malformed candidates.
///
/// Throws validation_error for structural problems (missing actor or subject,
/// values not allowed for the action, an update without changes) and
/// encoding_error for values that have no canonical form. Returns the
/// candidate as it will be hashed: changed_fields sorted and de-duplicated,
/// update values restricted to the changed fields.
auditchain::schema::audit_candidate_t prepare_candidate(
    auditchain::schema::audit_candidate_t candidate);

/// Single writer of the ledger.
///
/// One dedicated worker thread owns the tail and turns queued candidates
/// into linked entries strictly one at a time. Callers block until their
/// entry is durable, the write fails, or the timeout passes before the
/// worker picked the request up.
class append_service final {
 public:
  explicit append_service(ledger_store& store, append_options options = {});
  ~append_service();

  append_service(const append_service&) = delete;
  append_service& operator=(const append_service&) = delete;

  /// Validate, queue and wait for `candidate` to be committed.
  ///
  /// Throws validation_error/encoding_error before queueing, append_error on
  /// write failure, timeout or shutdown, integrity_violation while frozen.
  auditchain::schema::audit_log_entry_t append(
      const auditchain::schema::audit_candidate_t& candidate);

  /// Refuse every append until unfreeze().
  void freeze(uint64_t first_invalid_sequence, const std::string& reason);
  void unfreeze();
  bool frozen() const;

 private:
  enum class request_state : uint8_t { pending, committing, cancelled };

  struct request final {
    auditchain::schema::audit_candidate_t candidate;
    std::atomic<request_state> state{request_state::pending};
    std::promise<auditchain::schema::audit_log_entry_t> promise;
  };

  void run(std::stop_token stop);
  void process(request& item);
  void reload_tail();
  void throw_if_frozen() const;

  ledger_store& store_;
  append_options options_;

  mutable std::mutex mutex_;
  std::condition_variable_any ready_;
  std::deque<std::shared_ptr<request>> queue_;

  // Worker-owned.
  std::optional<auditchain::schema::ledger_tail_t> tail_;

  std::atomic<bool> frozen_{false};
  std::atomic<uint64_t> frozen_at_{0};
  std::string frozen_reason_;

  std::jthread worker_;
};

}  // namespace auditchain::ledger

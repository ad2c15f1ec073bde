#include <auditchain/canonical/encoder.hpp>
#include <auditchain/chain/hash_chain.hpp>
#include <auditchain/common/errors.hpp>
#include <auditchain/ledger/append_service.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

using namespace auditchain::schema;

namespace auditchain::ledger {

namespace {

bool has_text(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

const field_value_t& value_or_null(const field_map_t& values,
                                   const std::string& name) {
  static const auto kNull = make_null();
  auto it = values.find(name);
  return it == std::end(values) ? kNull : it->second;
}

field_map_t restrict_to(const field_map_t& values,
                        const std::vector<std::string>& names) {
  auto restricted = field_map_t{};
  for (const auto& name : names) {
    auto it = values.find(name);
    if (it != std::end(values)) {
      restricted.emplace(name, it->second);
    }
  }
  return restricted;
}

}  // namespace

timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

audit_candidate_t prepare_candidate(audit_candidate_t candidate) {
  if (candidate.actor.id.empty()) {
    throw common::validation_error{"actor.id is required"};
  }
  if (!is_session_action(candidate.action) &&
      (!has_text(candidate.entity_type) || !has_text(candidate.entity_id))) {
    throw common::validation_error{
        "entity_type and entity_id are required for action '" +
        std::string{to_string(candidate.action)} + "'"};
  }
  canonical::validate(candidate);

  auto& fields = candidate.changed_fields;
  switch (candidate.action) {
    case audit_action_t::create:
      if (!candidate.old_values.empty()) {
        throw common::validation_error{"create must not carry old_values"};
      }
      if (!fields.empty()) {
        throw common::validation_error{
            "changed_fields is only allowed for update"};
      }
      break;
    case audit_action_t::update: {
      if (fields.empty()) {
        auto names = std::set<std::string>{};
        for (const auto& [name, _] : candidate.old_values) {
          names.insert(name);
        }
        for (const auto& [name, _] : candidate.new_values) {
          names.insert(name);
        }
        for (const auto& name : names) {
          if (value_or_null(candidate.old_values, name) !=
              value_or_null(candidate.new_values, name)) {
            fields.push_back(name);
          }
        }
      } else {
        std::ranges::sort(fields);
        auto duplicates = std::ranges::unique(fields);
        fields.erase(std::begin(duplicates), std::end(duplicates));
      }
      if (fields.empty()) {
        throw common::validation_error{"update has no changed fields"};
      }
      candidate.old_values = restrict_to(candidate.old_values, fields);
      candidate.new_values = restrict_to(candidate.new_values, fields);
      break;
    }
    case audit_action_t::remove:
      if (!candidate.new_values.empty()) {
        throw common::validation_error{"delete must not carry new_values"};
      }
      if (!fields.empty()) {
        throw common::validation_error{
            "changed_fields is only allowed for update"};
      }
      break;
    default:
      if (!fields.empty()) {
        throw common::validation_error{
            "changed_fields is only allowed for update"};
      }
      break;
  }
  return candidate;
}

append_service::append_service(ledger_store& store, append_options options)
    : store_{store}, options_{std::move(options)} {
  if (!options_.clock) {
    options_.clock = system_clock_milliseconds;
  }
  tail_ = store_.tail();
  worker_ = std::jthread{[this](std::stop_token stop) { run(stop); }};
}

append_service::~append_service() {
  worker_.request_stop();
  ready_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  auto lock = std::scoped_lock{mutex_};
  for (auto& item : queue_) {
    item->promise.set_exception(std::make_exception_ptr(
        common::append_error{"append service is shutting down"}));
  }
  queue_.clear();
}

audit_log_entry_t append_service::append(const audit_candidate_t& candidate) {
  throw_if_frozen();
  auto item = std::make_shared<request>();
  item->candidate = prepare_candidate(candidate);
  auto result = item->promise.get_future();
  {
    auto lock = std::scoped_lock{mutex_};
    if (worker_.get_stop_token().stop_requested()) {
      throw common::append_error{"append service is shutting down"};
    }
    queue_.push_back(item);
  }
  ready_.notify_one();

  if (result.wait_for(options_.timeout) == std::future_status::ready) {
    return result.get();
  }
  auto expected = request_state::pending;
  if (item->state.compare_exchange_strong(expected,
                                          request_state::cancelled)) {
    spdlog::warn("Append timed out after {} ms before commit",
                 options_.timeout.count());
    throw common::append_error{"append timed out before commit"};
  }
  // The worker already started committing; its outcome is definitive.
  return result.get();
}

void append_service::freeze(const uint64_t first_invalid_sequence,
                            const std::string& reason) {
  {
    auto lock = std::scoped_lock{mutex_};
    frozen_reason_ = reason;
  }
  frozen_at_ = first_invalid_sequence;
  frozen_ = true;
  spdlog::critical("Ledger frozen at sequence {}: {}", first_invalid_sequence,
                   reason);
}

void append_service::unfreeze() {
  if (frozen_.exchange(false)) {
    spdlog::info("Ledger unfrozen");
  }
}

bool append_service::frozen() const {
  return frozen_;
}

void append_service::throw_if_frozen() const {
  if (!frozen_) {
    return;
  }
  auto reason = std::string{};
  {
    auto lock = std::scoped_lock{mutex_};
    reason = frozen_reason_;
  }
  throw common::integrity_violation{
      frozen_at_, "ledger is frozen after an integrity violation: " + reason};
}

void append_service::run(std::stop_token stop) {
  while (!stop.stop_requested()) {
    auto item = std::shared_ptr<request>{};
    {
      auto lock = std::unique_lock{mutex_};
      if (!ready_.wait(lock, stop, [this] { return !queue_.empty(); })) {
        return;
      }
      item = std::move(queue_.front());
      queue_.pop_front();
    }
    auto expected = request_state::pending;
    if (!item->state.compare_exchange_strong(expected,
                                             request_state::committing)) {
      continue;
    }
    process(*item);
  }
}

void append_service::process(request& item) {
  try {
    throw_if_frozen();
    const auto& candidate = item.candidate;
    auto entry = audit_log_entry_t{};
    entry.sequence = tail_ ? tail_->sequence + 1 : uint64_t{1};
    entry.prev_hash = tail_ ? tail_->entry_hash : chain::genesis_hash();
    entry.timestamp = std::max(options_.clock(),
                               tail_ ? tail_->timestamp : uint64_t{0});
    entry.actor = candidate.actor;
    entry.action = candidate.action;
    entry.action_category = candidate.action_category;
    entry.entity_type = candidate.entity_type;
    entry.entity_id = candidate.entity_id;
    entry.entity_name = candidate.entity_name;
    entry.changed_fields = candidate.changed_fields;
    entry.old_values = candidate.old_values;
    entry.new_values = candidate.new_values;
    entry.metadata = candidate.metadata;
    entry.ip_address = candidate.ip_address;
    entry.user_agent = candidate.user_agent;
    entry.request_id = candidate.request_id;
    entry.session_id = candidate.session_id;
    entry.is_sensitive = candidate.is_sensitive;
    entry.entry_hash = chain::compute_entry_hash(entry);

    store_.append(entry);
    tail_ = ledger_tail_t{.sequence = entry.sequence,
                          .entry_hash = entry.entry_hash,
                          .timestamp = entry.timestamp};
    spdlog::debug("Appended sequence {} ({} {}/{})", entry.sequence,
                  to_string(entry.action), entry.entity_type.value_or("-"),
                  entry.entity_id.value_or("-"));
    item.promise.set_value(std::move(entry));
  } catch (const common::sequence_conflict& e) {
    spdlog::critical("Single-writer guarantee broken: {}", e.what());
    reload_tail();
    item.promise.set_exception(std::current_exception());
  } catch (const common::append_error& e) {
    spdlog::error("Append failed: {}", e.what());
    reload_tail();
    item.promise.set_exception(std::current_exception());
  } catch (const std::exception& e) {
    spdlog::error("Append rejected: {}", e.what());
    reload_tail();
    item.promise.set_exception(std::current_exception());
  }
}

void append_service::reload_tail() {
  tail_ = store_.tail();
}

}  // namespace auditchain::ledger

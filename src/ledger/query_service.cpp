#include <auditchain/common/errors.hpp>
#include <auditchain/ledger/query_service.hpp>
#include <algorithm>
#include <map>
#include <set>

using namespace auditchain::schema;

namespace auditchain::ledger {

namespace {

void check_days(const uint32_t days) {
  if (days < 1 || days > kMaxStatsDays) {
    throw common::validation_error{"days must be between 1 and " +
                                   std::to_string(kMaxStatsDays)};
  }
}

// Timestamps never decrease with sequence, so a descending scan can stop at
// the first entry older than the lower bound.
bool before_window(const audit_filter_t& filter,
                   const audit_log_entry_t& entry) {
  return filter.date_from && entry.timestamp < *filter.date_from;
}

}  // namespace

bool matches(const audit_filter_t& filter, const audit_log_entry_t& entry) {
  if (filter.entity_type && entry.entity_type != filter.entity_type) {
    return false;
  }
  if (filter.entity_id && entry.entity_id != filter.entity_id) {
    return false;
  }
  if (filter.action && entry.action != *filter.action) {
    return false;
  }
  if (filter.actor_id && entry.actor.id != *filter.actor_id) {
    return false;
  }
  if (filter.action_category &&
      entry.action_category != *filter.action_category) {
    return false;
  }
  if (filter.date_from && entry.timestamp < *filter.date_from) {
    return false;
  }
  if (filter.date_to && entry.timestamp > *filter.date_to) {
    return false;
  }
  return true;
}

std::vector<audit_log_entry_t> collect(const ledger_view& view,
                                       const audit_filter_t& filter) {
  auto entries = std::vector<audit_log_entry_t>{};
  auto cursor = view.scan_backward(view.size());
  while (auto entry = cursor.next()) {
    if (before_window(filter, *entry)) {
      break;
    }
    if (matches(filter, *entry)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

query_service::query_service(ledger_store& store, clock_fn_t clock)
    : store_{store}, clock_{std::move(clock)} {
  if (!clock_) {
    clock_ = system_clock_milliseconds;
  }
}

audit_page_t query_service::list(const audit_filter_t& filter,
                                 const uint32_t page,
                                 const uint32_t per_page) const {
  if (page < 1) {
    throw common::validation_error{"page must be 1 or greater"};
  }
  if (per_page < 1 || per_page > kMaxPerPage) {
    throw common::validation_error{"per_page must be between 1 and " +
                                   std::to_string(kMaxPerPage)};
  }
  auto result = audit_page_t{.entries = {},
                             .page = page,
                             .per_page = per_page,
                             .total = 0};
  auto offset = static_cast<uint64_t>(page - 1) * per_page;
  auto view = store_.view();
  auto cursor = view.scan_backward(view.size());
  while (auto entry = cursor.next()) {
    if (before_window(filter, *entry)) {
      break;
    }
    if (!matches(filter, *entry)) {
      continue;
    }
    if (result.total >= offset && result.entries.size() < per_page) {
      result.entries.push_back(std::move(*entry));
    }
    ++result.total;
  }
  return result;
}

std::optional<audit_log_entry_t> query_service::get(
    const uint64_t sequence) const {
  return store_.get(sequence);
}

std::vector<audit_log_entry_t> query_service::entity_history(
    const std::string& entity_type,
    const std::string& entity_id) const {
  auto filter = audit_filter_t{};
  filter.entity_type = entity_type;
  filter.entity_id = entity_id;
  auto entries = std::vector<audit_log_entry_t>{};
  auto view = store_.view();
  auto cursor = view.scan_from(1);
  while (auto entry = cursor.next()) {
    if (matches(filter, *entry)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

std::vector<audit_log_entry_t> query_service::user_activity(
    const std::string& actor_id,
    const uint32_t days) const {
  check_days(days);
  auto filter = audit_filter_t{};
  filter.actor_id = actor_id;
  filter.date_from = window_start(days);
  auto entries = collect(store_.view(), filter);
  if (entries.size() > kUserActivityLimit) {
    entries.resize(kUserActivityLimit);
  }
  return entries;
}

audit_stats_t query_service::stats(const uint32_t days) const {
  check_days(days);
  auto since = window_start(days);
  auto stats = audit_stats_t{};
  stats.period_days = days;

  auto users = std::map<std::string, user_activity_count>{};
  auto view = store_.view();
  auto cursor = view.scan_backward(view.size());
  while (auto entry = cursor.next()) {
    if (entry->timestamp < since) {
      break;
    }
    ++stats.total_entries;
    ++stats.by_action[std::string{to_string(entry->action)}];
    if (entry->entity_type) {
      ++stats.by_entity_type[*entry->entity_type];
    }
    if (is_system_actor(entry->actor)) {
      continue;
    }
    auto [it, inserted] = users.try_emplace(entry->actor.id);
    if (inserted) {
      // Newest entry first: keep the most recent denormalised identity.
      it->second.actor_id = entry->actor.id;
      it->second.email = entry->actor.email;
      it->second.name = entry->actor.name;
    }
    ++it->second.count;
  }

  stats.unique_users = users.size();
  for (auto& [_, user] : users) {
    stats.top_users.push_back(std::move(user));
  }
  std::ranges::sort(stats.top_users, [](const auto& lhs, const auto& rhs) {
    if (lhs.count != rhs.count) {
      return lhs.count > rhs.count;
    }
    return lhs.actor_id < rhs.actor_id;
  });
  if (stats.top_users.size() > kTopUsersLimit) {
    stats.top_users.resize(kTopUsersLimit);
  }
  return stats;
}

timestamp_milliseconds_t query_service::window_start(
    const uint32_t days) const {
  auto now = clock_();
  auto span = static_cast<duration_milliseconds_t>(days) * kMillisecondsPerDay;
  return now > span ? now - span : 0;
}

}  // namespace auditchain::ledger

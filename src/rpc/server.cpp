#include <auditchain/common/errors.hpp>
#include <auditchain/rpc/server.hpp>
#include <auditchain/schema/encoding/proto/convert.hpp>
#include <auditchain/schema/reference.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <limits>
#include <stop_token>
#include <string>
#include <thread>

using namespace auditchain::rpc;
using namespace auditchain::schema;

namespace proto = auditchain::schema::encoding::proto;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds{100};

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

// Run `fn` and turn any ledger failure into the matching status.
template <typename Fn>
grpc::ServerUnaryReactor* handle(grpc::CallbackServerContext* context,
                                 const char* method,
                                 Fn&& fn) {
  try {
    return finish(context, fn());
  } catch (const std::exception& e) {
    auto status = to_grpc_status(e);
    if (status.error_code() == grpc::StatusCode::INTERNAL) {
      spdlog::error("{} failed: {}", method, e.what());
    } else {
      spdlog::debug("{} rejected: {}", method, e.what());
    }
    return finish(context, status);
  }
}

void to_proto_list(const auditchain::service::audit_trail& trail,
                   const std::vector<audit_log_entry_t>& entries,
                   const bool reveal_sensitive,
                   auditchain::v1::EntryList* response) {
  for (const auto& entry : entries) {
    proto::to_proto(entry, trail.is_sensitive(entry) && !reveal_sensitive,
                    response->add_entries());
  }
}

}  // namespace

namespace auditchain::rpc {

grpc::Status to_grpc_status(const std::exception& e) {
  const auto* ledger_error = dynamic_cast<const common::error*>(&e);
  if (ledger_error == nullptr) {
    return grpc::Status{grpc::StatusCode::INTERNAL, e.what()};
  }
  switch (ledger_error->code()) {
    case common::error_code::validation_error:
    case common::error_code::encoding_error:
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, e.what()};
    case common::error_code::append_error:
      return grpc::Status{grpc::StatusCode::UNAVAILABLE, e.what()};
    case common::error_code::integrity_violation:
      return grpc::Status{grpc::StatusCode::FAILED_PRECONDITION, e.what()};
    case common::error_code::sequence_conflict:
    default:
      return grpc::Status{grpc::StatusCode::INTERNAL, e.what()};
  }
}

}  // namespace auditchain::rpc

listener::listener(auditchain::service::audit_trail& trail) : trail_{trail} {}

grpc::ServerUnaryReactor* listener::ListEntries(
    grpc::CallbackServerContext* context,
    const auditchain::v1::ListEntriesRequest* request,
    auditchain::v1::ListEntriesResponse* response) {
  return handle(context, "ListEntries", [&] {
    auto page = request->page() == 0 ? uint32_t{1} : request->page();
    auto per_page =
        request->per_page() == 0 ? kDefaultPerPage : request->per_page();
    auto result = trail_.list(proto::from_proto(request->filter()), page,
                              per_page);
    for (const auto& entry : result.entries) {
      auto redact = trail_.is_sensitive(entry) && !request->reveal_sensitive();
      proto::to_proto(entry, redact, response->add_entries());
    }
    response->set_total(result.total);
    response->set_page(result.page);
    response->set_per_page(result.per_page);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::GetEntry(
    grpc::CallbackServerContext* context,
    const auditchain::v1::GetEntryRequest* request,
    auditchain::v1::AuditLogEntry* response) {
  return handle(context, "GetEntry", [&] {
    auto entry = trail_.get(request->id());
    if (!entry) {
      return grpc::Status{grpc::StatusCode::NOT_FOUND,
                          "audit log entry " + std::to_string(request->id()) +
                              " not found"};
    }
    proto::to_proto(*entry,
                    trail_.is_sensitive(*entry) && !request->reveal_sensitive(),
                    response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::GetEntityHistory(
    grpc::CallbackServerContext* context,
    const auditchain::v1::GetEntityHistoryRequest* request,
    auditchain::v1::EntryList* response) {
  return handle(context, "GetEntityHistory", [&] {
    to_proto_list(
        trail_,
        trail_.entity_history(request->entity_type(), request->entity_id()),
        request->reveal_sensitive(), response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::GetUserActivity(
    grpc::CallbackServerContext* context,
    const auditchain::v1::GetUserActivityRequest* request,
    auditchain::v1::EntryList* response) {
  return handle(context, "GetUserActivity", [&] {
    auto days = request->days() == 0 ? kDefaultStatsDays : request->days();
    to_proto_list(trail_, trail_.user_activity(request->user_id(), days),
                  request->reveal_sensitive(), response);
    return grpc::Status::OK;
  });
}

cancellation_watch::cancellation_watch(std::function<bool()> is_cancelled,
                                       const std::chrono::milliseconds interval)
    : is_cancelled_{std::move(is_cancelled)},
      interval_{interval},
      worker_{[this](std::stop_token done) { watch(std::move(done)); }} {}

void cancellation_watch::watch(std::stop_token done) {
  auto lock = std::unique_lock{mutex_};
  while (!done.stop_requested()) {
    if (is_cancelled_()) {
      source_.request_stop();
      return;
    }
    // Returns early when the jthread is asked to stop.
    wakeup_.wait_for(lock, done, interval_, [] { return false; });
  }
}

grpc::ServerUnaryReactor* listener::Verify(
    grpc::CallbackServerContext* context,
    const auditchain::v1::VerifyRequest* request,
    auditchain::v1::Verification* response) {
  return handle(context, "Verify", [&] {
    // Stop the walk once the client gives up on the call.
    auto watch = cancellation_watch{
        [context] { return context->IsCancelled(); }, kCancelPollInterval};

    if (!request->has_start_sequence() && !request->has_end_sequence()) {
      proto::to_proto(trail_.verify(watch.token()), response);
      return grpc::Status::OK;
    }

    auto from = request->has_start_sequence() ? request->start_sequence()
                                              : uint64_t{1};
    auto to = request->has_end_sequence()
                  ? request->end_sequence()
                  : std::numeric_limits<uint64_t>::max();
    auto anchor = make_zero_hash();
    if (request->has_anchor_hash()) {
      auto parsed = try_make_hash32(request->anchor_hash());
      if (!parsed) {
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                            "anchor_hash must be 64 hex characters"};
      }
      anchor = *parsed;
    } else if (from > 1) {
      return grpc::Status{
          grpc::StatusCode::INVALID_ARGUMENT,
          "anchor_hash is required when start_sequence is past 1"};
    }
    proto::to_proto(
        trail_.verify_range(from, to, anchor, watch.token()), response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::ListVerifications(
    grpc::CallbackServerContext* context,
    const auditchain::v1::ListVerificationsRequest* request,
    auditchain::v1::VerificationList* response) {
  return handle(context, "ListVerifications", [&] {
    auto limit = request->limit() == 0
                     ? auditchain::ledger::kDefaultHistoryLimit
                     : request->limit();
    for (const auto& result : trail_.verifications(limit)) {
      proto::to_proto(result, response->add_verifications());
    }
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::Export(
    grpc::CallbackServerContext* context,
    const auditchain::v1::ExportRequest* request,
    auditchain::v1::ExportResponse* response) {
  return handle(context, "Export", [&] {
    auto format = request->format().empty()
                      ? std::optional{export_format_t::json}
                      : try_parse_export_format(request->format());
    if (!format) {
      return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT,
                          "unknown export format '" + request->format() + "'"};
    }
    auto record = trail_.export_entries(proto::from_proto(request->filter()),
                                        request->reason(), *format,
                                        proto::from_proto(request->actor()));
    response->set_format(std::string{to_string(record.format)});
    if (record.format == export_format_t::csv) {
      response->set_artifact(record.payload);
    } else {
      response->set_payload(record.payload);
    }
    response->set_manifest_hash(record.manifest_hash);
    response->set_entries_count(record.entries_exported);
    response->set_export_type(record.export_type);
    *response->mutable_exported_at() = proto::to_timestamp(record.exported_at);
    if (record.export_sequence) {
      response->set_export_sequence(*record.export_sequence);
    }
    if (record.warning) {
      response->set_warning(*record.warning);
    }
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::GetStats(
    grpc::CallbackServerContext* context,
    const auditchain::v1::GetStatsRequest* request,
    auditchain::v1::Stats* response) {
  return handle(context, "GetStats", [&] {
    auto days = request->days() == 0 ? kDefaultStatsDays : request->days();
    proto::to_proto(trail_.stats(days), response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::ListActions(
    grpc::CallbackServerContext* context,
    const auditchain::v1::ListActionsRequest*,
    auditchain::v1::ActionList* response) {
  for (const auto action : kDataActions) {
    response->add_data(std::string{action});
  }
  for (const auto action : kAuthActions) {
    response->add_auth(std::string{action});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListEntityTypes(
    grpc::CallbackServerContext* context,
    const auditchain::v1::ListEntityTypesRequest*,
    auditchain::v1::EntityTypeList* response) {
  for (const auto entity_type : kAuditableEntityTypes) {
    response->add_entity_types(std::string{entity_type});
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Append(
    grpc::CallbackServerContext* context,
    const auditchain::v1::AppendRequest* request,
    auditchain::v1::AuditLogEntry* response) {
  return handle(context, "Append", [&] {
    auto entry = trail_.append(proto::from_proto(*request));
    proto::to_proto(entry, false, response);
    return grpc::Status::OK;
  });
}

grpc::ServerUnaryReactor* listener::SetDisplayPolicy(
    grpc::CallbackServerContext* context,
    const auditchain::v1::SetDisplayPolicyRequest* request,
    auditchain::v1::SetDisplayPolicyResponse* response) {
  return handle(context, "SetDisplayPolicy", [&] {
    if (!trail_.set_display_policy(request->id(), request->is_sensitive())) {
      return grpc::Status{grpc::StatusCode::NOT_FOUND,
                          "audit log entry " + std::to_string(request->id()) +
                              " not found"};
    }
    response->set_id(request->id());
    response->set_is_sensitive(request->is_sensitive());
    return grpc::Status::OK;
  });
}

#pragma once

#include <auditchain/service/audit_trail.hpp>
#include <auditchain/v1/audit_trail.grpc.pb.h>
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace auditchain::rpc {

/// Map a ledger failure onto the gRPC status returned to the caller.
///
/// - validation_error, encoding_error: INVALID_ARGUMENT
/// - append_error: UNAVAILABLE (retry the whole append)
/// - integrity_violation: FAILED_PRECONDITION (ledger frozen)
/// - sequence_conflict and anything else: INTERNAL
grpc::Status to_grpc_status(const std::exception& e);

/// Polls `is_cancelled` every `interval` on a background thread and stops
/// token() once it reports true. Destruction wakes and joins the thread
/// without waiting out the interval.
class cancellation_watch final {
 public:
  cancellation_watch(std::function<bool()> is_cancelled,
                     std::chrono::milliseconds interval);

  cancellation_watch(const cancellation_watch&) = delete;
  cancellation_watch& operator=(const cancellation_watch&) = delete;

  std::stop_token token() const { return source_.get_token(); }

 private:
  void watch(std::stop_token done);

  std::function<bool()> is_cancelled_;
  std::chrono::milliseconds interval_;
  std::stop_source source_;
  std::mutex mutex_;
  std::condition_variable_any wakeup_;
  std::jthread worker_;
};

/// Callback listener serving the audit trail over gRPC.
///
/// Reads hide old/new values of sensitive entries unless the request sets
/// `reveal_sensitive`. Missing entries answer NOT_FOUND.
struct listener final : public auditchain::v1::AuditTrail::CallbackService {
  /// Bind listener to the audit trail it serves.
  explicit listener(auditchain::service::audit_trail& trail);

  /// Filtered, paginated entries, newest first.
  virtual grpc::ServerUnaryReactor* ListEntries(
      grpc::CallbackServerContext* context,
      const auditchain::v1::ListEntriesRequest* request,
      auditchain::v1::ListEntriesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetEntry(
      grpc::CallbackServerContext* context,
      const auditchain::v1::GetEntryRequest* request,
      auditchain::v1::AuditLogEntry* response) override final;

  /// Every entry touching one entity, oldest first.
  virtual grpc::ServerUnaryReactor* GetEntityHistory(
      grpc::CallbackServerContext* context,
      const auditchain::v1::GetEntityHistoryRequest* request,
      auditchain::v1::EntryList* response) override final;

  virtual grpc::ServerUnaryReactor* GetUserActivity(
      grpc::CallbackServerContext* context,
      const auditchain::v1::GetUserActivityRequest* request,
      auditchain::v1::EntryList* response) override final;

  /// Full or ranged chain verification. Cancelling the call stops the walk.
  virtual grpc::ServerUnaryReactor* Verify(
      grpc::CallbackServerContext* context,
      const auditchain::v1::VerifyRequest* request,
      auditchain::v1::Verification* response) override final;

  virtual grpc::ServerUnaryReactor* ListVerifications(
      grpc::CallbackServerContext* context,
      const auditchain::v1::ListVerificationsRequest* request,
      auditchain::v1::VerificationList* response) override final;

  /// Export matching entries; JSON inline, CSV as an artifact.
  virtual grpc::ServerUnaryReactor* Export(
      grpc::CallbackServerContext* context,
      const auditchain::v1::ExportRequest* request,
      auditchain::v1::ExportResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetStats(
      grpc::CallbackServerContext* context,
      const auditchain::v1::GetStatsRequest* request,
      auditchain::v1::Stats* response) override final;

  virtual grpc::ServerUnaryReactor* ListActions(
      grpc::CallbackServerContext* context,
      const auditchain::v1::ListActionsRequest* request,
      auditchain::v1::ActionList* response) override final;

  virtual grpc::ServerUnaryReactor* ListEntityTypes(
      grpc::CallbackServerContext* context,
      const auditchain::v1::ListEntityTypesRequest* request,
      auditchain::v1::EntityTypeList* response) override final;

  /// Record one action on behalf of a business operation.
  virtual grpc::ServerUnaryReactor* Append(
      grpc::CallbackServerContext* context,
      const auditchain::v1::AppendRequest* request,
      auditchain::v1::AuditLogEntry* response) override final;

  virtual grpc::ServerUnaryReactor* SetDisplayPolicy(
      grpc::CallbackServerContext* context,
      const auditchain::v1::SetDisplayPolicyRequest* request,
      auditchain::v1::SetDisplayPolicyResponse* response) override final;

  auditchain::service::audit_trail& trail_;
};

}  // namespace auditchain::rpc

#include <gtest/gtest.h>
#include <auditchain/common/errors.hpp>
#include <auditchain/rpc/server.hpp>
#include <auditchain/schema/encoding/proto/convert.hpp>
#include <auditchain/testing/ledger_fixture.hpp>
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

class server_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto builder = grpc::ServerBuilder{};
    builder.RegisterService(&listener_);
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    stub_ = auditchain::v1::AuditTrail::NewStub(
        server_->InProcessChannel(grpc::ChannelArguments{}));
  }

  void TearDown() override {
    if (server_) {
      server_->Shutdown();
      server_->Wait();
    }
  }

  static auditchain::v1::AppendRequest make_append(const std::string& user,
                                                   const std::string& action) {
    auto request = auditchain::v1::AppendRequest{};
    request.mutable_actor()->set_id(user);
    request.mutable_actor()->set_email(user + "@example.com");
    request.set_action(action);
    request.set_entity_type("incident");
    request.set_entity_id("INC-1");
    return request;
  }

  auditchain::v1::AuditLogEntry append(
      const auditchain::v1::AppendRequest& request) {
    auto context = grpc::ClientContext{};
    auto response = auditchain::v1::AuditLogEntry{};
    auto status = stub_->Append(&context, request, &response);
    EXPECT_TRUE(status.ok()) << status.error_message();
    return response;
  }

  auditchain::testing::ledger_fixture fixture_{"auditchain_rpc"};
  auditchain::service::audit_trail trail_{fixture_.encoder(),
                                          fixture_.storage()};
  auditchain::rpc::listener listener_{trail_};
  std::unique_ptr<grpc::Server> server_;
  std::unique_ptr<auditchain::v1::AuditTrail::Stub> stub_;
};

}  // namespace

TEST(rpc_status, ledger_errors_map_to_status_codes) {
  using auditchain::rpc::to_grpc_status;
  EXPECT_EQ(to_grpc_status(auditchain::common::validation_error{"x"})
                .error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(
      to_grpc_status(auditchain::common::encoding_error{"x"}).error_code(),
      grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(to_grpc_status(auditchain::common::append_error{"x"}).error_code(),
            grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(to_grpc_status(auditchain::common::integrity_violation{3, "x"})
                .error_code(),
            grpc::StatusCode::FAILED_PRECONDITION);
  EXPECT_EQ(
      to_grpc_status(auditchain::common::sequence_conflict{2, 3}).error_code(),
      grpc::StatusCode::INTERNAL);
  auto other = to_grpc_status(std::runtime_error{"boom"});
  EXPECT_EQ(other.error_code(), grpc::StatusCode::INTERNAL);
  EXPECT_EQ(other.error_message(), "boom");
}

TEST(cancellation_watch, stops_the_token_once_cancelled) {
  auto cancelled = std::atomic<bool>{false};
  auto watch = auditchain::rpc::cancellation_watch{
      [&] { return cancelled.load(); }, std::chrono::milliseconds{5}};
  auto token = watch.token();
  EXPECT_FALSE(token.stop_requested());
  cancelled = true;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (!token.stop_requested() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  EXPECT_TRUE(token.stop_requested());
}

TEST(cancellation_watch, destruction_does_not_wait_for_the_interval) {
  auto polls = std::atomic<int>{0};
  auto started = std::chrono::steady_clock::now();
  {
    auto watch = auditchain::rpc::cancellation_watch{
        [&] {
          ++polls;
          return false;
        },
        std::chrono::seconds{30}};
    while (polls.load() == 0) {
      std::this_thread::yield();
    }
    EXPECT_FALSE(watch.token().stop_requested());
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started,
            std::chrono::seconds{5});
  EXPECT_EQ(polls.load(), 1);
}

TEST_F(server_test, append_then_read_back) {
  auto request = make_append("u1", "create");
  (*request.mutable_new_values()->mutable_fields())["severity"]
      .set_number_value(3);
  auto created = append(request);
  EXPECT_EQ(created.sequence(), 1u);
  EXPECT_EQ(created.id(), 1u);
  EXPECT_EQ(created.action_category(), "data");
  EXPECT_EQ(created.prev_hash(), std::string(64, '0'));

  auto context = grpc::ClientContext{};
  auto get = auditchain::v1::GetEntryRequest{};
  get.set_id(1);
  auto fetched = auditchain::v1::AuditLogEntry{};
  ASSERT_TRUE(stub_->GetEntry(&context, get, &fetched).ok());
  EXPECT_EQ(fetched.entry_hash(), created.entry_hash());
  EXPECT_EQ(fetched.new_values().fields().at("severity").number_value(), 3);
}

TEST_F(server_test, rejected_append_reports_invalid_argument) {
  auto request = make_append("u1", "archive");
  auto context = grpc::ClientContext{};
  auto response = auditchain::v1::AuditLogEntry{};
  auto status = stub_->Append(&context, request, &response);
  EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
  EXPECT_FALSE(trail_.tail().has_value());
}

TEST_F(server_test, missing_entry_is_not_found) {
  auto context = grpc::ClientContext{};
  auto get = auditchain::v1::GetEntryRequest{};
  get.set_id(42);
  auto response = auditchain::v1::AuditLogEntry{};
  EXPECT_EQ(stub_->GetEntry(&context, get, &response).error_code(),
            grpc::StatusCode::NOT_FOUND);

  auto policy_context = grpc::ClientContext{};
  auto policy = auditchain::v1::SetDisplayPolicyRequest{};
  policy.set_id(42);
  auto policy_response = auditchain::v1::SetDisplayPolicyResponse{};
  EXPECT_EQ(stub_->SetDisplayPolicy(&policy_context, policy, &policy_response)
                .error_code(),
            grpc::StatusCode::NOT_FOUND);
}

TEST_F(server_test, sensitive_values_are_redacted_unless_revealed) {
  auto request = make_append("u1", "update");
  request.add_changed_fields("salary");
  (*request.mutable_old_values()->mutable_fields())["salary"].set_number_value(
      100);
  (*request.mutable_new_values()->mutable_fields())["salary"].set_number_value(
      200);
  request.set_is_sensitive(true);
  append(request);

  auto list = [&](const bool reveal) {
    auto context = grpc::ClientContext{};
    auto list_request = auditchain::v1::ListEntriesRequest{};
    list_request.set_reveal_sensitive(reveal);
    auto response = auditchain::v1::ListEntriesResponse{};
    EXPECT_TRUE(stub_->ListEntries(&context, list_request, &response).ok());
    return response;
  };

  auto hidden = list(false);
  ASSERT_EQ(hidden.entries_size(), 1);
  EXPECT_EQ(hidden.page(), 1u);
  EXPECT_EQ(hidden.per_page(), 50u);
  EXPECT_EQ(
      hidden.entries(0).new_values().fields().at("salary").string_value(),
      auditchain::schema::encoding::proto::kRedacted);
  EXPECT_EQ(list(true).entries(0).new_values().fields().at("salary")
                .number_value(),
            200);

  auto context = grpc::ClientContext{};
  auto policy = auditchain::v1::SetDisplayPolicyRequest{};
  policy.set_id(1);
  policy.set_is_sensitive(false);
  auto policy_response = auditchain::v1::SetDisplayPolicyResponse{};
  ASSERT_TRUE(
      stub_->SetDisplayPolicy(&context, policy, &policy_response).ok());
  EXPECT_EQ(list(false).entries(0).new_values().fields().at("salary")
                .number_value(),
            200);
}

TEST_F(server_test, verify_and_history) {
  auto first = append(make_append("u1", "create"));
  append(make_append("u1", "view"));

  auto context = grpc::ClientContext{};
  auto full = auditchain::v1::Verification{};
  ASSERT_TRUE(
      stub_->Verify(&context, auditchain::v1::VerifyRequest{}, &full).ok());
  EXPECT_TRUE(full.is_valid());
  EXPECT_EQ(full.entries_verified(), 2u);

  auto ranged_context = grpc::ClientContext{};
  auto ranged_request = auditchain::v1::VerifyRequest{};
  ranged_request.set_start_sequence(2);
  ranged_request.set_anchor_hash(first.entry_hash());
  auto ranged = auditchain::v1::Verification{};
  ASSERT_TRUE(
      stub_->Verify(&ranged_context, ranged_request, &ranged).ok());
  EXPECT_TRUE(ranged.is_valid());
  EXPECT_EQ(ranged.start_sequence(), 2u);
  EXPECT_EQ(ranged.end_sequence(), 2u);

  auto missing_anchor_context = grpc::ClientContext{};
  auto missing_anchor = auditchain::v1::VerifyRequest{};
  missing_anchor.set_start_sequence(2);
  auto rejected = auditchain::v1::Verification{};
  EXPECT_EQ(stub_->Verify(&missing_anchor_context, missing_anchor, &rejected)
                .error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);

  auto wrong_anchor_context = grpc::ClientContext{};
  auto wrong_anchor = ranged_request;
  wrong_anchor.set_anchor_hash(std::string(64, '0'));
  auto mismatch = auditchain::v1::Verification{};
  ASSERT_TRUE(
      stub_->Verify(&wrong_anchor_context, wrong_anchor, &mismatch).ok());
  EXPECT_FALSE(mismatch.is_valid());
  EXPECT_TRUE(mismatch.anchor_mismatch());
  EXPECT_EQ(mismatch.first_invalid_sequence(), 1u);

  auto history_context = grpc::ClientContext{};
  auto history = auditchain::v1::VerificationList{};
  ASSERT_TRUE(stub_
                  ->ListVerifications(&history_context,
                                      auditchain::v1::ListVerificationsRequest{},
                                      &history)
                  .ok());
  ASSERT_EQ(history.verifications_size(), 2);
  EXPECT_EQ(history.verifications(0).id(), ranged.id());
}

TEST_F(server_test, export_requires_reason_and_logs_itself) {
  append(make_append("u1", "create"));

  auto context = grpc::ClientContext{};
  auto request = auditchain::v1::ExportRequest{};
  request.mutable_actor()->set_id("auditor");
  auto response = auditchain::v1::ExportResponse{};
  EXPECT_EQ(stub_->Export(&context, request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);

  auto csv_context = grpc::ClientContext{};
  request.set_reason("quarterly review");
  request.set_format("csv");
  ASSERT_TRUE(stub_->Export(&csv_context, request, &response).ok());
  EXPECT_EQ(response.format(), "csv");
  EXPECT_TRUE(response.payload().empty());
  EXPECT_EQ(response.artifact().rfind("sequence,", 0), 0u);
  EXPECT_EQ(response.entries_count(), 1u);
  EXPECT_EQ(response.export_type(), "full");
  EXPECT_EQ(response.export_sequence(), 2u);

  auto bad_context = grpc::ClientContext{};
  request.set_format("xml");
  EXPECT_EQ(stub_->Export(&bad_context, request, &response).error_code(),
            grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(server_test, frozen_ledger_refuses_appends) {
  trail_.append(auditchain::testing::make_create("u1", "incident", "INC-1"));
  auto tampered = *trail_.get(1);
  tampered.entity_id = "INC-9";
  fixture_.overwrite_entry(tampered);
  EXPECT_FALSE(trail_.verify().is_valid);

  auto context = grpc::ClientContext{};
  auto response = auditchain::v1::AuditLogEntry{};
  EXPECT_EQ(
      stub_->Append(&context, make_append("u1", "view"), &response)
          .error_code(),
      grpc::StatusCode::FAILED_PRECONDITION);
}

TEST_F(server_test, reference_lists) {
  auto context = grpc::ClientContext{};
  auto actions = auditchain::v1::ActionList{};
  ASSERT_TRUE(stub_
                  ->ListActions(&context, auditchain::v1::ListActionsRequest{},
                                &actions)
                  .ok());
  EXPECT_EQ(actions.data_size(), 7);
  EXPECT_EQ(actions.auth_size(), 2);
  EXPECT_EQ(actions.admin_size(), 0);

  auto types_context = grpc::ClientContext{};
  auto types = auditchain::v1::EntityTypeList{};
  ASSERT_TRUE(stub_
                  ->ListEntityTypes(&types_context,
                                    auditchain::v1::ListEntityTypesRequest{},
                                    &types)
                  .ok());
  EXPECT_GT(types.entity_types_size(), 0);

  auto stats_context = grpc::ClientContext{};
  auto stats = auditchain::v1::Stats{};
  ASSERT_TRUE(
      stub_->GetStats(&stats_context, auditchain::v1::GetStatsRequest{}, &stats)
          .ok());
  EXPECT_EQ(stats.period_days(), 30u);
  EXPECT_EQ(stats.total_entries(), 0u);
}

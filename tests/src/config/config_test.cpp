#include <gtest/gtest.h>
#include <auditchain/config/config.hpp>
#include <auditchain/testing/common.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace {

auditchain::config::parse_result parse(const std::vector<std::string>& args) {
  auto argv = std::vector<const char*>{"auditchain_server"};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }
  return auditchain::config::parse_arguments(static_cast<int>(argv.size()),
                                             argv.data());
}

}  // namespace

TEST(config, defaults) {
  auto result = parse({});
  ASSERT_EQ(result.outcome, auditchain::config::parse_outcome::run)
      << result.message;
  EXPECT_EQ(result.config.listen, "0.0.0.0:50051");
  EXPECT_EQ(result.config.db_path, "auditchain.db");
  EXPECT_EQ(result.config.log_level, "info");
  EXPECT_EQ(result.config.append_timeout_ms, 5000u);
  EXPECT_TRUE(result.config.sync_writes);
  EXPECT_FALSE(result.config.verify_on_start);
  EXPECT_TRUE(result.config.freeze_on_violation);
}

TEST(config, command_line_overrides) {
  auto result = parse({"--listen", "127.0.0.1:6000", "-d", "/tmp/ledger",
                       "--log-level", "debug", "--append-timeout-ms", "250",
                       "--verify-on-start", "true", "--freeze-on-violation",
                       "false"});
  ASSERT_EQ(result.outcome, auditchain::config::parse_outcome::run)
      << result.message;
  EXPECT_EQ(result.config.listen, "127.0.0.1:6000");
  EXPECT_EQ(result.config.db_path, "/tmp/ledger");
  EXPECT_EQ(result.config.log_level, "debug");
  EXPECT_EQ(result.config.append_timeout_ms, 250u);
  EXPECT_TRUE(result.config.verify_on_start);
  EXPECT_FALSE(result.config.freeze_on_violation);
}

TEST(config, file_values_yield_to_command_line) {
  auto path = auditchain::testing::make_db_path("auditchain_config") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "listen = 10.0.0.1:7000\n"
         << "db-path = /var/lib/auditchain\n"
         << "sync-writes = false\n";
  }
  auto result = parse({"--config", path, "--listen", "127.0.0.1:7001"});
  auditchain::testing::remove_path(path);

  ASSERT_EQ(result.outcome, auditchain::config::parse_outcome::run)
      << result.message;
  EXPECT_EQ(result.config.listen, "127.0.0.1:7001");
  EXPECT_EQ(result.config.db_path, "/var/lib/auditchain");
  EXPECT_FALSE(result.config.sync_writes);
}

TEST(config, rejects_bad_input) {
  using auditchain::config::parse_outcome;
  EXPECT_EQ(parse({"--log-level", "loud"}).outcome, parse_outcome::error);
  EXPECT_EQ(parse({"--append-timeout-ms", "0"}).outcome, parse_outcome::error);
  EXPECT_EQ(parse({"--db-path", ""}).outcome, parse_outcome::error);
  EXPECT_EQ(parse({"--no-such-flag"}).outcome, parse_outcome::error);
  EXPECT_EQ(parse({"--config", "/nonexistent/auditchain.ini"}).outcome,
            parse_outcome::error);
}

TEST(config, help_lists_options) {
  auto result = parse({"--help"});
  EXPECT_EQ(result.outcome, auditchain::config::parse_outcome::help);
  EXPECT_NE(result.message.find("--db-path"), std::string::npos);
}

TEST(config, log_levels) {
  EXPECT_EQ(auditchain::config::try_parse_log_level("warn"),
            spdlog::level::warn);
  EXPECT_EQ(auditchain::config::try_parse_log_level("error"),
            spdlog::level::err);
  EXPECT_FALSE(auditchain::config::try_parse_log_level("WARN").has_value());
}

#pragma once

#include <boost/program_options.hpp>
#include <spdlog/common.h>
#include <cstdint>
#include <optional>
#include <string>

namespace auditchain::config {

/// Runtime settings of the audit trail server.
struct server_config final {
  std::string listen{"0.0.0.0:50051"};
  std::string db_path{"auditchain.db"};
  std::string log_level{"info"};
  std::string log_file{"auditchain.log"};
  uint64_t append_timeout_ms{5000};
  bool sync_writes{true};
  bool verify_on_start{false};
  bool freeze_on_violation{true};
};

enum class parse_outcome : uint8_t { run, help, error };

struct parse_result final {
  parse_outcome outcome{parse_outcome::run};
  server_config config;
  /// Help text for `help`, the reason for `error`.
  std::string message;
};

/// Options understood on the command line and in a config file.
boost::program_options::options_description make_description(
    server_config& config,
    std::string& config_file);

/// Parse `argv`, then the file named by --config when given. Values on the
/// command line win over the file. Never throws; bad input yields `error`.
parse_result parse_arguments(int argc, const char* const argv[]);

std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string& value);

}  // namespace auditchain::config

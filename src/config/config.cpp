#include <auditchain/config/config.hpp>
#include <array>
#include <sstream>
#include <string_view>
#include <utility>

namespace po = boost::program_options;

namespace auditchain::config {

namespace {

constexpr auto kLogLevels =
    std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7>{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};

}  // namespace

std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string& value) {
  for (const auto& [name, level] : kLogLevels) {
    if (name == value) {
      return level;
    }
  }
  return std::nullopt;
}

po::options_description make_description(server_config& config,
                                         std::string& config_file) {
  auto description = po::options_description{"auditchain server"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "Path to an INI-style config file")(
      "listen,l",
      po::value<std::string>(&config.listen)->default_value(config.listen),
      "IP:Port for the gRPC server")(
      "db-path,d",
      po::value<std::string>(&config.db_path)->default_value(config.db_path),
      "RocksDB directory holding the ledger")(
      "log-level",
      po::value<std::string>(&config.log_level)
          ->default_value(config.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&config.log_file)->default_value(config.log_file),
      "File sink path")(
      "append-timeout-ms",
      po::value<uint64_t>(&config.append_timeout_ms)
          ->default_value(config.append_timeout_ms),
      "How long an append may wait for the writer before failing")(
      "sync-writes",
      po::value<bool>(&config.sync_writes)->default_value(config.sync_writes),
      "fsync every ledger write")(
      "verify-on-start",
      po::value<bool>(&config.verify_on_start)
          ->default_value(config.verify_on_start),
      "Verify the whole chain before serving")(
      "freeze-on-violation",
      po::value<bool>(&config.freeze_on_violation)
          ->default_value(config.freeze_on_violation),
      "Refuse appends after a failed verification");
  return description;
}

parse_result parse_arguments(const int argc, const char* const argv[]) {
  auto result = parse_result{};
  auto config_file = std::string{};
  auto description = make_description(result.config, config_file);
  try {
    auto vm = po::variables_map{};
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      auto help = std::ostringstream{};
      help << description;
      result.outcome = parse_outcome::help;
      result.message = help.str();
      return result;
    }
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    result.outcome = parse_outcome::error;
    result.message = e.what();
    return result;
  }

  if (!try_parse_log_level(result.config.log_level)) {
    result.outcome = parse_outcome::error;
    result.message = "unknown log level '" + result.config.log_level + "'";
    return result;
  }
  if (result.config.append_timeout_ms == 0) {
    result.outcome = parse_outcome::error;
    result.message = "append-timeout-ms must be greater than zero";
    return result;
  }
  if (result.config.db_path.empty()) {
    result.outcome = parse_outcome::error;
    result.message = "db-path must not be empty";
    return result;
  }
  return result;
}

}  // namespace auditchain::config

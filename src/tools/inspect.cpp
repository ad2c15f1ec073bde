#include <auditchain/common/errors.hpp>
#include <auditchain/crypto/sha256.hpp>
#include <auditchain/ledger/ledger_store.hpp>
#include <auditchain/ledger/verifier.hpp>
#include <auditchain/storage/rocksdb/storage.hpp>
#include <boost/program_options.hpp>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <string>

// Offline ledger inspection for auditors.
//
// Exit codes: 0 chain intact or digest matches, 1 chain broken or digest
// mismatch, 2 usage or I/O error.
namespace {

namespace po = boost::program_options;

constexpr int kExitOk = 0;
constexpr int kExitMismatch = 1;
constexpr int kExitUsage = 2;

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  auditchain_inspect verify --db PATH [--from N --to M "
               "--anchor HEX]\n"
            << "  auditchain_inspect tail --db PATH\n"
            << "  auditchain_inspect digest --file PATH --expected HEX\n\n";
  std::cout << options << '\n';
}

auditchain::ledger::storage_t open_read_only(const std::string& path) {
  return auditchain::storage::make_storage<
      auditchain::storage::rocksdb_storage_tag>(
      path, auditchain::storage::storage_options{.read_only = true,
                                                 .create_if_missing = false});
}

int run_verify(const po::variables_map& vm) {
  auto storage = open_read_only(vm["db"].as<std::string>());
  auto encoder = auditchain::ledger::encoder_t{};
  auto store = auditchain::ledger::ledger_store{encoder, storage};
  auto checker = auditchain::ledger::verifier{store};

  auto result = auditchain::schema::audit_verification_t{};
  if (vm.contains("from") || vm.contains("to")) {
    auto from = vm.contains("from") ? vm["from"].as<uint64_t>() : uint64_t{1};
    auto to = vm.contains("to") ? vm["to"].as<uint64_t>()
                                : std::numeric_limits<uint64_t>::max();
    auto anchor = auditchain::schema::make_zero_hash();
    if (vm.contains("anchor")) {
      auto parsed =
          auditchain::schema::try_make_hash32(vm["anchor"].as<std::string>());
      if (!parsed) {
        std::cerr << "--anchor must be 64 hex characters\n";
        return kExitUsage;
      }
      anchor = *parsed;
    } else if (from > 1) {
      std::cerr << "--anchor is required when --from is past 1\n";
      return kExitUsage;
    }
    result = checker.verify_range(from, to, anchor);
  } else {
    result = checker.verify();
  }

  if (result.is_valid) {
    std::cout << "valid entries=" << result.entries_verified
              << " range=" << result.start_sequence << ".."
              << result.end_sequence << '\n';
    return kExitOk;
  }
  std::cout << "invalid first_invalid_sequence="
            << result.first_invalid_sequence.value_or(0)
            << " reason=" << result.reason << '\n';
  return kExitMismatch;
}

int run_tail(const po::variables_map& vm) {
  auto storage = open_read_only(vm["db"].as<std::string>());
  auto encoder = auditchain::ledger::encoder_t{};
  auto store = auditchain::ledger::ledger_store{encoder, storage};
  auto tail = store.tail();
  if (!tail) {
    std::cout << "empty\n";
    return kExitOk;
  }
  std::cout << "sequence=" << tail->sequence
            << " entry_hash=" << auditchain::schema::to_hex(tail->entry_hash)
            << " timestamp=" << tail->timestamp << '\n';
  return kExitOk;
}

int run_digest(const po::variables_map& vm) {
  const auto& path = vm["file"].as<std::string>();
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    std::cerr << "cannot read " << path << '\n';
    return kExitUsage;
  }
  auto contents = std::string{std::istreambuf_iterator<char>{file},
                              std::istreambuf_iterator<char>{}};
  auto actual = auditchain::schema::to_hex(
      auditchain::crypto::sha256::hash(std::string_view{contents}));
  auto expected = vm["expected"].as<std::string>();
  if (actual == expected) {
    std::cout << "match " << actual << '\n';
    return kExitOk;
  }
  std::cout << "mismatch expected=" << expected << " actual=" << actual
            << '\n';
  return kExitMismatch;
}

}  // namespace

int main(int argc, const char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("inspect"));
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto options = po::options_description{"auditchain_inspect options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "verify|tail|digest")(
      "db", po::value<std::string>(), "RocksDB directory of the ledger")(
      "from", po::value<uint64_t>(), "first sequence to verify")(
      "to", po::value<uint64_t>(), "last sequence to verify")(
      "anchor", po::value<std::string>(),
      "hex entry_hash of the entry before --from")(
      "file", po::value<std::string>(), "exported document")(
      "expected", po::value<std::string>(), "manifest hash hex")(
      "verbose,v", "log ledger activity to stderr");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return vm.contains("help") ? kExitOk : kExitUsage;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::info);
  }

  try {
    if (command == "verify" || command == "tail") {
      if (!vm.contains("db")) {
        std::cerr << command << " requires --db\n";
        return kExitUsage;
      }
      if (!std::filesystem::is_directory(vm["db"].as<std::string>())) {
        std::cerr << "no ledger at " << vm["db"].as<std::string>() << '\n';
        return kExitUsage;
      }
      return command == "verify" ? run_verify(vm) : run_tail(vm);
    }
    if (command == "digest") {
      if (!vm.contains("file") || !vm.contains("expected")) {
        std::cerr << "digest requires --file and --expected\n";
        return kExitUsage;
      }
      return run_digest(vm);
    }
  } catch (const auditchain::common::error& e) {
    std::cerr << auditchain::common::to_string(e.code()) << ": " << e.what()
              << '\n';
    return kExitUsage;
  }

  std::cerr << "command must be verify|tail|digest\n";
  return kExitUsage;
}

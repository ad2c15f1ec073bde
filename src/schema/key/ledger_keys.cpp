#include <auditchain/schema/key/builder.hpp>
#include <auditchain/schema/key/ledger_keys.hpp>
#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <cstring>

using namespace auditchain::schema;

namespace auditchain::schema::key {

bytes_t make_prefix_key(const std::string_view prefix) {
  return make_bytes(prefix);
}

bytes_t make_entry_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kEntryKeyPrefix);
  b.write(sequence);
  return b.data;
}

bytes_t make_tail_key() {
  return make_bytes(kTailKey);
}

bytes_t make_verification_key(const uint64_t id) {
  auto b = builder{};
  b.write(kVerificationKeyPrefix);
  b.write(id);
  return b.data;
}

bytes_t make_display_sensitive_key(const uint64_t sequence) {
  auto b = builder{};
  b.write(kDisplaySensitiveKeyPrefix);
  b.write(sequence);
  return b.data;
}

std::optional<uint64_t> try_parse_sequence_key(const std::string_view prefix,
                                               const bytes_view_t& key) {
  if (key.size() != prefix.size() + sizeof(uint64_t)) {
    return std::nullopt;
  }
  if (!std::equal(std::begin(prefix), std::end(prefix), std::begin(key),
                  [](const char lhs, const uint8_t rhs) {
                    return static_cast<uint8_t>(lhs) == rhs;
                  })) {
    return std::nullopt;
  }
  auto big = uint64_t{};
  std::memcpy(&big, key.data() + prefix.size(), sizeof(big));
  return boost::endian::big_to_native(big);
}

}  // namespace auditchain::schema::key

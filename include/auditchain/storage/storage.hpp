#pragma once
#include <auditchain/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditchain::storage {

using key_value_entry_t =
    std::pair<auditchain::schema::bytes_t, auditchain::schema::bytes_t>;

/// Open-time behaviour of a storage backend.
struct storage_options final {
  /// fsync every write batch before acknowledging it.
  bool sync_writes{true};
  /// Open without write access; every write reports failure.
  bool read_only{false};
  bool create_if_missing{true};
};

/// Outcome of a write. Write failures are reported, not fatal: the ledger
/// turns them into append errors and keeps serving.
struct write_status final {
  bool ok{true};
  std::string message;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const auditchain::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  write_status put(Encoder& encoder,
                   const auditchain::schema::bytes_view_t& key,
                   const T& value);

  /// Persist every pair or none of them.
  write_status write_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const auditchain::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              const storage_options& options);

}  // namespace auditchain::storage

#pragma once
#include <auditchain/schema/primitives.hpp>
#include <memory>
#include <span>
#include <string_view>

struct evp_md_ctx_st;

namespace auditchain::crypto {

/// Incremental SHA-256 over OpenSSL EVP. Fatal if OpenSSL cannot provide the
/// digest; a ledger without its hash function cannot run.
class sha256 final {
 public:
  sha256();
  ~sha256();
  sha256(const sha256&) = delete;
  sha256& operator=(const sha256&) = delete;
  sha256(sha256&&) noexcept;
  sha256& operator=(sha256&&) noexcept;

  sha256& update(const auditchain::schema::bytes_view_t& bytes);
  sha256& update(const std::string_view& str);
  auditchain::schema::hash32_t finalize();

  static auditchain::schema::hash32_t hash(
      const auditchain::schema::bytes_view_t& bytes);
  static auditchain::schema::hash32_t hash(const std::string_view& str);

 private:
  struct ctx_deleter final {
    void operator()(evp_md_ctx_st* ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, ctx_deleter> ctx_;
};

}  // namespace auditchain::crypto

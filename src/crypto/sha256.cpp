#include <auditchain/common/critical.hpp>
#include <auditchain/crypto/sha256.hpp>

#include <openssl/evp.h>

namespace auditchain::crypto {

void sha256::ctx_deleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

sha256::sha256() : ctx_{EVP_MD_CTX_new()} {
  if (!ctx_) {
    auditchain::common::critical("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    auditchain::common::critical("EVP_DigestInit_ex(sha256) failed");
  }
}

sha256::~sha256() = default;
sha256::sha256(sha256&&) noexcept = default;
sha256& sha256::operator=(sha256&&) noexcept = default;

sha256& sha256::update(const auditchain::schema::bytes_view_t& bytes) {
  if (bytes.empty()) {
    return *this;
  }
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
    auditchain::common::critical("EVP_DigestUpdate failed");
  }
  return *this;
}

sha256& sha256::update(const std::string_view& str) {
  return update(auditchain::schema::make_bytes_view(str));
}

auditchain::schema::hash32_t sha256::finalize() {
  auto output = auditchain::schema::hash32_t{};
  auto size = 0u;
  if (EVP_DigestFinal_ex(ctx_.get(), output.data(), &size) != 1 ||
      size != output.size()) {
    auditchain::common::critical("EVP_DigestFinal_ex failed, digest size {}",
                                 size);
  }
  return output;
}

auditchain::schema::hash32_t sha256::hash(
    const auditchain::schema::bytes_view_t& bytes) {
  return sha256{}.update(bytes).finalize();
}

auditchain::schema::hash32_t sha256::hash(const std::string_view& str) {
  return sha256{}.update(str).finalize();
}

}  // namespace auditchain::crypto

#include <auditchain/canonical/encoder.hpp>
#include <auditchain/chain/hash_chain.hpp>
#include <auditchain/crypto/sha256.hpp>

namespace auditchain::chain {

auditchain::schema::hash32_t genesis_hash() {
  return auditchain::schema::make_zero_hash();
}

auditchain::schema::hash32_t compute_hash(
    const auditchain::schema::hash32_t& prev_hash,
    const auditchain::schema::bytes_view_t& canonical_bytes) {
  return auditchain::crypto::sha256{}
      .update(auditchain::schema::bytes_view_t{prev_hash})
      .update(canonical_bytes)
      .finalize();
}

auditchain::schema::hash32_t compute_entry_hash(
    const auditchain::schema::audit_log_entry_t& entry) {
  auto canonical = auditchain::canonical::encode(entry);
  return compute_hash(entry.prev_hash,
                      auditchain::schema::make_bytes_view(canonical));
}

}  // namespace auditchain::chain

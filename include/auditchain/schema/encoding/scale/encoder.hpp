#pragma once
#include <auditchain/common/critical.hpp>
#include <auditchain/schema/encoding/encoder.hpp>
#include <auditchain/schema/encoding/scale/action_category.hpp>
#include <auditchain/schema/encoding/scale/actor.hpp>
#include <auditchain/schema/encoding/scale/audit_action.hpp>
#include <auditchain/schema/encoding/scale/audit_log_entry.hpp>
#include <auditchain/schema/encoding/scale/audit_verification.hpp>
#include <auditchain/schema/encoding/scale/field_value.hpp>
#include <auditchain/schema/encoding/scale/ledger_tail.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace auditchain::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  auditchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, auditchain::schema::bytes_t& out);

  template <typename T>
  T decode(const auditchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const auditchain::schema::bytes_view_t& bytes);
};

template <typename T>
auditchain::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    auditchain::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        auditchain::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const auditchain::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    auditchain::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const auditchain::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace auditchain::schema::encoding

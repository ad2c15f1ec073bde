#pragma once
#include <auditchain/schema/primitives.hpp>
#include <optional>
#include <span>

namespace auditchain::schema::encoding {

// Storage encoding is picked at build time by tag; callers name
// encoder<scale_encoder_tag> and never the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  auditchain::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, auditchain::schema::bytes_t& out);

  template <typename T>
  T decode(const auditchain::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const auditchain::schema::bytes_view_t& bytes);
};

}  // namespace auditchain::schema::encoding

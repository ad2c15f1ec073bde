#include <auditchain/schema/encoding/scale/field_value.hpp>
#include <bit>
#include <cstdint>

using namespace auditchain::schema;

namespace {

enum class value_tag : uint8_t {
  null = 0,
  boolean = 1,
  integer = 2,
  real = 3,
  text = 4,
  list = 5,
};

template <typename Variant>
void encode_alternative(const Variant& value, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(static_cast<uint8_t>(value.index()), encoder);
  std::visit(overloaded{[](const null_value_t&) {},
                        [&encoder](const bool& arg) { encode(arg, encoder); },
                        [&encoder](const int64_t& arg) { encode(arg, encoder); },
                        [&encoder](const double& arg) {
                          encode(std::bit_cast<uint64_t>(arg), encoder);
                        },
                        [&encoder](const std::string& arg) {
                          encode(arg, encoder);
                        },
                        [&encoder](const list_value_t& arg) {
                          encode(static_cast<uint32_t>(arg.size()), encoder);
                          for (const auto& item : arg) {
                            encode_alternative(item, encoder);
                          }
                        }},
             value);
}

template <typename Variant>
Variant decode_alternative(::scale::Decoder& decoder, bool allow_list) {
  using ::scale::decode;
  auto tag = uint8_t{};
  decode(tag, decoder);
  switch (static_cast<value_tag>(tag)) {
    case value_tag::null:
      return Variant{null_value_t{}};
    case value_tag::boolean: {
      auto value = bool{};
      decode(value, decoder);
      return Variant{value};
    }
    case value_tag::integer: {
      auto value = int64_t{};
      decode(value, decoder);
      return Variant{value};
    }
    case value_tag::real: {
      auto bits = uint64_t{};
      decode(bits, decoder);
      return Variant{std::bit_cast<double>(bits)};
    }
    case value_tag::text: {
      auto value = std::string{};
      decode(value, decoder);
      return Variant{std::move(value)};
    }
    case value_tag::list:
      if constexpr (std::is_same_v<Variant, field_value_t>) {
        if (allow_list) {
          auto count = uint32_t{};
          decode(count, decoder);
          // count comes from stored bytes; grow as items actually decode.
          auto items = list_value_t{};
          for (auto i = uint32_t{0}; i < count; ++i) {
            items.push_back(
                decode_alternative<scalar_value_t>(decoder, false));
          }
          return Variant{std::move(items)};
        }
      }
      break;
  }
  ::scale::raise(::scale::DecodeError::UNEXPECTED_VALUE);
}

}  // namespace

namespace auditchain::schema {

void encode(const field_value_t& o, ::scale::Encoder& encoder) {
  encode_alternative(o, encoder);
}

void decode(field_value_t& o, ::scale::Decoder& decoder) {
  o = decode_alternative<field_value_t>(decoder, true);
}

void encode(const field_map_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(static_cast<uint32_t>(o.size()), encoder);
  for (const auto& [key, value] : o) {
    ::scale::encode(key, encoder);
    encode(value, encoder);
  }
}

void decode(field_map_t& o, ::scale::Decoder& decoder) {
  auto count = uint32_t{};
  ::scale::decode(count, decoder);
  o.clear();
  for (auto i = uint32_t{0}; i < count; ++i) {
    auto key = std::string{};
    ::scale::decode(key, decoder);
    auto value = field_value_t{};
    decode(value, decoder);
    o.emplace(std::move(key), std::move(value));
  }
}

}  // namespace auditchain::schema

#pragma once
#include <tally/common/critical.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/scale/account.hpp>
#include <tally/schema/encoding/scale/account_balance.hpp>
#include <tally/schema/encoding/scale/cash_bank_register.hpp>
#include <tally/schema/encoding/scale/consistency_warning.hpp>
#include <tally/schema/encoding/scale/journal_entry.hpp>
#include <tally/schema/encoding/scale/journal_line.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace tally::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  tally::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tally::schema::bytes_t& out);

  template <typename T>
  T decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const tally::schema::bytes_view_t& bytes);

  template <typename T>
  tally::schema::bytes_t encode_record(const T& record);

  template <typename T>
  std::optional<T> try_decode_record(const tally::schema::bytes_view_t& bytes);
};

template <typename T>
tally::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    tally::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        tally::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    tally::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const tally::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

template <typename T>
tally::schema::bytes_t encoder<scale_encoder_tag>::encode_record(
    const T& record) {
  return encode(record_traits<T>::to_record(record));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode_record(
    const tally::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<typename record_traits<T>::type>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return record_traits<T>::from_record(*decoded);
}

}  // namespace tally::schema::encoding

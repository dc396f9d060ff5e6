#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tally::schema::encoding {

/// Build-time selected value codec. Schema records go through
/// `record_traits<T>` so that only standard types reach the library.
template <typename Library>
struct encoder {
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

/// Specialised per schema record: `using type = std::tuple<...>`,
/// `static type to_record(const T&)`, `static std::optional<T>
/// from_record(const type&)`.
template <typename T>
struct record_traits;

}  // namespace tally::schema::encoding

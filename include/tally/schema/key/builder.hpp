#pragma once
#include <tally/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>

namespace tally::schema::key {

/// Longest string `write_sized` accepts.
inline constexpr auto kMaxSizedLength =
    std::size_t{std::numeric_limits<uint16_t>::max()};

/// Byte-key builder. Integers are written big-endian so that RocksDB's
/// lexicographic key order matches numeric order.
struct builder final {
  tally::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Length-prefixed string; keeps "A|B" + "C" distinct from "A" + "B|C".
  /// Throws std::length_error past kMaxSizedLength rather than truncating.
  builder& write_sized(const std::string_view& str);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto bytes = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), bytes, bytes + sizeof(T));
    return *this;
  }
};

}  // namespace tally::schema::key

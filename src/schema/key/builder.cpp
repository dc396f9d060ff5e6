#include <algorithm>
#include <tally/schema/key/builder.hpp>
#include <iterator>
#include <ranges>
#include <stdexcept>

using namespace tally::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write_sized(const std::string_view& str) {
  if (str.size() > kMaxSizedLength) {
    throw std::length_error{"key component longer than 65535 bytes"};
  }
  write(static_cast<uint16_t>(str.size()));
  return write(str);
}

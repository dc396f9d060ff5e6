#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tally::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

using account_id_t = uint64_t;
using entry_id_t = uint64_t;
using source_id_t = uint64_t;
using register_id_t = uint64_t;
using warning_id_t = uint64_t;

/// Signed count of minor currency units (see amount.hpp).
using amount_t = int64_t;

/// Calendar date packed as YYYYMMDD (see calendar_date.hpp).
using calendar_date_t = uint32_t;

using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_zero_hash();
std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

/// Wall-clock milliseconds since the Unix epoch.
timestamp_milliseconds_t now_milliseconds();

}  // namespace tally::schema

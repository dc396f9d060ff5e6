#pragma once
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace tally::blake3 {

tally::schema::hash32_t hash(const std::string_view& str);
tally::schema::hash32_t hash(const tally::schema::bytes_view_t& bytes);

}  // namespace tally::blake3

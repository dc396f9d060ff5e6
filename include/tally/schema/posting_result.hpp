#pragma once

#include <tally/schema/journal_entry.hpp>
#include <tally/schema/journal_line.hpp>
#include <tally/schema/posting_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tally::schema {

template <uint16_t Version>
struct posting_result;

template <>
struct posting_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  /// True when the key was already posted and the existing entry is returned.
  bool replayed{};
  std::optional<journal_entry_t> entry;
  std::vector<journal_line_t> lines;

  bool ok() const { return code == 0; }
  posting_error_code error() const {
    return static_cast<posting_error_code>(code);
  }
};

using posting_result_t = posting_result<1>;

inline posting_result_t make_error(const posting_error_code code,
                                   std::string log,
                                   std::string info,
                                   std::string codespace) {
  auto result = posting_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::move(codespace);
  return result;
}

}  // namespace tally::schema

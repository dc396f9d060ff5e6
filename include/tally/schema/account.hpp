#pragma once
#include <tally/schema/account_class.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: account.
// Chart of accounts node. Header accounts only aggregate their children and
// are never a posting target; retired accounts stay on file (active=false).
namespace tally::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  account_id_t id{};
  std::string code;
  std::string name;
  account_class_t account_class{account_class_t::asset};
  bool is_header{};
  bool active{true};
  std::optional<account_id_t> parent_id;
};

using account_t = account<1>;

/// Input to directory maintenance; the directory resolves the parent code and
/// assigns the id.
struct account_definition final {
  std::string code;
  std::string name;
  account_class_t account_class{account_class_t::asset};
  bool is_header{};
  std::optional<std::string> parent_code;
};

}  // namespace tally::schema

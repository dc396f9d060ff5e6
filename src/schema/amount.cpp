#include <tally/schema/amount.hpp>

#include <limits>

namespace tally::schema {

namespace {

constexpr auto kMax = std::numeric_limits<amount_t>::max();
constexpr auto kMin = std::numeric_limits<amount_t>::min();

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

}  // namespace

std::optional<amount_t> checked_add(const amount_t lhs, const amount_t rhs) {
  if ((rhs > 0 && lhs > kMax - rhs) || (rhs < 0 && lhs < kMin - rhs)) {
    return std::nullopt;
  }
  return lhs + rhs;
}

std::optional<amount_t> checked_subtract(const amount_t lhs,
                                         const amount_t rhs) {
  if ((rhs < 0 && lhs > kMax + rhs) || (rhs > 0 && lhs < kMin + rhs)) {
    return std::nullopt;
  }
  return lhs - rhs;
}

std::optional<amount_t> checked_negate(const amount_t value) {
  if (value == kMin) {
    return std::nullopt;
  }
  return -value;
}

std::optional<amount_t> apply_sign(const int64_t sign, const amount_t value) {
  if (sign >= 0) {
    return value;
  }
  return checked_negate(value);
}

std::optional<amount_t> try_parse_amount(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  auto whole = text;
  auto fraction = std::string_view{};
  if (auto dot = text.find('.'); dot != std::string_view::npos) {
    whole = text.substr(0, dot);
    fraction = text.substr(dot + 1);
    if (fraction.empty() || fraction.size() > kAmountDecimals) {
      return std::nullopt;
    }
  }
  if (whole.empty()) {
    return std::nullopt;
  }

  // Accumulate as a negative number so that the int64 minimum parses too.
  auto value = amount_t{0};
  auto accumulate = [&value](const char c) {
    if (!is_digit(c) || value < (kMin + (c - '0')) / 10) {
      return false;
    }
    value = (value * 10) - (c - '0');
    return true;
  };
  for (const auto c : whole) {
    if (!accumulate(c)) {
      return std::nullopt;
    }
  }
  for (auto i = 0; i < kAmountDecimals; ++i) {
    const auto c = i < static_cast<int>(fraction.size()) ? fraction[i] : '0';
    if (!accumulate(c)) {
      return std::nullopt;
    }
  }

  if (negative) {
    return value;
  }
  return checked_negate(value);
}

std::string format_amount(const amount_t value) {
  // Work on the magnitude as unsigned so int64 minimum formats correctly.
  auto magnitude = value < 0 ? uint64_t{0} - static_cast<uint64_t>(value)
                             : static_cast<uint64_t>(value);
  const auto scale = static_cast<uint64_t>(kAmountScale);
  auto fraction = std::to_string(magnitude % scale);
  if (fraction.size() < static_cast<std::size_t>(kAmountDecimals)) {
    fraction.insert(0, kAmountDecimals - fraction.size(), '0');
  }
  auto out = std::string{};
  if (value < 0) {
    out.push_back('-');
  }
  out.append(std::to_string(magnitude / scale));
  out.push_back('.');
  out.append(fraction);
  return out;
}

}  // namespace tally::schema

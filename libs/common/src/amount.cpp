#include "paycore/common/amount.hpp"

#include <limits>

namespace paycore {
namespace common {

namespace {

constexpr std::int64_t kMaxUnits = std::numeric_limits<std::int64_t>::max();

bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

bool is_space(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

// Appends one decimal digit to a non-negative accumulator, false on overflow.
bool push_digit(std::int64_t& value, char digit) noexcept {
  const std::int64_t d = digit - '0';
  if (value > (kMaxUnits - d) / 10) {
    return false;
  }
  value = value * 10 + d;
  return true;
}

}  // namespace

std::optional<Amount> Amount::parse(std::string_view text, PrecisionPolicy policy) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }

  std::int64_t units = 0;
  for (char c : whole) {
    if (!is_digit(c) || !push_digit(units, c)) {
      return std::nullopt;
    }
  }

  for (std::size_t i = 0; i < fraction.size(); ++i) {
    const char c = fraction[i];
    if (!is_digit(c)) {
      return std::nullopt;
    }
    if (i >= static_cast<std::size_t>(kScaleDigits)) {
      if (policy == PrecisionPolicy::kReject && c != '0') {
        return std::nullopt;
      }
      continue;
    }
    if (!push_digit(units, c)) {
      return std::nullopt;
    }
  }

  for (std::size_t i = fraction.size(); i < static_cast<std::size_t>(kScaleDigits); ++i) {
    if (!push_digit(units, '0')) {
      return std::nullopt;
    }
  }

  return from_units(negative ? -units : units);
}

std::optional<Amount> Amount::checked_add(Amount other) const noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if ((other.units_ > 0 && units_ > kMax - other.units_) || (other.units_ < 0 && units_ < kMin - other.units_)) {
    return std::nullopt;
  }
  return from_units(units_ + other.units_);
}

std::optional<Amount> Amount::checked_sub(Amount other) const noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if ((other.units_ < 0 && units_ > kMax + other.units_) || (other.units_ > 0 && units_ < kMin + other.units_)) {
    return std::nullopt;
  }
  return from_units(units_ - other.units_);
}

std::string Amount::to_string() const {
  // Magnitude in unsigned space so INT64_MIN renders correctly.
  const std::uint64_t magnitude = units_ < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(units_)
                                             : static_cast<std::uint64_t>(units_);
  const std::uint64_t scale = static_cast<std::uint64_t>(kScale);

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, static_cast<std::size_t>(kScaleDigits) - fraction.size(), '0');

  std::string out;
  if (units_ < 0) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / scale);
  out.push_back('.');
  out += fraction;
  return out;
}

}  // namespace common
}  // namespace paycore

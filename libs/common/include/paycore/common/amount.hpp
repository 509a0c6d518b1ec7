#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paycore {
namespace common {

// How Amount::parse treats digits past the fourth fractional place.
enum class PrecisionPolicy : std::uint8_t {
  kTruncate,  // round toward zero
  kReject,
};

// Signed fixed-point decimal with four fractional digits, stored as a count
// of 1/10000 units.
class Amount {
 public:
  static constexpr int kScaleDigits = 4;
  static constexpr std::int64_t kScale = 10'000;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) noexcept {
    Amount amount;
    amount.units_ = units;
    return amount;
  }
  [[nodiscard]] static constexpr Amount zero() noexcept { return Amount{}; }

  [[nodiscard]] static std::optional<Amount> parse(std::string_view text,
                                                   PrecisionPolicy policy = PrecisionPolicy::kTruncate);

  [[nodiscard]] std::optional<Amount> checked_add(Amount other) const noexcept;
  [[nodiscard]] std::optional<Amount> checked_sub(Amount other) const noexcept;

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }

  // Always renders exactly four fractional digits, e.g. "-0.5000".
  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(const Amount&, const Amount&) noexcept = default;
  friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;

 private:
  std::int64_t units_{0};
};

}  // namespace common
}  // namespace paycore

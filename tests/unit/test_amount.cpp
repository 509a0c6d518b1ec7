#include "test_amount.hpp"

#include <cassert>
#include <limits>
#include "paycore/common/amount.hpp"

namespace paycore::tests {

using common::Amount;
using common::PrecisionPolicy;

void test_amount_parse() {
  assert(Amount::parse("10")->units() == 100'000);
  assert(Amount::parse("10.0000")->units() == 100'000);
  assert(Amount::parse("1.5")->units() == 15'000);
  assert(Amount::parse(" 2.25 ")->units() == 22'500);
  assert(Amount::parse(".5")->units() == 5'000);
  assert(Amount::parse("3.")->units() == 30'000);
  assert(Amount::parse("+0.0001")->units() == 1);
  assert(Amount::parse("-1.25")->units() == -12'500);

  assert(!Amount::parse(""));
  assert(!Amount::parse("   "));
  assert(!Amount::parse("."));
  assert(!Amount::parse("-"));
  assert(!Amount::parse("abc"));
  assert(!Amount::parse("1.2.3"));
  assert(!Amount::parse("1,5"));
  assert(!Amount::parse("1e5"));
  assert(!Amount::parse("99999999999999999999"));
}

void test_amount_precision_policy() {
  // Truncation rounds toward zero at the fourth fractional digit.
  assert(Amount::parse("1.23459")->units() == 12'345);
  assert(Amount::parse("-1.23459")->units() == -12'345);
  assert(Amount::parse("0.00009")->units() == 0);
  assert(Amount::parse("1.23459", PrecisionPolicy::kTruncate)->units() == 12'345);

  assert(!Amount::parse("1.23459", PrecisionPolicy::kReject));
  assert(!Amount::parse("0.00001", PrecisionPolicy::kReject));
  // Trailing zeros carry no extra precision.
  assert(Amount::parse("1.234500", PrecisionPolicy::kReject)->units() == 12'345);
  assert(Amount::parse("1.2345", PrecisionPolicy::kReject)->units() == 12'345);
}

void test_amount_arithmetic() {
  const auto ten = Amount::from_units(100'000);
  const auto three = Amount::from_units(30'000);

  assert(ten.checked_add(three) == Amount::from_units(130'000));
  assert(ten.checked_sub(three) == Amount::from_units(70'000));
  assert(three.checked_sub(ten) == Amount::from_units(-70'000));
  assert(three.checked_sub(ten)->is_negative());

  const auto max = Amount::from_units(std::numeric_limits<std::int64_t>::max());
  const auto min = Amount::from_units(std::numeric_limits<std::int64_t>::min());
  assert(!max.checked_add(Amount::from_units(1)));
  assert(!min.checked_sub(Amount::from_units(1)));
  assert(max.checked_add(Amount::zero()) == max);
  assert(!min.checked_add(Amount::from_units(-1)));
  assert(!max.checked_sub(Amount::from_units(-1)));
  assert(!Amount::zero().checked_sub(min));
  assert(Amount::zero().checked_sub(max) == Amount::from_units(-std::numeric_limits<std::int64_t>::max()));
  assert(min.checked_add(max) == Amount::from_units(-1));
  assert(max.checked_sub(max) == Amount::zero());
  assert(min.checked_sub(Amount::from_units(-1)) == Amount::from_units(std::numeric_limits<std::int64_t>::min() + 1));

  assert(three < ten);
  assert(ten > three);
  assert(Amount::parse("1.5") == Amount::parse("1.50000"));
  assert(Amount::zero() == Amount{});
  assert(!Amount::parse("-0")->is_negative());
}

void test_amount_to_string() {
  assert(Amount::from_units(314).to_string() == "0.0314");
  assert(Amount::from_units(-110'023'945'800).to_string() == "-11002394.5800");
  assert(Amount::from_units(-5'000).to_string() == "-0.5000");
  assert(Amount::zero().to_string() == "0.0000");
  assert(Amount::parse("12")->to_string() == "12.0000");
  assert(Amount::from_units(std::numeric_limits<std::int64_t>::min()).to_string() == "-922337203685477.5808");
}

}  // namespace paycore::tests

#include "paycore/ledger/account.hpp"

#include <stdexcept>
#include <string>

namespace paycore {
namespace ledger {

namespace {

[[noreturn]] void invariant_failure(common::ClientId client, const char* what) {
  throw std::logic_error("account " + std::to_string(client) + ": " + what);
}

}  // namespace

common::Amount Account::total() const {
  const auto total = available_.checked_add(held_);
  if (!total) {
    invariant_failure(client_, "total overflows");
  }
  return *total;
}

AccountView Account::view() const {
  return AccountView{
      .client = client_,
      .available = available_,
      .held = held_,
      .total = total(),
      .locked = locked_,
  };
}

bool Account::credit(common::Amount amount) {
  const auto available = available_.checked_add(amount);
  if (!available || !available->checked_add(held_)) {
    return false;
  }
  available_ = *available;
  return true;
}

bool Account::debit(common::Amount amount) {
  if (available_ < amount) {
    return false;
  }
  available_ = *available_.checked_sub(amount);
  return true;
}

bool Account::hold(common::Amount amount) {
  if (available_ < amount) {
    return false;
  }
  available_ = *available_.checked_sub(amount);
  held_ = *held_.checked_add(amount);
  return true;
}

void Account::release(common::Amount amount) {
  if (held_ < amount) {
    invariant_failure(client_, "release exceeds held funds");
  }
  held_ = *held_.checked_sub(amount);
  available_ = *available_.checked_add(amount);
}

void Account::charge_back(common::Amount amount) {
  if (held_ < amount) {
    invariant_failure(client_, "chargeback exceeds held funds");
  }
  held_ = *held_.checked_sub(amount);
  locked_ = true;
}

void Account::check_invariants() const {
  if (available_.is_negative()) {
    invariant_failure(client_, "available is negative");
  }
  if (held_.is_negative()) {
    invariant_failure(client_, "held is negative");
  }
  static_cast<void>(total());
}

}  // namespace ledger
}  // namespace paycore

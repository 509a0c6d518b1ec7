#pragma once

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

struct AccountView {
  common::ClientId client{0};
  common::Amount available{};
  common::Amount held{};
  common::Amount total{};
  bool locked{false};

  friend bool operator==(const AccountView&, const AccountView&) = default;
};

// Balance state of one client. Mutated only by Ledger, which decides whether
// a record is allowed to touch the account at all.
class Account {
 public:
  explicit Account(common::ClientId client) noexcept : client_(client) {}

  [[nodiscard]] common::ClientId client() const noexcept { return client_; }
  [[nodiscard]] common::Amount available() const noexcept { return available_; }
  [[nodiscard]] common::Amount held() const noexcept { return held_; }
  [[nodiscard]] bool locked() const noexcept { return locked_; }
  [[nodiscard]] common::Amount total() const;
  [[nodiscard]] AccountView view() const;

  // Returns false and leaves the account unchanged when available or total
  // would overflow.
  [[nodiscard]] bool credit(common::Amount amount);
  // Returns false and leaves the account unchanged when available < amount.
  [[nodiscard]] bool debit(common::Amount amount);
  // Moves amount from available to held; false when available < amount.
  [[nodiscard]] bool hold(common::Amount amount);
  // Moves amount from held back to available.
  void release(common::Amount amount);
  // Removes amount from held and locks the account permanently.
  void charge_back(common::Amount amount);

  // Throws std::logic_error when available/held are negative or total is not
  // representable.
  void check_invariants() const;

 private:
  common::ClientId client_;
  common::Amount available_{};
  common::Amount held_{};
  bool locked_{false};
};

}  // namespace ledger
}  // namespace paycore

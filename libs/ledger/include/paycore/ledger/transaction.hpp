#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include "paycore/common/amount.hpp"
#include "paycore/common/types.hpp"

namespace paycore {
namespace ledger {

enum class TransactionKind : std::uint8_t {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

struct Deposit {
  common::ClientId client{0};
  common::TransactionId tx{0};
  common::Amount amount{};
};

struct Withdrawal {
  common::ClientId client{0};
  common::TransactionId tx{0};
  common::Amount amount{};
};

// Dispute, Resolve and Chargeback reference an earlier Deposit/Withdrawal by tx.
struct Dispute {
  common::ClientId client{0};
  common::TransactionId tx{0};
};

struct Resolve {
  common::ClientId client{0};
  common::TransactionId tx{0};
};

struct Chargeback {
  common::ClientId client{0};
  common::TransactionId tx{0};
};

using TransactionRecord = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

[[nodiscard]] common::ClientId client_of(const TransactionRecord& record) noexcept;
[[nodiscard]] common::TransactionId tx_of(const TransactionRecord& record) noexcept;
[[nodiscard]] TransactionKind kind_of(const TransactionRecord& record) noexcept;

[[nodiscard]] std::string_view to_string(TransactionKind kind) noexcept;

}  // namespace ledger
}  // namespace paycore

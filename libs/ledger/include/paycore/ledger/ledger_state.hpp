#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "paycore/common/types.hpp"
#include "paycore/ledger/account.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ledger {

enum class Decision : std::uint8_t {
  kAccepted,
  kRejectedLocked,
  kRejectedInsufficientFunds,
  kRejectedDuplicateTransaction,
  kRejectedUnknownTransaction,
  kRejectedClientMismatch,
  kRejectedInvalidState,
  kRejectedInvalidAmount,
  kRejectedAmountOverflow,  // last; kDecisionCount derives from it
};

inline constexpr std::size_t kDecisionCount = static_cast<std::size_t>(Decision::kRejectedAmountOverflow) + 1;

[[nodiscard]] std::string_view to_string(Decision decision) noexcept;

enum class DisputeStatus : std::uint8_t {
  kNone,
  kDisputed,
  kResolved,
  kChargedBack,
};

[[nodiscard]] std::string_view to_string(DisputeStatus status) noexcept;

// Retained for every accepted Deposit/Withdrawal so later disputes can find it.
struct HistoryEntry {
  common::ClientId client{0};
  common::Amount amount{};
  TransactionKind kind{TransactionKind::kDeposit};
  DisputeStatus status{DisputeStatus::kNone};
};

struct LedgerStats {
  std::uint64_t applied{0};
  std::uint64_t accepted{0};
  std::uint64_t rejected{0};
  std::array<std::uint64_t, kDecisionCount> by_decision{};

  [[nodiscard]] std::uint64_t count(Decision decision) const noexcept {
    return by_decision[static_cast<std::size_t>(decision)];
  }
};

class Ledger {
 public:
  // Applies one record. Business rule violations are reported through the
  // returned Decision and leave balances and history untouched; they never
  // throw. A broken account invariant throws std::logic_error.
  Decision apply(const TransactionRecord& record);

  // One view per referenced client, ordered by client id.
  [[nodiscard]] std::vector<AccountView> snapshot() const;

  [[nodiscard]] const Account* find_account(common::ClientId client) const;
  [[nodiscard]] const HistoryEntry* find_transaction(common::TransactionId tx) const;
  [[nodiscard]] std::size_t account_count() const noexcept { return accounts_.size(); }
  [[nodiscard]] const LedgerStats& stats() const noexcept { return stats_; }

 private:
  std::unordered_map<common::ClientId, Account> accounts_{};
  std::unordered_map<common::TransactionId, HistoryEntry> history_{};
  LedgerStats stats_{};

  Decision handle(Account& account, const Deposit& deposit);
  Decision handle(Account& account, const Withdrawal& withdrawal);
  Decision handle(Account& account, const Dispute& dispute);
  Decision handle(Account& account, const Resolve& resolve);
  Decision handle(Account& account, const Chargeback& chargeback);

  Account& ensure_account(common::ClientId client);
  // Shared lookup for the dispute lifecycle: the entry must exist, belong to
  // client and currently be in expected.
  Decision find_disputable(common::ClientId client, common::TransactionId tx, DisputeStatus expected,
                           HistoryEntry*& out_entry);
  void count_decision(Decision decision) noexcept;
};

}  // namespace ledger
}  // namespace paycore

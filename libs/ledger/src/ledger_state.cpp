#include "paycore/ledger/ledger_state.hpp"

#include <algorithm>

namespace paycore {
namespace ledger {

std::string_view to_string(Decision decision) noexcept {
  switch (decision) {
    case Decision::kAccepted:
      return "accepted";
    case Decision::kRejectedLocked:
      return "account locked";
    case Decision::kRejectedInsufficientFunds:
      return "insufficient available funds";
    case Decision::kRejectedDuplicateTransaction:
      return "duplicate transaction id";
    case Decision::kRejectedUnknownTransaction:
      return "unknown transaction id";
    case Decision::kRejectedClientMismatch:
      return "transaction belongs to another client";
    case Decision::kRejectedInvalidState:
      return "invalid dispute state transition";
    case Decision::kRejectedInvalidAmount:
      return "negative amount";
    case Decision::kRejectedAmountOverflow:
      return "amount overflow";
  }
  return "unknown";
}

std::string_view to_string(DisputeStatus status) noexcept {
  switch (status) {
    case DisputeStatus::kNone:
      return "none";
    case DisputeStatus::kDisputed:
      return "disputed";
    case DisputeStatus::kResolved:
      return "resolved";
    case DisputeStatus::kChargedBack:
      return "charged back";
  }
  return "unknown";
}

Decision Ledger::apply(const TransactionRecord& record) {
  // Every referenced client gets an account, even if the record is rejected.
  auto& account = ensure_account(client_of(record));

  const Decision decision = std::visit([&](const auto& r) { return handle(account, r); }, record);
  if (decision == Decision::kAccepted) {
    account.check_invariants();
  }
  count_decision(decision);
  return decision;
}

std::vector<AccountView> Ledger::snapshot() const {
  std::vector<AccountView> views;
  views.reserve(accounts_.size());
  for (const auto& [client, account] : accounts_) {
    views.push_back(account.view());
  }
  std::sort(views.begin(), views.end(), [](const AccountView& lhs, const AccountView& rhs) {
    return lhs.client < rhs.client;
  });
  return views;
}

const Account* Ledger::find_account(common::ClientId client) const {
  auto it = accounts_.find(client);
  if (it == accounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

const HistoryEntry* Ledger::find_transaction(common::TransactionId tx) const {
  auto it = history_.find(tx);
  if (it == history_.end()) {
    return nullptr;
  }
  return &it->second;
}

Decision Ledger::handle(Account& account, const Deposit& deposit) {
  if (deposit.amount.is_negative()) {
    return Decision::kRejectedInvalidAmount;
  }
  if (account.locked()) {
    return Decision::kRejectedLocked;
  }
  if (history_.contains(deposit.tx)) {
    return Decision::kRejectedDuplicateTransaction;
  }
  if (!account.credit(deposit.amount)) {
    return Decision::kRejectedAmountOverflow;
  }
  history_.emplace(deposit.tx, HistoryEntry{
                                   .client = deposit.client,
                                   .amount = deposit.amount,
                                   .kind = TransactionKind::kDeposit,
                                   .status = DisputeStatus::kNone,
                               });
  return Decision::kAccepted;
}

Decision Ledger::handle(Account& account, const Withdrawal& withdrawal) {
  if (withdrawal.amount.is_negative()) {
    return Decision::kRejectedInvalidAmount;
  }
  if (account.locked()) {
    return Decision::kRejectedLocked;
  }
  if (history_.contains(withdrawal.tx)) {
    return Decision::kRejectedDuplicateTransaction;
  }
  if (!account.debit(withdrawal.amount)) {
    return Decision::kRejectedInsufficientFunds;
  }
  history_.emplace(withdrawal.tx, HistoryEntry{
                                      .client = withdrawal.client,
                                      .amount = withdrawal.amount,
                                      .kind = TransactionKind::kWithdrawal,
                                      .status = DisputeStatus::kNone,
                                  });
  return Decision::kAccepted;
}

Decision Ledger::handle(Account& account, const Dispute& dispute) {
  HistoryEntry* entry = nullptr;
  if (const auto decision = find_disputable(dispute.client, dispute.tx, DisputeStatus::kNone, entry);
      decision != Decision::kAccepted) {
    return decision;
  }
  // Funds already spent cannot be frozen without breaking available >= 0.
  if (!account.hold(entry->amount)) {
    return Decision::kRejectedInsufficientFunds;
  }
  entry->status = DisputeStatus::kDisputed;
  return Decision::kAccepted;
}

Decision Ledger::handle(Account& account, const Resolve& resolve) {
  HistoryEntry* entry = nullptr;
  if (const auto decision = find_disputable(resolve.client, resolve.tx, DisputeStatus::kDisputed, entry);
      decision != Decision::kAccepted) {
    return decision;
  }
  account.release(entry->amount);
  entry->status = DisputeStatus::kResolved;
  return Decision::kAccepted;
}

Decision Ledger::handle(Account& account, const Chargeback& chargeback) {
  HistoryEntry* entry = nullptr;
  if (const auto decision = find_disputable(chargeback.client, chargeback.tx, DisputeStatus::kDisputed, entry);
      decision != Decision::kAccepted) {
    return decision;
  }
  account.charge_back(entry->amount);
  entry->status = DisputeStatus::kChargedBack;
  return Decision::kAccepted;
}

Account& Ledger::ensure_account(common::ClientId client) {
  return accounts_.try_emplace(client, client).first->second;
}

Decision Ledger::find_disputable(common::ClientId client, common::TransactionId tx, DisputeStatus expected,
                                 HistoryEntry*& out_entry) {
  auto it = history_.find(tx);
  if (it == history_.end()) {
    return Decision::kRejectedUnknownTransaction;
  }
  if (it->second.client != client) {
    return Decision::kRejectedClientMismatch;
  }
  if (it->second.status != expected) {
    return Decision::kRejectedInvalidState;
  }
  out_entry = &it->second;
  return Decision::kAccepted;
}

void Ledger::count_decision(Decision decision) noexcept {
  ++stats_.applied;
  if (decision == Decision::kAccepted) {
    ++stats_.accepted;
  } else {
    ++stats_.rejected;
  }
  ++stats_.by_decision[static_cast<std::size_t>(decision)];
}

}  // namespace ledger
}  // namespace paycore

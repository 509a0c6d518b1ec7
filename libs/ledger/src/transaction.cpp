#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ledger {

common::ClientId client_of(const TransactionRecord& record) noexcept {
  return std::visit([](const auto& r) { return r.client; }, record);
}

common::TransactionId tx_of(const TransactionRecord& record) noexcept {
  return std::visit([](const auto& r) { return r.tx; }, record);
}

TransactionKind kind_of(const TransactionRecord& record) noexcept {
  // Variant alternatives are declared in TransactionKind order.
  return static_cast<TransactionKind>(record.index());
}

std::string_view to_string(TransactionKind kind) noexcept {
  switch (kind) {
    case TransactionKind::kDeposit:
      return "deposit";
    case TransactionKind::kWithdrawal:
      return "withdrawal";
    case TransactionKind::kDispute:
      return "dispute";
    case TransactionKind::kResolve:
      return "resolve";
    case TransactionKind::kChargeback:
      return "chargeback";
  }
  return "unknown";
}

}  // namespace ledger
}  // namespace paycore

#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "paycore/ingest/record_source.hpp"
#include "paycore/ledger/account.hpp"
#include "paycore/ledger/ledger_state.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace replay {

struct DriverStats {
  std::uint64_t processed{0};
  std::uint64_t accepted{0};
  std::uint64_t rejected{0};
};

// Folds a record source through a ledger in arrival order. Order matters: a
// dispute seen before its deposit is rejected.
class Driver {
 public:
  using RejectionHandler = std::function<void(const ledger::TransactionRecord&, ledger::Decision)>;

  explicit Driver(ledger::Ledger& ledger);

  void set_rejection_handler(RejectionHandler handler);

  // Applies every record of source and returns the resulting snapshot.
  // Exceptions thrown by source propagate; records applied before the failure
  // remain in the ledger.
  std::vector<ledger::AccountView> execute(ingest::RecordSource& source);

  [[nodiscard]] const DriverStats& stats() const noexcept { return stats_; }

 private:
  ledger::Ledger& ledger_;
  RejectionHandler rejection_handler_{};
  DriverStats stats_{};
};

}  // namespace replay
}  // namespace paycore

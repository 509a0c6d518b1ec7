#include "paycore/replay/replay_driver.hpp"

#include <utility>

namespace paycore {
namespace replay {

Driver::Driver(ledger::Ledger& ledger)
    : ledger_(ledger) {}

void Driver::set_rejection_handler(RejectionHandler handler) {
  rejection_handler_ = std::move(handler);
}

std::vector<ledger::AccountView> Driver::execute(ingest::RecordSource& source) {
  ledger::TransactionRecord record;
  while (source.next(record)) {
    ++stats_.processed;
    const auto decision = ledger_.apply(record);
    if (decision == ledger::Decision::kAccepted) {
      ++stats_.accepted;
      continue;
    }
    ++stats_.rejected;
    if (rejection_handler_) {
      rejection_handler_(record, decision);
    }
  }
  return ledger_.snapshot();
}

}  // namespace replay
}  // namespace paycore

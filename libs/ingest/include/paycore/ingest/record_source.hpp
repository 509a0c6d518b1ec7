#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ingest {

// Lazy, single-pass, finite sequence of transaction records.
class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Fills out_record with the next record, false once the source is exhausted.
  // Throws std::runtime_error if the underlying input fails structurally.
  virtual bool next(ledger::TransactionRecord& out_record) = 0;
};

class RecordBuffer : public RecordSource {
 public:
  RecordBuffer() = default;
  explicit RecordBuffer(std::vector<ledger::TransactionRecord> records)
      : records_(std::move(records)) {}

  void push(ledger::TransactionRecord record) { records_.push_back(std::move(record)); }

  bool next(ledger::TransactionRecord& out_record) override {
    if (cursor_ >= records_.size()) {
      return false;
    }
    out_record = records_[cursor_++];
    return true;
  }

 private:
  std::vector<ledger::TransactionRecord> records_{};
  std::size_t cursor_{0};
};

}  // namespace ingest
}  // namespace paycore

#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <string>
#include <string_view>

#include "paycore/common/amount.hpp"
#include "paycore/ingest/record_source.hpp"
#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace ingest {

enum class RowError : std::uint8_t {
  kNone,
  kFieldCount,
  kUnknownType,
  kInvalidClient,
  kInvalidTransaction,
  kMissingAmount,
  kInvalidAmount,
  kNegativeAmount,
};

[[nodiscard]] std::string_view to_string(RowError error) noexcept;

struct ReaderStats {
  std::uint64_t rows_read{0};
  std::uint64_t records_emitted{0};
  std::uint64_t rows_malformed{0};
  std::uint64_t blank_lines{0};
};

// Parses one CSV row of the form "type, client, tx, amount". The amount column
// is required for deposits and withdrawals and ignored for the other kinds.
[[nodiscard]] RowError parse_row(std::string_view line, common::PrecisionPolicy precision,
                                 ledger::TransactionRecord& out_record);

// Streams transaction records out of CSV text. Malformed rows are skipped and
// reported; only a failing stream ends the read with an exception.
class CsvReader : public RecordSource {
 public:
  struct Config {
    bool has_header{true};
    common::PrecisionPolicy precision{common::PrecisionPolicy::kTruncate};
  };

  using MalformedRowHandler = std::function<void(std::uint64_t line_number, RowError, std::string_view line)>;

  explicit CsvReader(std::istream& input);
  CsvReader(std::istream& input, const Config& config, MalformedRowHandler handler = MalformedRowHandler{});

  bool next(ledger::TransactionRecord& out_record) override;

  [[nodiscard]] const ReaderStats& stats() const noexcept { return stats_; }

 private:
  std::istream& input_;
  Config config_{};
  MalformedRowHandler handler_{};
  ReaderStats stats_{};
  std::string line_{};
  std::uint64_t line_number_{0};
  bool header_checked_{false};

  bool is_header(std::string_view line) const;
};

}  // namespace ingest
}  // namespace paycore

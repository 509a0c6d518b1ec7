#include "paycore/ingest/csv_reader.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace paycore {
namespace ingest {

namespace {

constexpr std::size_t kMaxFields = 4;

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

// Splits on commas into at most kMaxFields trimmed fields; returns the total
// number of fields seen so callers can reject over-long rows.
std::size_t split_fields(std::string_view line, std::array<std::string_view, kMaxFields>& fields) {
  std::size_t count = 0;
  while (true) {
    const auto comma = line.find(',');
    const auto field = trim(line.substr(0, comma));
    if (count < kMaxFields) {
      fields[count] = field;
    }
    ++count;
    if (comma == std::string_view::npos) {
      break;
    }
    line.remove_prefix(comma + 1);
  }
  return count;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::optional<ledger::TransactionKind> parse_kind(std::string_view text) {
  const auto name = lowercase(text);
  if (name == "deposit") {
    return ledger::TransactionKind::kDeposit;
  }
  if (name == "withdrawal") {
    return ledger::TransactionKind::kWithdrawal;
  }
  if (name == "dispute") {
    return ledger::TransactionKind::kDispute;
  }
  if (name == "resolve") {
    return ledger::TransactionKind::kResolve;
  }
  if (name == "chargeback") {
    return ledger::TransactionKind::kChargeback;
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(RowError error) noexcept {
  switch (error) {
    case RowError::kNone:
      return "ok";
    case RowError::kFieldCount:
      return "unexpected number of fields";
    case RowError::kUnknownType:
      return "unknown transaction type";
    case RowError::kInvalidClient:
      return "invalid client id";
    case RowError::kInvalidTransaction:
      return "invalid transaction id";
    case RowError::kMissingAmount:
      return "missing amount";
    case RowError::kInvalidAmount:
      return "invalid amount";
    case RowError::kNegativeAmount:
      return "negative amount";
  }
  return "unknown";
}

RowError parse_row(std::string_view line, common::PrecisionPolicy precision,
                   ledger::TransactionRecord& out_record) {
  std::array<std::string_view, kMaxFields> fields{};
  const auto field_count = split_fields(line, fields);
  if (field_count < 3 || field_count > kMaxFields) {
    return RowError::kFieldCount;
  }

  const auto kind = parse_kind(fields[0]);
  if (!kind) {
    return RowError::kUnknownType;
  }
  const auto client = parse_unsigned<common::ClientId>(fields[1]);
  if (!client) {
    return RowError::kInvalidClient;
  }
  const auto tx = parse_unsigned<common::TransactionId>(fields[2]);
  if (!tx) {
    return RowError::kInvalidTransaction;
  }

  switch (*kind) {
    case ledger::TransactionKind::kDeposit:
    case ledger::TransactionKind::kWithdrawal: {
      if (field_count < kMaxFields || fields[3].empty()) {
        return RowError::kMissingAmount;
      }
      const auto amount = common::Amount::parse(fields[3], precision);
      if (!amount) {
        return RowError::kInvalidAmount;
      }
      if (amount->is_negative()) {
        return RowError::kNegativeAmount;
      }
      if (*kind == ledger::TransactionKind::kDeposit) {
        out_record = ledger::Deposit{.client = *client, .tx = *tx, .amount = *amount};
      } else {
        out_record = ledger::Withdrawal{.client = *client, .tx = *tx, .amount = *amount};
      }
      break;
    }
    case ledger::TransactionKind::kDispute:
      out_record = ledger::Dispute{.client = *client, .tx = *tx};
      break;
    case ledger::TransactionKind::kResolve:
      out_record = ledger::Resolve{.client = *client, .tx = *tx};
      break;
    case ledger::TransactionKind::kChargeback:
      out_record = ledger::Chargeback{.client = *client, .tx = *tx};
      break;
  }
  return RowError::kNone;
}

CsvReader::CsvReader(std::istream& input)
    : input_(input) {}

CsvReader::CsvReader(std::istream& input, const Config& config, MalformedRowHandler handler)
    : input_(input), config_(config), handler_(std::move(handler)) {}

bool CsvReader::next(ledger::TransactionRecord& out_record) {
  while (std::getline(input_, line_)) {
    ++line_number_;
    const auto line = trim(line_);
    if (line.empty()) {
      ++stats_.blank_lines;
      continue;
    }

    if (!header_checked_) {
      header_checked_ = true;
      if (config_.has_header && is_header(line)) {
        continue;
      }
    }

    ++stats_.rows_read;
    const auto error = parse_row(line, config_.precision, out_record);
    if (error != RowError::kNone) {
      ++stats_.rows_malformed;
      if (handler_) {
        handler_(line_number_, error, line);
      }
      continue;
    }

    ++stats_.records_emitted;
    return true;
  }

  if (input_.bad()) {
    throw std::runtime_error("failed reading transaction input at line " + std::to_string(line_number_ + 1));
  }
  return false;
}

bool CsvReader::is_header(std::string_view line) const {
  std::array<std::string_view, kMaxFields> fields{};
  split_fields(line, fields);
  return lowercase(fields[0]) == "type";
}

}  // namespace ingest
}  // namespace paycore

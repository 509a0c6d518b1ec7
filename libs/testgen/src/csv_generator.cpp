#include "paycore/testgen/csv_generator.hpp"

#include <algorithm>
#include <charconv>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "paycore/ledger/transaction.hpp"

namespace paycore {
namespace testgen {

namespace {

constexpr std::string_view kHeader = "type, client, tx, amount\r\n";

// Deposits come up twice as often as each other kind.
ledger::TransactionKind random_kind(std::mt19937_64& rng) {
  std::uniform_int_distribution<int> dist(0, 5);
  switch (dist(rng)) {
    case 1:
      return ledger::TransactionKind::kWithdrawal;
    case 2:
      return ledger::TransactionKind::kDispute;
    case 3:
      return ledger::TransactionKind::kResolve;
    case 4:
      return ledger::TransactionKind::kChargeback;
    default:
      return ledger::TransactionKind::kDeposit;
  }
}

std::string random_amount(std::mt19937_64& rng) {
  std::uniform_real_distribution<float> dist(0.0f, 1.0f);
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), dist(rng), std::chars_format::fixed);
  if (ec != std::errc{}) {
    throw std::runtime_error("failed to format generated amount");
  }
  return std::string(buffer, ptr);
}

}  // namespace

CsvGenerator::CsvGenerator(const GeneratorConfig& config)
    : config_(config) {
  if (config_.clients == 0) {
    throw std::invalid_argument("generator needs at least one client");
  }
}

GeneratorStats CsvGenerator::generate(std::ostream& out) {
  std::mt19937_64 rng(config_.seed);
  std::uniform_int_distribution<unsigned> client_dist(0, config_.clients - 1u);
  std::uniform_int_distribution<int> byte_dist(0, 255);

  std::vector<common::TransactionId> tx_ids(config_.transactions);
  std::iota(tx_ids.begin(), tx_ids.end(), common::TransactionId{0});
  std::shuffle(tx_ids.begin(), tx_ids.end(), rng);

  GeneratorStats stats;
  out << kHeader;

  std::string line;
  for (const auto tx : tx_ids) {
    const auto client = static_cast<common::ClientId>(client_dist(rng));
    const auto kind = random_kind(rng);

    line.assign(ledger::to_string(kind));
    line += ", ";
    line += std::to_string(client);
    line += ", ";
    line += std::to_string(tx);

    const int roll = byte_dist(rng);
    if (roll > 127) {
      line += ", ";
      line += random_amount(rng);
      if (roll > 191) {
        line += '\n';
      } else {
        line += "\r\n";
        ++stats.crlf_rows;
      }
    } else {
      line += '\n';
      ++stats.rows_without_amount;
    }

    out << line;
    ++stats.rows;
  }

  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write generated transactions");
  }
  return stats;
}

}  // namespace testgen
}  // namespace paycore

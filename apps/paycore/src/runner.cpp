#include "runner.hpp"

#include <cstdint>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "paycore/ingest/csv_reader.hpp"
#include "paycore/ledger/ledger_state.hpp"
#include "paycore/replay/replay_driver.hpp"
#include "paycore/snapshot/snapshot_writer.hpp"

namespace paycore {
namespace app {

std::filesystem::path find_config_path(const config::Arguments& args, const std::filesystem::path& local) {
  if (args.config_path) {
    return *args.config_path;
  }
  if (std::filesystem::exists(local)) {
    return local;
  }
  return {};
}

bool load_config(const std::filesystem::path& config_path, config::EngineConfig& cfg, std::ostream& diag) {
  using config::ConfigLoader;

  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      diag << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      diag << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

int run(std::istream& input, std::ostream& out, std::ostream& diag, const config::EngineConfig& cfg) {
  ingest::CsvReader::MalformedRowHandler on_malformed;
  if (cfg.diagnostics.report_malformed) {
    on_malformed = [&diag](std::uint64_t line_number, ingest::RowError error, std::string_view line) {
      diag << "skipped line " << line_number << " (" << ingest::to_string(error) << "): " << line << "\n";
    };
  }
  ingest::CsvReader reader(input,
                           {.has_header = cfg.input.has_header, .precision = cfg.input.over_precision},
                           std::move(on_malformed));

  ledger::Ledger ledger;
  replay::Driver driver(ledger);
  if (cfg.diagnostics.report_rejections) {
    driver.set_rejection_handler([&diag](const ledger::TransactionRecord& record, ledger::Decision decision) {
      diag << "rejected " << ledger::to_string(ledger::kind_of(record)) << " tx " << ledger::tx_of(record)
           << " for client " << ledger::client_of(record) << ": " << ledger::to_string(decision) << "\n";
    });
  }

  int exit_code = kExitOk;
  std::vector<ledger::AccountView> views;
  try {
    views = driver.execute(reader);
  } catch (const std::runtime_error& e) {
    diag << "Input error: " << e.what() << "\n";
    views = ledger.snapshot();
    exit_code = kExitFailure;
  } catch (const std::logic_error& e) {
    diag << "FATAL ledger invariant violated: " << e.what() << "\n";
    return kExitInvariantViolation;
  }

  try {
    snapshot::CsvWriter writer(out, cfg.output.include_header);
    writer.write(views);
  } catch (const std::runtime_error& e) {
    diag << "Output error: " << e.what() << "\n";
    return kExitFailure;
  }

  if (cfg.diagnostics.summary) {
    const auto& driver_stats = driver.stats();
    diag << "Processed " << driver_stats.processed << " records: " << driver_stats.accepted << " accepted, "
         << driver_stats.rejected << " rejected, " << reader.stats().rows_malformed << " malformed rows skipped, "
         << views.size() << " accounts\n";
  }

  return exit_code;
}

}  // namespace app
}  // namespace paycore

#include "paycore/snapshot/snapshot_writer.hpp"

#include <stdexcept>

namespace paycore {
namespace snapshot {

namespace {
constexpr const char* kHeader = "client,available,held,total,locked";
}  // namespace

CsvWriter::CsvWriter(std::ostream& out, bool include_header)
    : out_(out), include_header_(include_header) {}

void CsvWriter::write(std::span<const ledger::AccountView> views) {
  ensure_header();
  for (const auto& view : views) {
    write(view);
  }
  out_.flush();
  check_stream("failed to flush account snapshot");
}

void CsvWriter::write(const ledger::AccountView& view) {
  ensure_header();
  out_ << format_row(view) << '\n';
  check_stream("failed to write account snapshot row");
}

std::string CsvWriter::format_row(const ledger::AccountView& view) {
  std::string row = std::to_string(view.client);
  row.push_back(',');
  row += view.available.to_string();
  row.push_back(',');
  row += view.held.to_string();
  row.push_back(',');
  row += view.total.to_string();
  row.push_back(',');
  row += view.locked ? "true" : "false";
  return row;
}

void CsvWriter::ensure_header() {
  if (!include_header_ || header_written_) {
    return;
  }
  out_ << kHeader << '\n';
  check_stream("failed to write account snapshot header");
  header_written_ = true;
}

void CsvWriter::check_stream(const char* what) const {
  if (!out_) {
    throw std::runtime_error(what);
  }
}

}  // namespace snapshot
}  // namespace paycore

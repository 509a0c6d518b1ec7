#pragma once

#include <ostream>
#include <span>
#include <string>

#include "paycore/ledger/account.hpp"

namespace paycore {
namespace snapshot {

// Renders account views as CSV: client,available,held,total,locked.
class CsvWriter {
 public:
  explicit CsvWriter(std::ostream& out, bool include_header = true);

  void write(std::span<const ledger::AccountView> views);
  void write(const ledger::AccountView& view);

  [[nodiscard]] static std::string format_row(const ledger::AccountView& view);

 private:
  std::ostream& out_;
  bool include_header_;
  bool header_written_{false};

  void ensure_header();
  void check_stream(const char* what) const;
};

}  // namespace snapshot
}  // namespace paycore

#pragma once

#include <cstdint>
#include <ostream>

#include "paycore/common/types.hpp"

namespace paycore {
namespace testgen {

struct GeneratorConfig {
  std::uint32_t transactions{50'000};
  common::ClientId clients{10};
  std::uint64_t seed{0};
};

struct GeneratorStats {
  std::uint64_t rows{0};
  std::uint64_t rows_without_amount{0};
  std::uint64_t crlf_rows{0};
};

// Writes a random transaction CSV for stress runs. Transaction ids 0..N-1 are
// shuffled and spread over `clients` clients; about half of the rows drop the
// amount column and line endings mix LF and CRLF. Amounts carry up to float
// precision, so most exceed four decimals. Output is deterministic per seed.
class CsvGenerator {
 public:
  explicit CsvGenerator(const GeneratorConfig& config);

  GeneratorStats generate(std::ostream& out);

 private:
  GeneratorConfig config_;
};

}  // namespace testgen
}  // namespace paycore

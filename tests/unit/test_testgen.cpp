#include "test_testgen.hpp"

#include <algorithm>
#include <cassert>
#include <charconv>
#include <cstdint>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include "paycore/ingest/csv_reader.hpp"
#include "paycore/ledger/ledger_state.hpp"
#include "paycore/replay/replay_driver.hpp"
#include "paycore/testgen/csv_generator.hpp"

namespace paycore::tests {

namespace {

constexpr testgen::GeneratorConfig kConfig{.transactions = 500, .clients = 3, .seed = 42};

std::uint32_t field_as_number(std::string_view line, std::size_t index) {
  for (std::size_t i = 0; i < index; ++i) {
    line.remove_prefix(line.find(", ") + 2);
  }
  const auto end = std::min(line.find(','), line.find_first_of("\r\n"));
  line = line.substr(0, end);
  std::uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), value);
  assert(ec == std::errc{} && ptr == line.data() + line.size());
  return value;
}

}  // namespace

void test_generator_output_shape() {
  std::ostringstream out;
  testgen::CsvGenerator generator(kConfig);
  const auto stats = generator.generate(out);
  assert(stats.rows == kConfig.transactions);
  assert(stats.rows_without_amount > 0);
  assert(stats.crlf_rows > 0);

  std::istringstream lines(out.str());
  std::string line;
  assert(std::getline(lines, line));
  assert(line == "type, client, tx, amount\r");

  std::set<std::uint32_t> tx_ids;
  std::uint64_t rows = 0;
  while (std::getline(lines, line)) {
    ++rows;
    assert(field_as_number(line, 1) < kConfig.clients);
    tx_ids.insert(field_as_number(line, 2));
  }
  assert(rows == kConfig.transactions);
  assert(tx_ids.size() == kConfig.transactions);
  assert(*tx_ids.rbegin() == kConfig.transactions - 1);

  std::ostringstream again;
  testgen::CsvGenerator(kConfig).generate(again);
  assert(again.str() == out.str());

  bool threw = false;
  try {
    testgen::CsvGenerator bad({.transactions = 1, .clients = 0, .seed = 0});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void test_generator_output_replays_cleanly() {
  std::stringstream data;
  testgen::CsvGenerator(kConfig).generate(data);

  std::uint64_t malformed = 0;
  ingest::CsvReader reader(data, {}, [&malformed](std::uint64_t, ingest::RowError error, std::string_view) {
    assert(error == ingest::RowError::kMissingAmount);
    ++malformed;
  });

  ledger::Ledger ledger;
  replay::Driver driver(ledger);
  const auto views = driver.execute(reader);

  assert(reader.stats().rows_read == kConfig.transactions);
  assert(reader.stats().records_emitted + malformed == kConfig.transactions);
  assert(driver.stats().processed == reader.stats().records_emitted);
  assert(views.size() <= kConfig.clients);
  for (const auto& view : views) {
    assert(!view.available.is_negative());
    assert(!view.held.is_negative());
    assert(view.available.checked_add(view.held) == view.total);
  }
}

}  // namespace paycore::tests

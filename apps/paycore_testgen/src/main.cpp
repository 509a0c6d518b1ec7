#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <stdexcept>
#include <string_view>
#include <system_error>

#include "paycore/testgen/csv_generator.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [output.csv] [transactions] [seed]\n"
            << "  output.csv:   File to write (default: test.csv)\n"
            << "  transactions: Number of rows to generate (default: 50000)\n"
            << "  seed:         Random seed (default: random)\n";
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
  T value{};
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paycore;

  const char* output_path = argc > 1 ? argv[1] : "test.csv";

  testgen::GeneratorConfig config;
  config.seed = std::random_device{}();
  if (argc > 2) {
    const auto transactions = parse_number<std::uint32_t>(argv[2]);
    if (!transactions) {
      print_usage(argv[0]);
      return 1;
    }
    config.transactions = *transactions;
  }
  if (argc > 3) {
    const auto seed = parse_number<std::uint64_t>(argv[3]);
    if (!seed) {
      print_usage(argv[0]);
      return 1;
    }
    config.seed = *seed;
  }

  std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "Failed to open output file: " << output_path << "\n";
    return 1;
  }

  std::cout << "Generating test file " << output_path << " (seed " << config.seed << ")\n";
  try {
    testgen::CsvGenerator generator(config);
    const auto stats = generator.generate(out);
    std::cout << "Wrote " << stats.rows << " rows: " << stats.rows_without_amount << " without amount, "
              << stats.crlf_rows << " CRLF terminated\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "Output error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

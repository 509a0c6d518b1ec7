#include <fstream>
#include <iostream>
#include <string_view>
#include <vector>

#include "paycore/config/arguments.hpp"
#include "paycore/config/config_loader.hpp"
#include "runner.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: CSV input with columns type, client, tx, amount\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./paycore.toml or built-in defaults\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace paycore;

  std::vector<std::string_view> raw_args(argv, argv + argc);
  const auto parsed = config::parse_arguments(raw_args);
  if (!parsed.ok()) {
    std::cerr << "Argument error: " << config::to_string(parsed.error) << "\n";
    print_usage(argc > 0 ? argv[0] : "paycore");
    return app::kExitFailure;
  }
  const auto& args = parsed.arguments;

  config::EngineConfig cfg;
  if (!app::load_config(app::find_config_path(args), cfg, std::cerr)) {
    return app::kExitFailure;
  }

  if (cfg.input.require_csv_extension) {
    if (const auto err = config::check_input_path(args.input_path); err != config::ArgumentError::kNone) {
      std::cerr << "Argument error: " << config::to_string(err) << ", got " << args.input_path << "\n";
      return app::kExitFailure;
    }
  }

  std::ifstream input(args.input_path);
  if (!input) {
    std::cerr << "Failed to open transactions file: " << args.input_path << "\n";
    return app::kExitFailure;
  }

  return app::run(input, std::cout, std::cerr, cfg);
}

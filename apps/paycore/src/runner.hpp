#pragma once

#include <filesystem>
#include <istream>
#include <ostream>

#include "paycore/config/arguments.hpp"
#include "paycore/config/config_loader.hpp"

namespace paycore {
namespace app {

enum ExitCode : int {
  kExitOk = 0,
  kExitFailure = 1,
  kExitInvariantViolation = 2,
};

// Explicit argument first, then `local` if it exists. An empty path selects
// the built-in defaults.
std::filesystem::path find_config_path(const config::Arguments& args,
                                       const std::filesystem::path& local = "./paycore.toml");

// Loads `config_path` (or the defaults when empty) into `cfg`, reporting
// parse and validation errors on `diag`.
bool load_config(const std::filesystem::path& config_path, config::EngineConfig& cfg, std::ostream& diag);

// Replays `input` and writes the account snapshot to `out`. The snapshot of
// the records applied so far is still written when the input stream fails.
int run(std::istream& input, std::ostream& out, std::ostream& diag, const config::EngineConfig& cfg);

}  // namespace app
}  // namespace paycore

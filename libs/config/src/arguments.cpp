#include "paycore/config/arguments.hpp"

namespace paycore {
namespace config {

namespace {
constexpr std::size_t kMinArguments = 2;
constexpr std::size_t kInputArgument = 1;
constexpr std::size_t kConfigArgument = 2;
}  // namespace

std::string_view to_string(ArgumentError error) noexcept {
  switch (error) {
    case ArgumentError::kNone:
      return "ok";
    case ArgumentError::kArgumentsTooShort:
      return "missing transactions file argument";
    case ArgumentError::kExpectedCsvFile:
      return "expected a .csv transactions file";
  }
  return "unknown";
}

ArgumentsResult parse_arguments(std::span<const std::string_view> args) {
  ArgumentsResult result;
  if (args.size() < kMinArguments || args[kInputArgument].empty()) {
    result.error = ArgumentError::kArgumentsTooShort;
    return result;
  }

  result.arguments.input_path = std::filesystem::path{std::string(args[kInputArgument])};
  if (args.size() > kConfigArgument) {
    result.arguments.config_path = std::filesystem::path{std::string(args[kConfigArgument])};
  }
  return result;
}

ArgumentError check_input_path(const std::filesystem::path& path) {
  if (path.extension() != ".csv") {
    return ArgumentError::kExpectedCsvFile;
  }
  return ArgumentError::kNone;
}

}  // namespace config
}  // namespace paycore

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace paycore {
namespace config {

enum class ArgumentError : std::uint8_t {
  kNone,
  kArgumentsTooShort,
  kExpectedCsvFile,
};

[[nodiscard]] std::string_view to_string(ArgumentError error) noexcept;

struct Arguments {
  std::filesystem::path input_path;
  std::optional<std::filesystem::path> config_path;
};

struct ArgumentsResult {
  ArgumentError error{ArgumentError::kNone};
  Arguments arguments;

  [[nodiscard]] bool ok() const noexcept { return error == ArgumentError::kNone; }
};

// args[0] is the program name, args[1] the transactions file, args[2] an
// optional config file.
[[nodiscard]] ArgumentsResult parse_arguments(std::span<const std::string_view> args);

// kExpectedCsvFile unless path ends in ".csv". Applied after the configuration
// is loaded, since input.require_csv_extension can switch it off.
[[nodiscard]] ArgumentError check_input_path(const std::filesystem::path& path);

}  // namespace config
}  // namespace paycore

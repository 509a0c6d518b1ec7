#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "paycore/common/amount.hpp"

namespace paycore {
namespace config {

struct InputConfig {
  bool has_header{true};
  bool require_csv_extension{true};
  common::PrecisionPolicy over_precision{common::PrecisionPolicy::kTruncate};
};

struct OutputConfig {
  bool include_header{true};
};

struct DiagnosticsConfig {
  bool report_rejections{true};
  bool report_malformed{true};
  bool summary{true};
};

struct EngineConfig {
  InputConfig input;
  OutputConfig output;
  DiagnosticsConfig diagnostics;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace paycore

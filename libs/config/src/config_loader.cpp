#include "paycore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <initializer_list>
#include <sstream>

namespace paycore {
namespace config {

namespace {

std::string field_name(std::string_view section, std::string_view key) {
  if (section.empty()) {
    return std::string(key);
  }
  std::string name(section);
  name.push_back('.');
  name.append(key);
  return name;
}

void read_bool(const toml::table& tbl, std::string_view section, std::string_view key, bool& target,
               std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return;
  }
  if (auto val = node.value_exact<bool>()) {
    target = *val;
    return;
  }
  errors.push_back({field_name(section, key), "must be a boolean"});
}

void read_precision(const toml::table& tbl, std::string_view section, std::string_view key,
                    common::PrecisionPolicy& target, std::vector<ValidationError>& errors) {
  const auto node = tbl[key];
  if (!node) {
    return;
  }
  const auto val = node.value_exact<std::string>();
  if (!val) {
    errors.push_back({field_name(section, key), "must be a string"});
    return;
  }
  if (*val == "truncate") {
    target = common::PrecisionPolicy::kTruncate;
  } else if (*val == "reject") {
    target = common::PrecisionPolicy::kReject;
  } else {
    errors.push_back({field_name(section, key), "must be \"truncate\" or \"reject\", got \"" + *val + "\""});
  }
}

// Returns the named section, or nullptr when it is absent or not a table.
const toml::table* section_table(const toml::table& root, std::string_view section,
                                 std::vector<ValidationError>& errors) {
  const auto node = root[section];
  if (!node) {
    return nullptr;
  }
  if (const auto* tbl = node.as_table()) {
    return tbl;
  }
  errors.push_back({std::string(section), "must be a table"});
  return nullptr;
}

void check_known_keys(const toml::table& tbl, std::string_view section,
                      std::initializer_list<std::string_view> known, std::vector<ValidationError>& errors) {
  for (auto&& [key, node] : tbl) {
    if (std::find(known.begin(), known.end(), key.str()) == known.end()) {
      errors.push_back({field_name(section, key.str()), "unknown key"});
    }
  }
}

InputConfig parse_input(const toml::table& root, std::vector<ValidationError>& errors) {
  InputConfig cfg;
  if (const auto* input = section_table(root, "input", errors)) {
    check_known_keys(*input, "input", {"has_header", "require_csv_extension", "over_precision"}, errors);
    read_bool(*input, "input", "has_header", cfg.has_header, errors);
    read_bool(*input, "input", "require_csv_extension", cfg.require_csv_extension, errors);
    read_precision(*input, "input", "over_precision", cfg.over_precision, errors);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root, std::vector<ValidationError>& errors) {
  OutputConfig cfg;
  if (const auto* output = section_table(root, "output", errors)) {
    check_known_keys(*output, "output", {"include_header"}, errors);
    read_bool(*output, "output", "include_header", cfg.include_header, errors);
  }
  return cfg;
}

DiagnosticsConfig parse_diagnostics(const toml::table& root, std::vector<ValidationError>& errors) {
  DiagnosticsConfig cfg;
  if (const auto* diagnostics = section_table(root, "diagnostics", errors)) {
    check_known_keys(*diagnostics, "diagnostics", {"report_rejections", "report_malformed", "summary"}, errors);
    read_bool(*diagnostics, "diagnostics", "report_rejections", cfg.report_rejections, errors);
    read_bool(*diagnostics, "diagnostics", "report_malformed", cfg.report_malformed, errors);
    read_bool(*diagnostics, "diagnostics", "summary", cfg.summary, errors);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  check_known_keys(root, "", {"input", "output", "diagnostics"}, errors);
  EngineConfig cfg;
  cfg.input = parse_input(root, errors);
  cfg.output = parse_output(root, errors);
  cfg.diagnostics = parse_diagnostics(root, errors);
  return cfg;
}

void finish(LoadResult& result) {
  auto semantic = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), semantic.begin(), semantic.end());
  result.success = result.errors.empty();
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table(), result.errors);
  finish(result);
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table(), result.errors);
  finish(result);
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  switch (config.input.over_precision) {
    case common::PrecisionPolicy::kTruncate:
    case common::PrecisionPolicy::kReject:
      break;
    default:
      errors.push_back({"input.over_precision", "unknown precision policy"});
      break;
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# paycore configuration
# Generated default configuration

[input]
has_header = true
require_csv_extension = true
over_precision = "truncate"  # or "reject"

[output]
include_header = true

[diagnostics]
report_rejections = true
report_malformed = true
summary = true
)";
}

}  // namespace config
}  // namespace paycore

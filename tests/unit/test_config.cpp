#include "test_config.hpp"

#include <cassert>
#include <string_view>
#include <vector>
#include "paycore/config/arguments.hpp"
#include "paycore/config/config_loader.hpp"

namespace paycore::tests {

using config::ArgumentError;
using config::ConfigLoader;

void test_config_defaults() {
  const auto result = ConfigLoader::load_from_string(ConfigLoader::generate_default());
  assert(result.success);
  assert(result.errors.empty());
  assert(result.config.input.has_header);
  assert(result.config.input.require_csv_extension);
  assert(result.config.input.over_precision == common::PrecisionPolicy::kTruncate);
  assert(result.config.output.include_header);
  assert(result.config.diagnostics.report_rejections);
  assert(result.config.diagnostics.report_malformed);
  assert(result.config.diagnostics.summary);

  const auto empty = ConfigLoader::load_from_string("");
  assert(empty.success);
  assert(empty.config.input.has_header);
}

void test_config_overrides() {
  const auto result = ConfigLoader::load_from_string(R"(
[input]
has_header = false
over_precision = "reject"

[output]
include_header = false

[diagnostics]
report_rejections = false
summary = false
)");
  assert(result.success);
  assert(!result.config.input.has_header);
  assert(result.config.input.require_csv_extension);
  assert(result.config.input.over_precision == common::PrecisionPolicy::kReject);
  assert(!result.config.output.include_header);
  assert(!result.config.diagnostics.report_rejections);
  assert(result.config.diagnostics.report_malformed);
  assert(!result.config.diagnostics.summary);
}

void test_config_validation_errors() {
  const auto result = ConfigLoader::load_from_string(R"(
[input]
has_header = "yes"
over_precision = "round"

[diagnostics]
summary = 1
)");
  assert(!result.success);
  assert(result.raw_error.empty());
  assert(result.errors.size() == 3);
  assert(result.errors[0].field == "input.has_header");
  assert(result.errors[1].field == "input.over_precision");
  assert(result.errors[2].field == "diagnostics.summary");

  // A misspelled key must not silently fall back to the default policy.
  const auto typo = ConfigLoader::load_from_string("[input]\nover_precison = \"reject\"\n");
  assert(!typo.success);
  assert(typo.errors.size() == 1);
  assert(typo.errors[0].field == "input.over_precison");
  assert(typo.config.input.over_precision == common::PrecisionPolicy::kTruncate);

  const auto unknown = ConfigLoader::load_from_string(R"(
[output]
include_headers = false

[diagnostics]
verbose = true

[engine]
threads = 4
)");
  assert(!unknown.success);
  assert(unknown.errors.size() == 3);
  assert(unknown.errors[0].field == "engine");
  assert(unknown.errors[1].field == "output.include_headers");
  assert(unknown.errors[2].field == "diagnostics.verbose");

  const auto not_table = ConfigLoader::load_from_string("input = 5\noutput = \"stdout\"\n");
  assert(!not_table.success);
  assert(not_table.errors.size() == 2);
  assert(not_table.errors[0].field == "input");
  assert(not_table.errors[1].field == "output");

  const auto syntax = ConfigLoader::load_from_string("[input\nhas_header = ");
  assert(!syntax.success);
  assert(!syntax.raw_error.empty());
}

void test_config_validate() {
  assert(ConfigLoader::validate(config::EngineConfig{}).empty());

  config::EngineConfig cfg;
  cfg.input.over_precision = static_cast<common::PrecisionPolicy>(7);
  const auto errors = ConfigLoader::validate(cfg);
  assert(errors.size() == 1);
  assert(errors[0].field == "input.over_precision");
}

void test_config_missing_file() {
  const auto result = ConfigLoader::load("/nonexistent/paycore/paycore.toml");
  assert(!result.success);
  assert(!result.raw_error.empty());
}

void test_parse_arguments() {
  {
    const std::vector<std::string_view> args;
    assert(config::parse_arguments(args).error == ArgumentError::kArgumentsTooShort);
  }
  {
    const std::vector<std::string_view> args{"paycore"};
    assert(config::parse_arguments(args).error == ArgumentError::kArgumentsTooShort);
  }
  {
    const std::vector<std::string_view> args{"paycore", "transactions.csv"};
    const auto result = config::parse_arguments(args);
    assert(result.ok());
    assert(result.arguments.input_path == "transactions.csv");
    assert(!result.arguments.config_path);
  }
  {
    const std::vector<std::string_view> args{"paycore", "in.csv", "paycore.toml"};
    const auto result = config::parse_arguments(args);
    assert(result.ok());
    assert(result.arguments.config_path == std::filesystem::path{"paycore.toml"});
  }

  for (const auto* name : {"transactions.csv", "c::/derp.csv", "dir/x.csv"}) {
    assert(config::check_input_path(name) == ArgumentError::kNone);
  }
  for (const auto* name : {"transactions", "transactions.csvs", ".css", " ", "blah", "foo.bar", ".csv"}) {
    assert(config::check_input_path(name) == ArgumentError::kExpectedCsvFile);
  }
}

}  // namespace paycore::tests

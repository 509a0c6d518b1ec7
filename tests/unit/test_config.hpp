#pragma once

namespace paycore::tests {

void test_config_defaults();
void test_config_overrides();
void test_config_validation_errors();
void test_config_validate();
void test_config_missing_file();
void test_parse_arguments();

}  // namespace paycore::tests

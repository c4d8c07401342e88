#ifndef DRIFT_CONFIG_H
#define DRIFT_CONFIG_H

#include <spdlog/common.h>

#include <drift/fs/types.h>
#include <drift/normalization/field_folding.h>

namespace drift {

struct logging_config
{
    // the level of the drift logger (defaults to info)
    spdlog::level::level_enum level = spdlog::level::info;
};

struct checker_config
{
    logging_config logging;

    // whether or not to register the built-in rules (defaults to true)
    bool builtin_rules = true;

    // additional field folding rules, registered after the built-in ones
    std::vector<field_folding_spec> folding_rules;
};

// Thrown when a configuration is well-typed but still doesn't make sense.
DRIFT_DEFINE_EXCEPTION(invalid_config)
DRIFT_DEFINE_ERROR_INFO(string, config_problem)

void
from_dynamic(logging_config* x, dynamic const& v);

void
from_dynamic(marker_condition* x, dynamic const& v);

void
from_dynamic(field_folding_spec* x, dynamic const& v);

void
from_dynamic(checker_config* x, dynamic const& v);

// Read a checker configuration from its dynamic form.
// Errors carry dynamic_value_path_info to locate the offending field.
checker_config
read_checker_config(dynamic const& v);

// Read a checker configuration from a YAML (or JSON) file.
checker_config
load_checker_config(file_path const& path);

// Register the rules that :config calls for with :registry: first the
// built-in rules (if enabled), then the configured folding rules in the order
// they're listed.
void
configure_registry(normalizer_registry& registry, checker_config const& config);

// Apply the logging section of a configuration.
void
apply_logging_config(logging_config const& config);

} // namespace drift

#endif

#ifndef DRIFT_ENCODINGS_YAML_H
#define DRIFT_ENCODINGS_YAML_H

#include <drift/core/dynamic.h>

// YAML - conversion to and from YAML strings
//
// Since YAML's flow style is a superset of JSON, parse_yaml_value also accepts
// JSON text.

namespace drift {

// Parse some YAML text into a dynamic value.
dynamic
parse_yaml_value(char const* yaml, size_t length);

// Same as above, but accepts a string.
inline dynamic
parse_yaml_value(string const& yaml)
{
    return parse_yaml_value(yaml.c_str(), yaml.length());
}

// Write a value to a string in YAML format.
// The output is fully determined by the value (map keys are always written in
// order), so equal values always produce identical text.
string
value_to_yaml(dynamic const& v);

// Write a value to a diagnostic string in YAML format.
// This won't necessarily capture the entire contents of the value. In
// particular, it will omit the contents of large arrays and maps.
string
value_to_diagnostic_yaml(dynamic const& v);

} // namespace drift

#endif

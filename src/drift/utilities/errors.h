#ifndef DRIFT_UTILITIES_ERRORS_H
#define DRIFT_UTILITIES_ERRORS_H

#include <drift/core/exception.h>

namespace drift {

// If an error occurs internally within library that provides its own
// error messages, this is used to convey that message.
DRIFT_DEFINE_ERROR_INFO(string, internal_error_message)

// invalid_enum_value is thrown when an enum's raw (integer) value is invalid.
DRIFT_DEFINE_EXCEPTION(invalid_enum_value)
DRIFT_DEFINE_ERROR_INFO(string, enum_id)
DRIFT_DEFINE_ERROR_INFO(int, enum_value)

// invalid_enum_string is thrown when attempting to convert a string value to
// an enum and the string doesn't match any of the enum's cases.
DRIFT_DEFINE_EXCEPTION(invalid_enum_string)
// Note that this also uses the enum_id info declared above.
DRIFT_DEFINE_ERROR_INFO(string, enum_string)

} // namespace drift

#endif

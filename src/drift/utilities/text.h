#ifndef DRIFT_UTILITIES_TEXT_H
#define DRIFT_UTILITIES_TEXT_H

#include <boost/lexical_cast.hpp>

#include <drift/core/exception.h>

namespace drift {

using boost::lexical_cast;

// If a simple parsing operation fails, this exception can be thrown.
DRIFT_DEFINE_EXCEPTION(parsing_error)
DRIFT_DEFINE_ERROR_INFO(string, expected_format)
DRIFT_DEFINE_ERROR_INFO(string, parsed_text)
DRIFT_DEFINE_ERROR_INFO(string, parsing_error)

} // namespace drift

#endif

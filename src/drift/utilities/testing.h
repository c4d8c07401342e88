#ifndef DRIFT_UTILITIES_TESTING_H
#define DRIFT_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <drift/core/dynamic.h>
#include <drift/encodings/yaml.h>

namespace drift {

// Parse a document written in YAML (or JSON) for use in a test.
inline dynamic
test_document(string const& yaml)
{
    return parse_yaml_value(yaml);
}

// Check that :f throws an Exception carrying :Info, and return a copy of that
// info's value so that the test can check it.
template<class Exception, class Info, class Function>
typename Info::value_type
require_error_info(Function&& f)
{
    try
    {
        std::forward<Function>(f)();
    }
    catch (Exception& e)
    {
        auto const* info = get_error_info<Info>(e);
        REQUIRE(info);
        return *info;
    }
    FAIL("no exception thrown");
    return typename Info::value_type();
}

} // namespace drift

#endif

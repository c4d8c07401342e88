#ifndef DRIFT_CORE_TYPE_DEFINITIONS_H
#define DRIFT_CORE_TYPE_DEFINITIONS_H

#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/core/noncopyable.hpp>

namespace drift {

using boost::noncopyable;

using std::string;

using std::optional;
typedef std::nullopt_t none_t;
inline constexpr std::nullopt_t none(std::nullopt);

// some(x) creates an optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

static inline bool
operator==(nil_t, nil_t)
{
    return true;
}
static inline bool
operator!=(nil_t, nil_t)
{
    return false;
}

struct dynamic;

// The order of these must match the order of the alternatives in
// dynamic_storage.
enum class value_type
{
    NIL, // nil_t - no value
    BOOLEAN, // bool
    INTEGER, // integer
    FLOAT, // double
    STRING, // string
    ARRAY, // dynamic_array - array of dynamic values
    MAP, // dynamic_map - collection of named dynamic values
};

// Arrays are represented as std::vectors and can be manipulated as such.
typedef std::vector<dynamic> dynamic_array;

// Maps are represented as std::maps and can be manipulated as such.
// Keys are always strings, and iteration is always in key order.
typedef std::map<string, dynamic> dynamic_map;

using dynamic_storage = std::
    variant<nil_t, bool, integer, double, string, dynamic_array, dynamic_map>;

} // namespace drift

#endif

#include <drift/core/dynamic.h>

#include <algorithm>
#include <cmath>

#include <drift/encodings/yaml.h>
#include <drift/utilities/errors.h>

namespace drift {

value_type
dynamic::type() const
{
    if (storage_.valueless_by_exception())
        DRIFT_THROW(malformed_document());
    return value_type(storage_.index());
}

std::ostream&
operator<<(std::ostream& s, value_type t)
{
    switch (t)
    {
        case value_type::NIL:
            s << "nil";
            break;
        case value_type::BOOLEAN:
            s << "boolean";
            break;
        case value_type::INTEGER:
            s << "integer";
            break;
        case value_type::FLOAT:
            s << "float";
            break;
        case value_type::STRING:
            s << "string";
            break;
        case value_type::ARRAY:
            s << "array";
            break;
        case value_type::MAP:
            s << "map";
            break;
        default:
            DRIFT_THROW(
                invalid_enum_value()
                << enum_id_info("value_type") << enum_value_info(int(t)));
    }
    return s;
}

void
check_type(value_type expected, value_type actual)
{
    if (expected != actual)
    {
        DRIFT_THROW(
            type_mismatch() << expected_value_type_info(expected)
                            << actual_value_type_info(actual));
    }
}

dynamic::dynamic(std::initializer_list<dynamic> list)
{
    // If this is a list of arrays, all of which are length two and have
    // strings as their first elements, treat it as a map.
    if (list.size() != 0
        && std::all_of(list.begin(), list.end(), [](dynamic const& v) {
               return v.type() == value_type::ARRAY
                      && cast<dynamic_array>(v).size() == 2
                      && cast<dynamic_array>(v)[0].type()
                             == value_type::STRING;
           }))
    {
        dynamic_map map;
        for (auto const& v : list)
        {
            auto const& array = cast<dynamic_array>(v);
            map[cast<string>(array[0])] = array[1];
        }
        storage_ = std::move(map);
    }
    else
    {
        storage_ = dynamic_array(list);
    }
}

void
swap(dynamic& a, dynamic& b)
{
    using std::swap;
    swap(a.storage_, b.storage_);
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v)
{
    os << value_to_diagnostic_yaml(v);
    return os;
}

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v)
{
    os << dynamic(dynamic_array(v.begin(), v.end()));
    return os;
}

// COMPARISON OPERATORS

bool
operator==(dynamic const& a, dynamic const& b)
{
    if (a.type() != b.type())
        return false;
    // NaN is equal to itself here, so that every value equals its copy.
    if (a.type() == value_type::FLOAT)
    {
        double x = cast<double>(a), y = cast<double>(b);
        return x == y || (std::isnan(x) && std::isnan(y));
    }
    return apply_to_dynamic_pair(
        [](auto const& x, auto const& y) { return x == y; }, a, b);
}
bool
operator!=(dynamic const& a, dynamic const& b)
{
    return !(a == b);
}

// MAPS

dynamic const&
get_field(dynamic_map const& r, string const& field)
{
    dynamic const* v;
    if (!get_field(&v, r, field))
    {
        DRIFT_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

dynamic&
get_field(dynamic_map& r, string const& field)
{
    dynamic* v;
    if (!get_field(&v, r, field))
    {
        DRIFT_THROW(missing_field() << field_name_info(field));
    }
    return *v;
}

bool
get_field(dynamic const** v, dynamic_map const& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

bool
get_field(dynamic** v, dynamic_map& r, string const& field)
{
    auto i = r.find(field);
    if (i == r.end())
        return false;
    *v = &i->second;
    return true;
}

void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element)
{
    std::list<dynamic>* info = get_error_info<dynamic_value_path_info>(e);
    if (info)
    {
        info->push_front(path_element);
    }
    else
    {
        e << dynamic_value_path_info(std::list<dynamic>({path_element}));
    }
}

// REGULAR INTERFACE

void
to_dynamic(dynamic* v, bool x)
{
    *v = x;
}
void
from_dynamic(bool* x, dynamic const& v)
{
    *x = cast<bool>(v);
}

void
to_dynamic(dynamic* v, integer x)
{
    *v = x;
}
void
from_dynamic(integer* x, dynamic const& v)
{
    *x = cast<integer>(v);
}

void
to_dynamic(dynamic* v, double x)
{
    *v = x;
}
void
from_dynamic(double* x, dynamic const& v)
{
    if (v.type() == value_type::INTEGER)
        *x = double(cast<integer>(v));
    else
        *x = cast<double>(v);
}

void
to_dynamic(dynamic* v, string const& x)
{
    *v = x;
}
void
from_dynamic(string* x, dynamic const& v)
{
    *x = cast<string>(v);
}

} // namespace drift

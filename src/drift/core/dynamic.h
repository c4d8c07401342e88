#ifndef DRIFT_CORE_DYNAMIC_H
#define DRIFT_CORE_DYNAMIC_H

#include <initializer_list>
#include <list>

#include <drift/core/exception.h>
#include <drift/core/type_definitions.h>

namespace drift {

// DYNAMIC VALUES - Dynamic values are values whose structure is determined at
// run-time rather than compile time. They are the document representation for
// both desired and observed resource state.

struct dynamic
{
    // CONSTRUCTORS

    // Default construction creates a nil value.
    dynamic()
    {
        storage_ = nil;
    }

    // Construct a dynamic from one of the base types.
    dynamic(nil_t v) : storage_(v)
    {
    }
    dynamic(bool v) : storage_(v)
    {
    }
    dynamic(integer v) : storage_(v)
    {
    }
    dynamic(int v) : storage_(integer(v))
    {
    }
    dynamic(double v) : storage_(v)
    {
    }
    dynamic(string const& v) : storage_(v)
    {
    }
    dynamic(string&& v) : storage_(std::move(v))
    {
    }
    dynamic(char const* v) : storage_(string(v))
    {
    }
    dynamic(dynamic_array const& v) : storage_(v)
    {
    }
    dynamic(dynamic_array&& v) : storage_(std::move(v))
    {
    }
    dynamic(dynamic_map const& v) : storage_(v)
    {
    }
    dynamic(dynamic_map&& v) : storage_(std::move(v))
    {
    }

    // Construct from an initializer list.
    // If every item is a two-element array whose first element is a string,
    // the result is a map. Otherwise, it's an array.
    dynamic(std::initializer_list<dynamic> list);

    // GETTERS

    // Get the type of value stored here.
    // If the storage is in an inconsistent state, this throws
    // malformed_document.
    value_type
    type() const;

    // Get the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    dynamic_storage const&
    contents() const&
    {
        return storage_;
    }

    // Get a non-const reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    dynamic_storage&
    contents() &
    {
        return storage_;
    }

    // Get an r-value reference to the contents.
    // This should be used with caution.
    // cast<T>(dynamic) provides a safer interface to this.
    dynamic_storage&&
    contents() &&
    {
        return std::move(storage_);
    }

 private:
    friend void
    swap(dynamic& a, dynamic& b);

    dynamic_storage storage_;
};

std::ostream&
operator<<(std::ostream& s, value_type t);

// Check that two value types match.
void
check_type(value_type expected, value_type actual);

// If the above check fails, it throws this exception.
DRIFT_DEFINE_EXCEPTION(type_mismatch)
DRIFT_DEFINE_ERROR_INFO(value_type, expected_value_type)
DRIFT_DEFINE_ERROR_INFO(value_type, actual_value_type)

// A dynamic value whose storage doesn't hold any of the supported types.
// This can only arise if the storage is manipulated directly and an exception
// interrupts that manipulation.
DRIFT_DEFINE_EXCEPTION(malformed_document)

// Get the value_type value for a C++ type.
template<class T>
struct value_type_of
{
};
template<>
struct value_type_of<nil_t>
{
    static value_type const value = value_type::NIL;
};
template<>
struct value_type_of<bool>
{
    static value_type const value = value_type::BOOLEAN;
};
template<>
struct value_type_of<integer>
{
    static value_type const value = value_type::INTEGER;
};
template<>
struct value_type_of<double>
{
    static value_type const value = value_type::FLOAT;
};
template<>
struct value_type_of<string>
{
    static value_type const value = value_type::STRING;
};
template<>
struct value_type_of<dynamic_array>
{
    static value_type const value = value_type::ARRAY;
};
template<>
struct value_type_of<dynamic_map>
{
    static value_type const value = value_type::MAP;
};

// MAPS

// This queries a map for a field with a key matching the given string.
// If the field is not present in the map, an exception is thrown.
dynamic const&
get_field(dynamic_map const& r, string const& field);
// non-const version
dynamic&
get_field(dynamic_map& r, string const& field);

DRIFT_DEFINE_EXCEPTION(missing_field)
DRIFT_DEFINE_ERROR_INFO(string, field_name)

// This is the same as above, but its return value indicates whether or not
// the field is in the map.
bool
get_field(dynamic const** v, dynamic_map const& r, string const& field);
// non-const version
bool
get_field(dynamic** v, dynamic_map& r, string const& field);

// When an error occurs in the processing of a dynamic value, this provides the
// path to the location within the value where the error occurred.
DRIFT_DEFINE_ERROR_INFO(std::list<dynamic>, dynamic_value_path)

// Given an exception :e, this will add :path_element to the beginning of the
// dynamic_value_path info associated with :e. If there is currently no path
// info associated with :e, a path containing only :path_element is associated
// with it.
void
add_dynamic_path_element(boost::exception& e, dynamic const& path_element);

// VALUES

// Cast a dynamic value to one of the base types.
template<class T>
T const&
cast(dynamic const& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::get<T>(v.contents());
}
// Same, but with a non-const reference.
template<class T>
T&
cast(dynamic& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::get<T>(v.contents());
}
// Same, but with move semantics.
template<class T>
T&&
cast(dynamic&& v)
{
    check_type(value_type_of<T>::value, v.type());
    return std::get<T>(std::move(v).contents());
}

std::ostream&
operator<<(std::ostream& os, dynamic const& v);

std::ostream&
operator<<(std::ostream& os, std::list<dynamic> const& v);

void
swap(dynamic& a, dynamic& b);

// Note that these are strict: values of different types are never equal, so
// integer(1) != 1.0. (The comparator applies its own numeric equivalence.)
// Two NaN floats are equal.
bool
operator==(dynamic const& a, dynamic const& b);
bool
operator!=(dynamic const& a, dynamic const& b);

// Apply the functor fn to two values of the same type.
// If a and b are not the same type, this throws a type_mismatch exception.
template<class Fn>
auto
apply_to_dynamic_pair(Fn&& fn, dynamic const& a, dynamic const& b)
{
    check_type(a.type(), b.type());
    switch (a.type())
    {
        case value_type::NIL:
        default: // All cases are covered, so this is just to avoid warnings.
            return fn(nil, nil);
        case value_type::BOOLEAN:
            return fn(cast<bool>(a), cast<bool>(b));
        case value_type::INTEGER:
            return fn(cast<integer>(a), cast<integer>(b));
        case value_type::FLOAT:
            return fn(cast<double>(a), cast<double>(b));
        case value_type::STRING:
            return fn(cast<string>(a), cast<string>(b));
        case value_type::ARRAY:
            return fn(cast<dynamic_array>(a), cast<dynamic_array>(b));
        case value_type::MAP:
            return fn(cast<dynamic_map>(a), cast<dynamic_map>(b));
    }
}

// REGULAR INTERFACE - to_dynamic(&v, x) and from_dynamic(&x, v) for the
// base types.

inline void
to_dynamic(dynamic* v, dynamic const& x)
{
    *v = x;
}
inline void
from_dynamic(dynamic* x, dynamic const& v)
{
    *x = v;
}

void
to_dynamic(dynamic* v, bool x);
void
from_dynamic(bool* x, dynamic const& v);

void
to_dynamic(dynamic* v, integer x);
void
from_dynamic(integer* x, dynamic const& v);

void
to_dynamic(dynamic* v, double x);
// Integers are accepted here as well.
void
from_dynamic(double* x, dynamic const& v);

void
to_dynamic(dynamic* v, string const& x);
void
from_dynamic(string* x, dynamic const& v);

template<class Item>
void
to_dynamic(dynamic* v, std::vector<Item> const& x)
{
    dynamic_array array;
    array.reserve(x.size());
    for (auto const& item : x)
    {
        dynamic item_value;
        to_dynamic(&item_value, item);
        array.push_back(std::move(item_value));
    }
    *v = std::move(array);
}

template<class Item>
void
from_dynamic(std::vector<Item>* x, dynamic const& v)
{
    auto const& array = cast<dynamic_array>(v);
    x->clear();
    x->reserve(array.size());
    integer index = 0;
    for (auto const& item_value : array)
    {
        try
        {
            Item item;
            from_dynamic(&item, item_value);
            x->push_back(std::move(item));
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, index);
            throw;
        }
        ++index;
    }
}

// All regular types provide to_dynamic(&v, x) and from_dynamic(&x, v).
// The following are alternate, often more convenient forms.
template<class T>
dynamic
to_dynamic(T const& x)
{
    dynamic v;
    to_dynamic(&v, x);
    return v;
}
template<class T>
T
from_dynamic(dynamic const& v)
{
    T x;
    from_dynamic(&x, v);
    return x;
}

// This is a generic function for reading a field from a dynamic_map.
// Errors are tagged with the field name.
template<class Field>
void
read_field_from_record(
    Field* field_value, dynamic_map const& record, string const& field_name)
{
    auto const& dynamic_field_value = get_field(record, field_name);
    try
    {
        from_dynamic(field_value, dynamic_field_value);
    }
    catch (boost::exception& e)
    {
        drift::add_dynamic_path_element(e, field_name);
        throw;
    }
}

// Same as above, but an absent (or nil) field leaves :field_value untouched
// and returns false.
template<class Field>
bool
read_optional_field_from_record(
    Field* field_value, dynamic_map const& record, string const& field_name)
{
    dynamic const* dynamic_field_value;
    if (!get_field(&dynamic_field_value, record, field_name)
        || dynamic_field_value->type() == value_type::NIL)
    {
        return false;
    }
    try
    {
        from_dynamic(field_value, *dynamic_field_value);
    }
    catch (boost::exception& e)
    {
        drift::add_dynamic_path_element(e, field_name);
        throw;
    }
    return true;
}

template<class Field>
void
write_field_to_record(
    dynamic_map& record, std::string field_name, Field const& field_value)
{
    to_dynamic(&record[std::move(field_name)], field_value);
}

} // namespace drift

#endif

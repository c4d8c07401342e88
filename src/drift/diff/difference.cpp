#include <drift/diff/difference.h>

#include <algorithm>
#include <cctype>
#include <sstream>

#include <drift/encodings/yaml.h>
#include <drift/utilities/errors.h>

namespace drift {

std::ostream&
operator<<(std::ostream& s, difference_kind kind)
{
    switch (kind)
    {
        case difference_kind::ADDED:
            s << "added";
            break;
        case difference_kind::REMOVED:
            s << "removed";
            break;
        case difference_kind::CHANGED:
            s << "changed";
            break;
        case difference_kind::TYPE_MISMATCH:
            s << "type_mismatch";
            break;
        default:
            DRIFT_THROW(
                invalid_enum_value() << enum_id_info("difference_kind")
                                     << enum_value_info(int(kind)));
    }
    return s;
}

void
to_dynamic(dynamic* v, difference_kind kind)
{
    std::ostringstream s;
    s << kind;
    *v = s.str();
}

static bool
is_plain_key(string const& key)
{
    return !key.empty()
           && std::all_of(key.begin(), key.end(), [](char c) {
                  return std::isalnum(static_cast<unsigned char>(c))
                         || c == '_' || c == '-';
              });
}

static void
write_quoted_key(std::ostream& s, string const& key)
{
    s << "[\"";
    for (char c : key)
    {
        if (c == '"' || c == '\\')
            s << '\\';
        s << c;
    }
    s << "\"]";
}

string
format_path(value_path const& path)
{
    if (path.empty())
        return ".";
    std::ostringstream s;
    for (auto const& element : path)
    {
        switch (element.type())
        {
            case value_type::STRING: {
                auto const& key = cast<string>(element);
                if (is_plain_key(key))
                    s << "." << key;
                else
                    write_quoted_key(s, key);
                break;
            }
            case value_type::INTEGER:
                s << "[" << cast<integer>(element) << "]";
                break;
            default:
                // Paths produced by the comparator never contain anything
                // else, but a caller could construct one.
                s << "[" << value_to_yaml(element) << "]";
                break;
        }
    }
    return s.str();
}

difference
make_difference(
    value_path path,
    difference_kind kind,
    optional<dynamic> desired,
    optional<dynamic> observed)
{
    difference d;
    d.path = std::move(path);
    d.kind = kind;
    d.desired = std::move(desired);
    d.observed = std::move(observed);
    return d;
}

bool
operator==(difference const& a, difference const& b)
{
    return a.path == b.path && a.kind == b.kind && a.desired == b.desired
           && a.observed == b.observed;
}
bool
operator!=(difference const& a, difference const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, difference const& d)
{
    s << d.kind << " at " << format_path(d.path);
    if (d.desired)
        s << "\ndesired: " << value_to_yaml(*d.desired);
    if (d.observed)
        s << "\nobserved: " << value_to_yaml(*d.observed);
    return s;
}

void
to_dynamic(dynamic* v, difference const& d)
{
    dynamic_map record;
    write_field_to_record(record, "path", d.path);
    write_field_to_record(record, "kind", d.kind);
    if (d.desired)
        write_field_to_record(record, "desired", *d.desired);
    if (d.observed)
        write_field_to_record(record, "observed", *d.observed);
    *v = std::move(record);
}

string
differences_to_yaml(difference_list const& differences)
{
    return value_to_yaml(to_dynamic(differences));
}

} // namespace drift

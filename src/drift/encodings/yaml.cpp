#include <drift/encodings/yaml.h>

#include <sstream>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

#include <drift/utilities/text.h>

namespace drift {

// YAML I/O

// Read a YAML value into a dynamic.
static dynamic
read_yaml_value(YAML::Node const& yaml)
{
    switch (yaml.Type())
    {
        case YAML::NodeType::Null:
        default: // to avoid warnings
            return nil;
        case YAML::NodeType::Scalar: {
            // This case captures strings, booleans, integers, and doubles.
            // First, check to see if the value was explicitly quoted.
            auto s = yaml.as<string>();
            if (yaml.Tag() == "!")
                return s;
            // The value wasn't quoted.
            // Try to interpret it as a boolean.
            if (s == "true")
                return true;
            if (s == "false")
                return false;
            // Try to interpret it as a number.
            if (!s.compare(0, 2, "0x"))
            {
                std::istringstream stream(s.substr(2));
                integer i;
                stream >> std::hex >> i;
                if (!stream.fail() && stream.tellg() == std::streampos(-1))
                {
                    return i;
                }
            }
            if (!s.compare(0, 2, "0o"))
            {
                std::istringstream stream(s.substr(2));
                integer i;
                stream >> std::oct >> i;
                if (!stream.fail() && stream.tellg() == std::streampos(-1))
                {
                    return i;
                }
            }
            {
                integer i;
                if (boost::conversion::try_lexical_convert(s, i))
                {
                    return i;
                }
            }
            {
                double d;
                if (boost::conversion::try_lexical_convert(s, d))
                {
                    return d;
                }
            }
            // If all else fails, it must just be a string.
            return s;
        }
        case YAML::NodeType::Sequence: {
            dynamic_array array;
            array.reserve(yaml.size());
            for (auto const& i : yaml)
            {
                array.push_back(read_yaml_value(i));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            dynamic_map map;
            for (YAML::Node::const_iterator i = yaml.begin(); i != yaml.end();
                 ++i)
            {
                if (!i->first.IsScalar())
                {
                    YAML::Emitter out;
                    out << i->first;
                    DRIFT_THROW(
                        parsing_error()
                        << expected_format_info("YAML")
                        << parsed_text_info(string(out.c_str(), out.size()))
                        << parsing_error_info("map keys must be scalars"));
                }
                map[i->first.as<string>()] = read_yaml_value(i->second);
            }
            return map;
        }
    }
}

dynamic
parse_yaml_value(char const* yaml, size_t length)
{
    YAML::Node parsed_yaml;
    try
    {
        parsed_yaml = YAML::Load(string(yaml, yaml + length));
    }
    catch (std::exception& e)
    {
        DRIFT_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(string(yaml, yaml + length))
                            << parsing_error_info(e.what()));
    }
    return read_yaml_value(parsed_yaml);
}

// Would this string be read back as something other than a string if it were
// written without quotes?
static bool
string_needs_quoting(string const& s)
{
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL"
           || read_yaml_value(YAML::Node(s)).type() != value_type::STRING;
}

static void
emit_yaml_value(YAML::Emitter& out, dynamic const& v, bool diagnostic)
{
    switch (v.type())
    {
        case value_type::NIL:
        default: // to avoid warnings
            out << YAML::Null;
            break;
        case value_type::BOOLEAN:
            out << cast<bool>(v);
            break;
        case value_type::INTEGER:
            out << cast<integer>(v);
            break;
        case value_type::FLOAT:
            out << cast<double>(v);
            break;
        case value_type::STRING: {
            auto const& s = cast<string>(v);
            if (string_needs_quoting(s))
            {
                // This happens to be a string that looks like some other
                // scalar type, so it should be explicitly quoted.
                out << YAML::DoubleQuoted << s;
            }
            else
            {
                out << s;
            }
            break;
        }
        case value_type::ARRAY: {
            dynamic_array const& array = cast<dynamic_array>(v);
            if (diagnostic && array.size() >= 64)
            {
                out << "<array - size: " + lexical_cast<string>(array.size())
                           + ">";
                break;
            }
            out << YAML::BeginSeq;
            for (auto const& i : array)
            {
                emit_yaml_value(out, i, diagnostic);
            }
            out << YAML::EndSeq;
            break;
        }
        case value_type::MAP: {
            dynamic_map const& x = cast<dynamic_map>(v);
            if (diagnostic && x.size() >= 64)
            {
                out << "<map - size: " + lexical_cast<string>(x.size()) + ">";
                break;
            }
            out << YAML::BeginMap;
            for (auto const& i : x)
            {
                out << YAML::Key;
                emit_yaml_value(out, dynamic(i.first), diagnostic);
                out << YAML::Value;
                emit_yaml_value(out, i.second, diagnostic);
            }
            out << YAML::EndMap;
            break;
        }
    }
}

static string
emit_yaml(dynamic const& v, bool diagnostic)
{
    YAML::Emitter out;
    out << YAML::FloatPrecision(5);
    out << YAML::DoublePrecision(12);
    emit_yaml_value(out, v, diagnostic);
    return out.c_str();
}

string
value_to_yaml(dynamic const& v)
{
    return emit_yaml(v, false);
}

string
value_to_diagnostic_yaml(dynamic const& v)
{
    return emit_yaml(v, true);
}

} // namespace drift

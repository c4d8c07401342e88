#include <drift/normalization/field_folding.h>

#include <algorithm>

#include <drift/encodings/base64.h>
#include <drift/utilities/errors.h>

namespace drift {

std::ostream&
operator<<(std::ostream& s, field_encoding encoding)
{
    switch (encoding)
    {
        case field_encoding::BASE64:
            s << "base64";
            break;
        case field_encoding::BASE64_URL:
            s << "base64url";
            break;
        case field_encoding::IDENTITY:
            s << "identity";
            break;
        default:
            DRIFT_THROW(
                invalid_enum_value() << enum_id_info("field_encoding")
                                     << enum_value_info(int(encoding)));
    }
    return s;
}

field_encoding
parse_field_encoding(string const& name)
{
    if (name == "base64")
        return field_encoding::BASE64;
    if (name == "base64url")
        return field_encoding::BASE64_URL;
    if (name == "identity")
        return field_encoding::IDENTITY;
    DRIFT_THROW(
        invalid_enum_string() << enum_id_info("field_encoding")
                              << enum_string_info(name));
}

string
encode_field_value(field_encoding encoding, string const& value)
{
    switch (encoding)
    {
        case field_encoding::BASE64:
            return base64_encode(value, get_mime_base64_character_set());
        case field_encoding::BASE64_URL:
            return base64_encode(
                value, get_url_friendly_base64_character_set());
        case field_encoding::IDENTITY:
            return value;
        default:
            DRIFT_THROW(
                invalid_enum_value() << enum_id_info("field_encoding")
                                     << enum_value_info(int(encoding)));
    }
}

static bool
matches_marker(dynamic_map const& fields, marker_condition const& marker)
{
    dynamic const* value;
    if (!get_field(&value, fields, marker.field)
        || value->type() == value_type::NIL)
    {
        return marker.allow_absent;
    }
    if (value->type() != value_type::STRING)
        return false;
    auto const& accepted = marker.accepted_values;
    return std::find(accepted.begin(), accepted.end(), cast<string>(*value))
           != accepted.end();
}

bool
matches_markers(
    dynamic const& document, std::vector<marker_condition> const& markers)
{
    if (document.type() != value_type::MAP)
        return false;
    auto const& fields = cast<dynamic_map>(document);
    return std::all_of(
        markers.begin(), markers.end(), [&](marker_condition const& marker) {
            return matches_marker(fields, marker);
        });
}

dynamic
fold_field(dynamic document, field_folding_spec const& spec)
{
    if (document.type() != value_type::MAP)
        return document;
    auto& fields = cast<dynamic_map>(document);

    auto write_only = fields.find(spec.write_only_field);
    if (write_only == fields.end()
        || write_only->second.type() == value_type::NIL)
    {
        return document;
    }
    if (write_only->second.type() != value_type::MAP)
    {
        DRIFT_THROW(
            invalid_field_type()
            << field_name_info(spec.write_only_field)
            << expected_value_type_info(value_type::MAP)
            << actual_value_type_info(write_only->second.type()));
    }
    auto const& entries = cast<dynamic_map>(write_only->second);
    if (entries.empty())
        return document;

    // The merged result is built separately, so the document itself isn't
    // touched until everything has been validated.
    dynamic_map canonical;
    dynamic const* existing;
    if (get_field(&existing, fields, spec.canonical_field)
        && existing->type() != value_type::NIL)
    {
        if (existing->type() != value_type::MAP)
        {
            DRIFT_THROW(
                invalid_field_type()
                << field_name_info(spec.canonical_field)
                << expected_value_type_info(value_type::MAP)
                << actual_value_type_info(existing->type()));
        }
        canonical = cast<dynamic_map>(*existing);
    }

    for (auto const& entry : entries)
    {
        if (entry.second.type() != value_type::STRING)
        {
            DRIFT_THROW(
                invalid_field_type()
                << field_name_info(spec.write_only_field)
                << field_key_info(entry.first)
                << expected_value_type_info(value_type::STRING)
                << actual_value_type_info(entry.second.type()));
        }
        canonical[entry.first]
            = encode_field_value(spec.encoding, cast<string>(entry.second));
    }

    fields.erase(write_only);
    fields[spec.canonical_field] = std::move(canonical);
    return document;
}

bool
field_folding_rule::applies(dynamic const& document) const
{
    return matches_markers(document, spec_.markers);
}

dynamic
field_folding_rule::normalize(dynamic document) const
{
    return fold_field(std::move(document), spec_);
}

field_folding_spec
make_secret_string_data_spec()
{
    field_folding_spec spec;
    spec.name = "secret-string-data";
    spec.markers.push_back(marker_condition{"kind", {"Secret"}, false});
    spec.markers.push_back(marker_condition{"apiVersion", {"v1"}, true});
    spec.write_only_field = "stringData";
    spec.canonical_field = "data";
    spec.encoding = field_encoding::BASE64;
    return spec;
}

void
register_builtin_rules(normalizer_registry& registry)
{
    registry.register_rule(
        std::make_unique<field_folding_rule>(make_secret_string_data_spec()));
}

} // namespace drift

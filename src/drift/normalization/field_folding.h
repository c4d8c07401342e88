#ifndef DRIFT_NORMALIZATION_FIELD_FOLDING_H
#define DRIFT_NORMALIZATION_FIELD_FOLDING_H

#include <memory>
#include <vector>

#include <drift/normalization/registry.h>

// FIELD FOLDING - Many APIs accept a write-only convenience field that the
// server folds into a canonical storage field (applying some encoding) and
// then discards. The classic example is a Kubernetes Secret, where entries in
// 'stringData' are base64-encoded into 'data'. A client that writes
// 'stringData' will never see it again when it reads the object back, so
// without normalization, the two would never compare equal.

namespace drift {

// the encoding applied to each value as it's folded into the canonical field
enum class field_encoding
{
    // MIME base64, with padding
    BASE64,
    // URL-friendly base64, without padding
    BASE64_URL,
    // values are copied as-is
    IDENTITY
};

std::ostream&
operator<<(std::ostream& s, field_encoding encoding);

// Parse an encoding name ("base64", "base64url" or "identity").
// If the name isn't recognized, this throws invalid_enum_string.
field_encoding
parse_field_encoding(string const& name);

string
encode_field_value(field_encoding encoding, string const& value);

// A marker_condition constrains the value of a top-level string field of a
// document, e.g., kind == "Secret".
struct marker_condition
{
    string field;
    // The field must be a string equal to one of these.
    std::vector<string> accepted_values;
    // If this is set, the field may also be absent (or nil).
    bool allow_absent = false;
};

// Does :document satisfy all of :markers?
// This is false for anything that isn't a map.
bool
matches_markers(
    dynamic const& document, std::vector<marker_condition> const& markers);

struct field_folding_spec
{
    string name;
    std::vector<marker_condition> markers;
    string write_only_field;
    string canonical_field;
    field_encoding encoding = field_encoding::BASE64;
};

// Thrown when a document has a value of the wrong shape for a rule.
// field_name_info identifies the field, and field_key_info (when present)
// identifies the entry within it.
DRIFT_DEFINE_EXCEPTION(invalid_field_type)
DRIFT_DEFINE_ERROR_INFO(string, field_key)

// Fold the write-only field of :document into its canonical field, as
// described by :spec. (This ignores :spec.markers.)
//
// If the write-only field is absent, nil or empty, :document is returned
// unchanged. Otherwise, each of its entries is encoded and written into the
// canonical field under the same key, overriding any entry that was already
// there, and the write-only field is removed.
//
// Only string entries can be folded. Anything else (including nested maps and
// arrays) causes an invalid_field_type error.
dynamic
fold_field(dynamic document, field_folding_spec const& spec);

struct field_folding_rule : normalization_rule
{
    explicit field_folding_rule(field_folding_spec spec)
        : spec_(std::move(spec))
    {
    }

    string
    name() const override
    {
        return spec_.name;
    }

    bool
    applies(dynamic const& document) const override;

    dynamic
    normalize(dynamic document) const override;

    field_folding_spec const&
    spec() const
    {
        return spec_;
    }

 private:
    field_folding_spec spec_;
};

// the folding rule for Kubernetes Secrets: stringData is base64-encoded into
// data
field_folding_spec
make_secret_string_data_spec();

// Register the rules that every registry should have.
// (Currently, that's just the Secret rule.)
void
register_builtin_rules(normalizer_registry& registry);

} // namespace drift

#endif

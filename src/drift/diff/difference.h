#ifndef DRIFT_DIFF_DIFFERENCE_H
#define DRIFT_DIFF_DIFFERENCE_H

#include <vector>

#include <drift/core/dynamic.h>

namespace drift {

enum class difference_kind
{
    // The observed document has something that the desired one doesn't.
    ADDED,
    // The observed document is missing something that the desired one has.
    REMOVED,
    // Both documents have a scalar here, but with different values.
    CHANGED,
    // The documents have fundamentally different kinds of values here
    // (e.g., a map and a string).
    TYPE_MISMATCH
};

std::ostream&
operator<<(std::ostream& s, difference_kind kind);

void
to_dynamic(dynamic* v, difference_kind kind);

// value_path represents the path from the root of a document to a point
// within it.
// Path elements can either be strings or nonnegative integers.
// Strings represent map keys.
// Integers represent array indices.
typedef std::vector<dynamic> value_path;

// Render a path in a compact, human-readable form, e.g., '.spec.ports[0]'.
// Keys that aren't plain identifiers are quoted: '.metadata["app.kubernetes.io/name"]'.
// The root path is rendered as '.'.
string
format_path(value_path const& path);

struct difference
{
    value_path path;

    difference_kind kind;

    // the value at :path in the desired document (absent for ADDED)
    optional<dynamic> desired;

    // the value at :path in the observed document (absent for REMOVED)
    optional<dynamic> observed;
};

difference
make_difference(
    value_path path,
    difference_kind kind,
    optional<dynamic> desired,
    optional<dynamic> observed);

bool
operator==(difference const& a, difference const& b);
bool
operator!=(difference const& a, difference const& b);

std::ostream&
operator<<(std::ostream& s, difference const& d);

// Convert a difference to a map with the fields 'path', 'kind', and (where
// present) 'desired' and 'observed'.
void
to_dynamic(dynamic* v, difference const& d);

// An empty list means the documents are equivalent. Anything else is drift.
typedef std::vector<difference> difference_list;

// Write a difference list as YAML.
// Equal lists always produce identical text.
string
differences_to_yaml(difference_list const& differences);

} // namespace drift

#endif

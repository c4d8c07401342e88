#ifndef DRIFT_DIFF_COMPARATOR_H
#define DRIFT_DIFF_COMPARATOR_H

#include <drift/diff/difference.h>
#include <drift/normalization/registry.h>

namespace drift {

// Compute the differences between two documents exactly as given (i.e.,
// without any normalization).
//
// Both documents are walked in lockstep, and a difference is recorded at each
// point where they diverge:
// * Map keys that only appear in :desired are REMOVED; those that only appear
//   in :observed are ADDED. Keys that appear in both are compared
//   recursively.
// * Arrays are compared position by position. Extra items at the end of
//   either array are individually REMOVED or ADDED.
// * Values of different kinds are a TYPE_MISMATCH. Integers and floats are
//   the same kind and compare by numeric value.
// * Unequal scalars of the same kind are CHANGED.
//
// The result is in pre-order, with map keys visited in sorted order, so it's
// fully determined by the two documents.
//
// If either document contains a malformed node, this throws
// malformed_document, with dynamic_value_path_info giving its location.
difference_list
compute_differences(dynamic const& desired, dynamic const& observed);

// comparator normalizes both documents with a registry before computing the
// differences between them.
//
// A comparator holds no state besides the registry reference, so a single
// comparator can be used from any number of threads at once (provided the
// registry isn't being modified).
struct comparator
{
    explicit comparator(normalizer_registry const& registry)
        : registry_(registry)
    {
    }

    // Compare a desired document with an observed one.
    // An empty result means that no update is needed.
    // If either document fails to normalize, this throws
    // normalization_failed (with document_side_info set) and no differences
    // are computed.
    difference_list
    compare(dynamic desired, dynamic observed) const;

    normalizer_registry const&
    registry() const
    {
        return registry_;
    }

 private:
    normalizer_registry const& registry_;
};

} // namespace drift

#endif

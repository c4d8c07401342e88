#ifndef DRIFT_NORMALIZATION_RULE_H
#define DRIFT_NORMALIZATION_RULE_H

#include <drift/core/dynamic.h>

namespace drift {

// A normalization_rule converts one shape of document into the canonical form
// that the server would store for it, so that a document as written by a
// client and the same document as read back from the server compare equal.
//
// Rules must be stateless (or at least safe to call concurrently through a
// const reference), must never depend on anything but the document they're
// given, and must be idempotent: normalizing an already-normalized document
// must not change it.
struct normalization_rule : noncopyable
{
    virtual ~normalization_rule()
    {
    }

    // a name for this rule, used in diagnostics
    virtual string
    name() const = 0;

    // Does this rule apply to :document?
    // This must be cheap and free of side effects. It typically inspects a
    // small set of marker fields (e.g., a kind discriminator).
    virtual bool
    applies(dynamic const& document) const = 0;

    // Return the canonical form of :document.
    // Implementations are free to modify :document and return it.
    // Errors are reported by throwing. The state of :document after an
    // error is unspecified.
    virtual dynamic
    normalize(dynamic document) const = 0;
};

} // namespace drift

#endif

#ifndef DRIFT_NORMALIZATION_REGISTRY_H
#define DRIFT_NORMALIZATION_REGISTRY_H

#include <memory>
#include <vector>

#include <drift/normalization/rule.h>

namespace drift {

// If a rule fails while normalizing a document, this is thrown.
// rule_name_info identifies the rule, and the rule's original exception is
// available through nested_exception_info (and summarized in
// wrapped_exception_diagnostics_info). When thrown from a comparison, it also
// carries document_side_info ("desired" or "observed").
DRIFT_DEFINE_EXCEPTION(normalization_failed)
DRIFT_DEFINE_ERROR_INFO(string, rule_name)
DRIFT_DEFINE_ERROR_INFO(string, document_side)

// normalizer_registry holds an ordered collection of normalization rules.
//
// A registry is filled in once (by a single thread) when the embedding system
// starts up and is then only read. Any number of threads may call
// normalize_all() concurrently, but register_rule() must never overlap with
// any other call.
struct normalizer_registry : noncopyable
{
    // Add a rule to the end of the registry.
    // There's no deduplication and no check against the existing rules.
    // Rules whose predicates overlap are applied in registration order, so if
    // their effects depend on that order, the registry is misconfigured.
    void
    register_rule(std::unique_ptr<normalization_rule> rule);

    size_t
    rule_count() const
    {
        return rules_.size();
    }

    // the names of the registered rules, in registration order
    std::vector<string>
    rule_names() const;

    // Get the canonical form of :document by applying every rule that
    // applies to it, in registration order.
    // This only looks at :document itself. (It doesn't walk the tree looking
    // for other nodes that rules might apply to.)
    // If no rules apply, :document is returned unchanged.
    // If a rule fails, this throws normalization_failed.
    dynamic
    normalize_all(dynamic document) const;

 private:
    std::vector<std::unique_ptr<normalization_rule>> rules_;
};

} // namespace drift

#endif

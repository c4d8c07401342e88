#include <drift/normalization/registry.h>

#include <drift/utilities/logging.h>

namespace drift {

void
normalizer_registry::register_rule(std::unique_ptr<normalization_rule> rule)
{
    get_logger()->info("registering normalization rule {}", rule->name());
    rules_.push_back(std::move(rule));
}

std::vector<string>
normalizer_registry::rule_names() const
{
    std::vector<string> names;
    names.reserve(rules_.size());
    for (auto const& rule : rules_)
        names.push_back(rule->name());
    return names;
}

dynamic
normalizer_registry::normalize_all(dynamic document) const
{
    for (auto const& rule : rules_)
    {
        if (!rule->applies(document))
            continue;
        get_logger()->debug("applying normalization rule {}", rule->name());
        try
        {
            document = rule->normalize(std::move(document));
        }
        catch (boost::exception& e)
        {
            DRIFT_THROW(
                normalization_failed()
                << rule_name_info(rule->name())
                << wrapped_exception_diagnostics_info(
                       boost::diagnostic_information(e))
                << nested_exception_info(std::current_exception()));
        }
        catch (std::exception& e)
        {
            DRIFT_THROW(
                normalization_failed()
                << rule_name_info(rule->name())
                << wrapped_exception_diagnostics_info(e.what())
                << nested_exception_info(std::current_exception()));
        }
        catch (...)
        {
            DRIFT_THROW(
                normalization_failed()
                << rule_name_info(rule->name())
                << wrapped_exception_diagnostics_info("unknown exception")
                << nested_exception_info(std::current_exception()));
        }
    }
    return document;
}

} // namespace drift

#include <drift/config.h>

#include <drift/encodings/yaml.h>
#include <drift/fs/file_io.h>
#include <drift/utilities/logging.h>

namespace drift {

void
from_dynamic(logging_config* x, dynamic const& v)
{
    auto const& record = cast<dynamic_map>(v);
    *x = logging_config();
    string level;
    if (read_optional_field_from_record(&level, record, "level"))
    {
        try
        {
            x->level = parse_log_level(level);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, "level");
            throw;
        }
    }
}

void
from_dynamic(marker_condition* x, dynamic const& v)
{
    auto const& record = cast<dynamic_map>(v);
    *x = marker_condition();
    read_field_from_record(&x->field, record, "field");
    read_optional_field_from_record(&x->accepted_values, record, "values");
    read_optional_field_from_record(&x->allow_absent, record, "allow_absent");
}

void
from_dynamic(field_folding_spec* x, dynamic const& v)
{
    auto const& record = cast<dynamic_map>(v);
    *x = field_folding_spec();
    read_field_from_record(&x->name, record, "name");
    read_optional_field_from_record(&x->markers, record, "markers");
    read_field_from_record(&x->write_only_field, record, "write_only_field");
    read_field_from_record(&x->canonical_field, record, "canonical_field");
    string encoding;
    if (read_optional_field_from_record(&encoding, record, "encoding"))
    {
        try
        {
            x->encoding = parse_field_encoding(encoding);
        }
        catch (boost::exception& e)
        {
            add_dynamic_path_element(e, "encoding");
            throw;
        }
    }
    // Folding a field into itself would re-encode it every time it was
    // normalized.
    if (x->write_only_field == x->canonical_field)
    {
        DRIFT_THROW(
            invalid_config()
            << rule_name_info(x->name)
            << config_problem_info(
                   "write_only_field and canonical_field must differ"));
    }
}

void
from_dynamic(checker_config* x, dynamic const& v)
{
    auto const& record = cast<dynamic_map>(v);
    *x = checker_config();
    read_optional_field_from_record(&x->logging, record, "logging");
    read_optional_field_from_record(
        &x->builtin_rules, record, "builtin_rules");
    read_optional_field_from_record(
        &x->folding_rules, record, "folding_rules");
}

checker_config
read_checker_config(dynamic const& v)
{
    // An empty file parses as nil, which just means "use the defaults".
    if (v.type() == value_type::NIL)
        return checker_config();
    return from_dynamic<checker_config>(v);
}

checker_config
load_checker_config(file_path const& path)
{
    get_logger()->info("loading configuration from {}", path.string());
    return read_checker_config(parse_yaml_value(read_file_contents(path)));
}

void
configure_registry(normalizer_registry& registry, checker_config const& config)
{
    if (config.builtin_rules)
        register_builtin_rules(registry);
    for (auto const& spec : config.folding_rules)
        registry.register_rule(std::make_unique<field_folding_rule>(spec));
}

void
apply_logging_config(logging_config const& config)
{
    initialize_logging(config.level);
}

} // namespace drift

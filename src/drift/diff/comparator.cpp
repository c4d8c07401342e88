#include <drift/diff/comparator.h>

#include <algorithm>
#include <cmath>

#include <drift/utilities/logging.h>

namespace drift {

static value_path
extend_path(value_path const& path, dynamic const& addition)
{
    value_path extended = path;
    extended.push_back(addition);
    return extended;
}

// Check that every node within :v is well-formed.
// (Values that only appear on one side are recorded without being walked by
// the comparison itself, so they have to be checked separately.)
static void
check_well_formed(dynamic const& v)
{
    switch (v.type())
    {
        case value_type::ARRAY: {
            integer index = 0;
            for (auto const& item : cast<dynamic_array>(v))
            {
                try
                {
                    check_well_formed(item);
                }
                catch (boost::exception& e)
                {
                    add_dynamic_path_element(e, index);
                    throw;
                }
                ++index;
            }
            break;
        }
        case value_type::MAP:
            for (auto const& field : cast<dynamic_map>(v))
            {
                try
                {
                    check_well_formed(field.second);
                }
                catch (boost::exception& e)
                {
                    add_dynamic_path_element(e, field.first);
                    throw;
                }
            }
            break;
        default:
            break;
    }
}

// Record a value that's only present in one of the documents.
static void
record_one_sided(
    difference_list& differences,
    value_path const& path,
    dynamic const& path_element,
    difference_kind kind,
    dynamic const& value)
{
    try
    {
        check_well_formed(value);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, path_element);
        throw;
    }
    auto extended = extend_path(path, path_element);
    if (kind == difference_kind::ADDED)
    {
        differences.push_back(
            make_difference(std::move(extended), kind, none, some(value)));
    }
    else
    {
        differences.push_back(
            make_difference(std::move(extended), kind, some(value), none));
    }
}

// Integers and floats are both just numbers as far as comparison goes.
static bool
is_number(value_type type)
{
    return type == value_type::INTEGER || type == value_type::FLOAT;
}

static bool
same_kind(value_type a, value_type b)
{
    return a == b || (is_number(a) && is_number(b));
}

static bool
integer_equals_float(integer i, double d)
{
    // This also rejects NaN.
    if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0))
        return false;
    return std::trunc(d) == d && integer(d) == i;
}

static bool
scalars_equal(dynamic const& a, dynamic const& b)
{
    if (a.type() == value_type::INTEGER && b.type() == value_type::FLOAT)
        return integer_equals_float(cast<integer>(a), cast<double>(b));
    if (a.type() == value_type::FLOAT && b.type() == value_type::INTEGER)
        return integer_equals_float(cast<integer>(b), cast<double>(a));
    // Same kind, so this is exact (and treats NaN as equal to NaN).
    return a == b;
}

static void
compute_differences(
    difference_list& differences,
    value_path const& path,
    dynamic const& desired,
    dynamic const& observed);

// Recurse into a child, tagging any error with the child's path element.
static void
compute_child_differences(
    difference_list& differences,
    value_path const& path,
    dynamic const& path_element,
    dynamic const& desired,
    dynamic const& observed)
{
    try
    {
        compute_differences(
            differences, extend_path(path, path_element), desired, observed);
    }
    catch (boost::exception& e)
    {
        add_dynamic_path_element(e, path_element);
        throw;
    }
}

static void
compute_map_differences(
    difference_list& differences,
    value_path const& path,
    dynamic_map const& desired,
    dynamic_map const& observed)
{
    auto d_i = desired.begin(), d_end = desired.end();
    auto o_i = observed.begin(), o_end = observed.end();
    while (d_i != d_end || o_i != o_end)
    {
        if (o_i == o_end || (d_i != d_end && d_i->first < o_i->first))
        {
            record_one_sided(
                differences,
                path,
                d_i->first,
                difference_kind::REMOVED,
                d_i->second);
            ++d_i;
        }
        else if (d_i == d_end || o_i->first < d_i->first)
        {
            record_one_sided(
                differences,
                path,
                o_i->first,
                difference_kind::ADDED,
                o_i->second);
            ++o_i;
        }
        else
        {
            compute_child_differences(
                differences, path, d_i->first, d_i->second, o_i->second);
            ++d_i;
            ++o_i;
        }
    }
}

static void
compute_array_differences(
    difference_list& differences,
    value_path const& path,
    dynamic_array const& desired,
    dynamic_array const& observed)
{
    size_t common_size = std::min(desired.size(), observed.size());
    for (size_t i = 0; i != common_size; ++i)
    {
        compute_child_differences(
            differences, path, integer(i), desired[i], observed[i]);
    }
    for (size_t i = common_size; i < desired.size(); ++i)
    {
        record_one_sided(
            differences,
            path,
            integer(i),
            difference_kind::REMOVED,
            desired[i]);
    }
    for (size_t i = common_size; i < observed.size(); ++i)
    {
        record_one_sided(
            differences,
            path,
            integer(i),
            difference_kind::ADDED,
            observed[i]);
    }
}

static void
compute_differences(
    difference_list& differences,
    value_path const& path,
    dynamic const& desired,
    dynamic const& observed)
{
    auto desired_type = desired.type();
    auto observed_type = observed.type();
    if (!same_kind(desired_type, observed_type))
    {
        check_well_formed(desired);
        check_well_formed(observed);
        differences.push_back(make_difference(
            path, difference_kind::TYPE_MISMATCH, some(desired),
            some(observed)));
        return;
    }
    switch (desired_type)
    {
        case value_type::MAP:
            compute_map_differences(
                differences,
                path,
                cast<dynamic_map>(desired),
                cast<dynamic_map>(observed));
            break;
        case value_type::ARRAY:
            compute_array_differences(
                differences,
                path,
                cast<dynamic_array>(desired),
                cast<dynamic_array>(observed));
            break;
        default:
            if (!scalars_equal(desired, observed))
            {
                differences.push_back(make_difference(
                    path, difference_kind::CHANGED, some(desired),
                    some(observed)));
            }
            break;
    }
}

difference_list
compute_differences(dynamic const& desired, dynamic const& observed)
{
    difference_list differences;
    compute_differences(differences, value_path(), desired, observed);
    return differences;
}

static dynamic
normalize_document(
    normalizer_registry const& registry, dynamic document, char const* side)
{
    try
    {
        return registry.normalize_all(std::move(document));
    }
    catch (normalization_failed& e)
    {
        e << document_side_info(side);
        auto const* rule_name = get_error_info<rule_name_info>(e);
        get_logger()->warn(
            "failed to normalize {} document with rule {}",
            side,
            rule_name ? *rule_name : string("(unknown)"));
        throw;
    }
}

difference_list
comparator::compare(dynamic desired, dynamic observed) const
{
    auto normalized_desired
        = normalize_document(registry_, std::move(desired), "desired");
    auto normalized_observed
        = normalize_document(registry_, std::move(observed), "observed");
    auto differences
        = compute_differences(normalized_desired, normalized_observed);
    get_logger()->debug("found {} difference(s)", differences.size());
    return differences;
}

} // namespace drift

#include <drift/diff/comparator.h>

#include <limits>
#include <thread>

#include <drift/normalization/field_folding.h>
#include <drift/utilities/testing.h>

using namespace drift;

static difference_list
diff(string const& desired, string const& observed)
{
    return compute_differences(test_document(desired), test_document(observed));
}

TEST_CASE("equal documents", "[diff][comparator]")
{
    REQUIRE(diff("~", "~").empty());
    REQUIRE(diff("12", "12").empty());
    REQUIRE(diff("{a: [1, {b: c}], d: x}", "{d: x, a: [1, {b: c}]}").empty());
    REQUIRE(diff("{}", "{}").empty());
    REQUIRE(diff("[]", "[]").empty());
}

TEST_CASE("scalar differences", "[diff][comparator]")
{
    REQUIRE(
        diff("1", "2")
        == (difference_list{make_difference(
            value_path(),
            difference_kind::CHANGED,
            some(dynamic(integer(1))),
            some(dynamic(integer(2))))}));
    REQUIRE(
        diff("{a: x}", "{a: y}")
        == (difference_list{make_difference(
            value_path{"a"},
            difference_kind::CHANGED,
            some(dynamic("x")),
            some(dynamic("y")))}));
    REQUIRE(
        diff("{a: true}", "{a: false}")
        == (difference_list{make_difference(
            value_path{"a"},
            difference_kind::CHANGED,
            some(dynamic(true)),
            some(dynamic(false)))}));
}

TEST_CASE("numeric comparison", "[diff][comparator]")
{
    // Integers and floats with the same value are equal.
    REQUIRE(diff("1", "1.0").empty());
    REQUIRE(diff("{replicas: 3.0}", "{replicas: 3}").empty());
    REQUIRE(diff("-2", "-2.0").empty());

    // But they're still compared by value.
    REQUIRE(
        diff("1", "1.5")
        == (difference_list{make_difference(
            value_path(),
            difference_kind::CHANGED,
            some(dynamic(integer(1))),
            some(dynamic(1.5)))}));
    REQUIRE(diff("0.25", "0.5").size() == 1);

    // Floats far outside the integer range don't compare equal to anything.
    REQUIRE(
        compute_differences(dynamic(integer(0)), dynamic(1e300)).size() == 1);
    REQUIRE(
        compute_differences(
            dynamic(integer(0)), dynamic(std::numeric_limits<double>::quiet_NaN()))
            .size()
        == 1);
}

TEST_CASE("NaN comparison", "[diff][comparator]")
{
    // A NaN never differs from itself, so comparing a document with itself
    // always finds nothing.
    auto document = test_document("{replicas: nan, spec: {ratio: nan}}");
    REQUIRE(
        get_field(cast<dynamic_map>(document), "replicas").type()
        == value_type::FLOAT);
    REQUIRE(document == test_document("{replicas: nan, spec: {ratio: nan}}"));
    REQUIRE(compute_differences(document, document).empty());

    auto nan = std::numeric_limits<double>::quiet_NaN();
    dynamic built{{"replicas", nan}};
    REQUIRE(compute_differences(built, built).empty());

    normalizer_registry registry;
    register_builtin_rules(registry);
    comparator c(registry);
    REQUIRE(c.compare(built, built).empty());

    // But NaN still differs from every number.
    REQUIRE(
        compute_differences(built, dynamic{{"replicas", 1.5}})
        == (difference_list{make_difference(
            value_path{"replicas"},
            difference_kind::CHANGED,
            some(dynamic(nan)),
            some(dynamic(1.5)))}));
}

TEST_CASE("type mismatches", "[diff][comparator]")
{
    REQUIRE(
        diff("{a: {b: c}}", "{a: text}")
        == (difference_list{make_difference(
            value_path{"a"},
            difference_kind::TYPE_MISMATCH,
            some(test_document("{b: c}")),
            some(dynamic("text")))}));

    // Strings that look like numbers are still strings.
    REQUIRE(
        diff(R"({a: "1"})", "{a: 1}")
        == (difference_list{make_difference(
            value_path{"a"},
            difference_kind::TYPE_MISMATCH,
            some(dynamic("1")),
            some(dynamic(integer(1))))}));

    // nil is its own kind.
    REQUIRE(
        diff("{a: null}", "{a: false}")[0].kind
        == difference_kind::TYPE_MISMATCH);

    // A mismatch isn't recursed into.
    REQUIRE(diff("[1, 2, 3]", "{a: 1, b: 2}").size() == 1);
}

TEST_CASE("absence is symmetric", "[diff][comparator]")
{
    REQUIRE(
        diff("{a: 1, b: 2}", "{a: 1}")
        == (difference_list{make_difference(
            value_path{"b"},
            difference_kind::REMOVED,
            some(dynamic(integer(2))),
            none)}));
    REQUIRE(
        diff("{a: 1}", "{a: 1, b: 2}")
        == (difference_list{make_difference(
            value_path{"b"},
            difference_kind::ADDED,
            none,
            some(dynamic(integer(2))))}));

    // A key that's only on one side is reported once, with its whole value.
    REQUIRE(
        diff("{}", "{status: {ready: true, replicas: 2}}")
        == (difference_list{make_difference(
            value_path{"status"},
            difference_kind::ADDED,
            none,
            some(test_document("{ready: true, replicas: 2}")))}));

    // A nil value is still a value.
    REQUIRE(
        diff("{a: null}", "{}")
        == (difference_list{make_difference(
            value_path{"a"},
            difference_kind::REMOVED,
            some(dynamic()),
            none)}));
}

TEST_CASE("array comparison", "[diff][comparator]")
{
    REQUIRE(
        diff("[1, 2, 3]", "[1, 5, 3]")
        == (difference_list{make_difference(
            value_path{integer(1)},
            difference_kind::CHANGED,
            some(dynamic(integer(2))),
            some(dynamic(integer(5))))}));

    // Extra items are reported individually, in index order.
    REQUIRE(
        diff("[a, b, c, d]", "[a, b]")
        == (difference_list{
            make_difference(
                value_path{integer(2)},
                difference_kind::REMOVED,
                some(dynamic("c")),
                none),
            make_difference(
                value_path{integer(3)},
                difference_kind::REMOVED,
                some(dynamic("d")),
                none)}));
    REQUIRE(
        diff("{ports: [80]}", "{ports: [80, 443, 8080]}")
        == (difference_list{
            make_difference(
                value_path{"ports", integer(1)},
                difference_kind::ADDED,
                none,
                some(dynamic(integer(443)))),
            make_difference(
                value_path{"ports", integer(2)},
                difference_kind::ADDED,
                none,
                some(dynamic(integer(8080))))}));

    // Order matters.
    REQUIRE(diff("[a, b]", "[b, a]").size() == 2);
}

TEST_CASE("difference order", "[diff][comparator]")
{
    auto differences = diff(
        R"(
            z: 1
            a: {y: 1, b: [1, 2]}
            m: gone
        )",
        R"(
            a: {b: [1, 3], y: 2, c: new}
            z: 2
        )");
    std::vector<string> paths;
    for (auto const& d : differences)
        paths.push_back(format_path(d.path));
    REQUIRE(
        paths
        == (std::vector<string>{".a.b[1]", ".a.c", ".a.y", ".m", ".z"}));
}

TEST_CASE("malformed documents", "[diff][comparator]")
{
    auto desired = test_document("{spec: {items: [a, b]}}");
    auto observed = desired;

    // Break the observed document's second item.
    auto& item = cast<dynamic_array>(get_field(
        cast<dynamic_map>(get_field(cast<dynamic_map>(observed), "spec")),
        "items"))[1];
    try
    {
        item.contents().emplace<dynamic_array>(
            dynamic_array().max_size() + 1);
    }
    catch (std::exception&)
    {
    }
    REQUIRE(item.contents().valueless_by_exception());

    REQUIRE(
        require_error_info<malformed_document, dynamic_value_path_info>(
            [&] { compute_differences(desired, observed); })
        == (std::list<dynamic>{"spec", "items", integer(1)}));

    // It's also caught when it's only on one side.
    REQUIRE(
        require_error_info<malformed_document, dynamic_value_path_info>(
            [&] { compute_differences(dynamic_map(), observed); })
        == (std::list<dynamic>{"spec", "items", integer(1)}));
}

TEST_CASE("secret comparison", "[diff][comparator]")
{
    normalizer_registry registry;
    register_builtin_rules(registry);
    comparator c(registry);
    REQUIRE(&c.registry() == &registry);

    auto desired = test_document(R"(
        apiVersion: v1
        kind: Secret
        metadata: {name: creds}
        stringData:
          username: admin
          password: secret123
    )");
    auto observed = test_document(R"(
        apiVersion: v1
        kind: Secret
        metadata: {name: creds}
        data:
          username: YWRtaW4=
          password: c2VjcmV0MTIz
    )");

    // Without normalization, these look completely different.
    REQUIRE(compute_differences(desired, observed).size() == 2);

    // With it, there's no drift.
    REQUIRE(c.compare(desired, observed).empty());
    REQUIRE(c.compare(observed, desired).empty());
    REQUIRE(c.compare(desired, desired).empty());

    // A real change still shows up, in terms of the canonical field.
    auto changed = test_document(R"(
        apiVersion: v1
        kind: Secret
        metadata: {name: creds}
        stringData:
          username: root
          password: secret123
    )");
    REQUIRE(
        c.compare(changed, observed)
        == (difference_list{make_difference(
            value_path{"data", "username"},
            difference_kind::CHANGED,
            some(dynamic("cm9vdA==")),
            some(dynamic("YWRtaW4=")))}));
}

TEST_CASE("comparison without rules", "[diff][comparator]")
{
    normalizer_registry registry;
    comparator c(registry);
    auto desired = test_document("{kind: Secret, stringData: {a: x}}");
    auto observed = test_document("{kind: Secret, data: {a: eA==}}");
    REQUIRE(
        c.compare(desired, observed)
        == compute_differences(desired, observed));
}

TEST_CASE("normalization failures", "[diff][comparator]")
{
    normalizer_registry registry;
    register_builtin_rules(registry);
    comparator c(registry);

    auto good = test_document("{kind: Secret, data: {a: eA==}}");
    auto bad = test_document("{kind: Secret, stringData: {a: {b: c}}}");

    auto check_failure = [&](dynamic const& desired,
                             dynamic const& observed,
                             string const& side) {
        try
        {
            c.compare(desired, observed);
            FAIL("no exception thrown");
        }
        catch (normalization_failed& e)
        {
            REQUIRE(get_required_error_info<document_side_info>(e) == side);
            REQUIRE(
                get_required_error_info<rule_name_info>(e)
                == "secret-string-data");
            try
            {
                std::rethrow_exception(
                    get_required_error_info<nested_exception_info>(e));
            }
            catch (invalid_field_type& inner)
            {
                REQUIRE(
                    get_required_error_info<field_name_info>(inner)
                    == "stringData");
            }
        }
    };

    check_failure(bad, good, "desired");
    check_failure(good, bad, "observed");
    check_failure(bad, bad, "desired");
}

TEST_CASE("deterministic comparison", "[diff][comparator]")
{
    normalizer_registry registry;
    register_builtin_rules(registry);
    comparator c(registry);

    dynamic_map desired_a, desired_b;
    desired_a["kind"] = "Secret";
    desired_a["stringData"] = dynamic_map{{"x", dynamic("1")}, {"y", dynamic("2")}};
    desired_a["extra"] = integer(1);
    desired_b["extra"] = integer(1);
    desired_b["stringData"] = dynamic_map{{"y", dynamic("2")}, {"x", dynamic("1")}};
    desired_b["kind"] = "Secret";
    auto observed = test_document("{kind: Secret, data: {x: MQ==}}");

    auto a = c.compare(desired_a, observed);
    auto b = c.compare(desired_b, observed);
    REQUIRE(a == b);
    REQUIRE(differences_to_yaml(a) == differences_to_yaml(b));
}

TEST_CASE("concurrent comparisons", "[diff][comparator]")
{
    normalizer_registry registry;
    register_builtin_rules(registry);
    comparator const c(registry);

    auto desired = test_document(R"(
        kind: Secret
        stringData: {username: admin, password: secret123, extra: x}
    )");
    auto observed = test_document(R"(
        kind: Secret
        data: {username: YWRtaW4=, password: c2VjcmV0MTIz}
        type: Opaque
    )");
    auto expected = c.compare(desired, observed);
    REQUIRE(expected.size() == 2);

    std::vector<difference_list> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i != results.size(); ++i)
    {
        threads.emplace_back([&, i] {
            for (int j = 0; j != 20; ++j)
                results[i] = c.compare(desired, observed);
        });
    }
    for (auto& thread : threads)
        thread.join();

    for (auto const& result : results)
        REQUIRE(result == expected);
}

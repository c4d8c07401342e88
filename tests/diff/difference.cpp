#include <drift/diff/difference.h>

#include <sstream>

#include <drift/utilities/errors.h>
#include <drift/utilities/testing.h>
#include <drift/utilities/text.h>

using namespace drift;

TEST_CASE("difference kind streaming", "[diff][difference]")
{
    REQUIRE(lexical_cast<string>(difference_kind::ADDED) == "added");
    REQUIRE(lexical_cast<string>(difference_kind::REMOVED) == "removed");
    REQUIRE(lexical_cast<string>(difference_kind::CHANGED) == "changed");
    REQUIRE(
        lexical_cast<string>(difference_kind::TYPE_MISMATCH)
        == "type_mismatch");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(difference_kind(-1)), invalid_enum_value);

    REQUIRE(to_dynamic(difference_kind::CHANGED) == dynamic("changed"));
}

TEST_CASE("path formatting", "[diff][difference]")
{
    REQUIRE(format_path(value_path()) == ".");
    REQUIRE(format_path(value_path{"data"}) == ".data");
    REQUIRE(
        format_path(value_path{"spec", "ports", integer(0), "port"})
        == ".spec.ports[0].port");
    REQUIRE(
        format_path(value_path{integer(2), integer(10)}) == "[2][10]");
    REQUIRE(
        format_path(value_path{"metadata", "labels", "app.kubernetes.io/name"})
        == ".metadata.labels[\"app.kubernetes.io/name\"]");
    REQUIRE(
        format_path(value_path{"data", "my_key-1"}) == ".data.my_key-1");
    REQUIRE(format_path(value_path{""}) == "[\"\"]");
    REQUIRE(format_path(value_path{"say \"hi\""}) == "[\"say \\\"hi\\\"\"]");
}

TEST_CASE("difference equality", "[diff][difference]")
{
    auto a = make_difference(
        value_path{"data", "a"},
        difference_kind::CHANGED,
        some(dynamic("eA==")),
        some(dynamic("eQ==")));
    auto b = a;
    REQUIRE(a == b);

    b.kind = difference_kind::TYPE_MISMATCH;
    REQUIRE(a != b);

    b = a;
    b.observed = none;
    REQUIRE(a != b);

    b = a;
    b.path = value_path{"data", "b"};
    REQUIRE(a != b);
}

TEST_CASE("difference streaming", "[diff][difference]")
{
    {
        std::ostringstream s;
        s << make_difference(
            value_path{"data", "a"},
            difference_kind::CHANGED,
            some(dynamic("eA==")),
            some(dynamic("eQ==")));
        REQUIRE(
            s.str() == "changed at .data.a\ndesired: eA==\nobserved: eQ==");
    }
    {
        std::ostringstream s;
        s << make_difference(
            value_path{"replicas"},
            difference_kind::ADDED,
            none,
            some(dynamic(integer(3))));
        REQUIRE(s.str() == "added at .replicas\nobserved: 3");
    }
    {
        std::ostringstream s;
        s << make_difference(
            value_path{"replicas"},
            difference_kind::REMOVED,
            some(dynamic(integer(3))),
            none);
        REQUIRE(s.str() == "removed at .replicas\ndesired: 3");
    }
}

TEST_CASE("difference serialization", "[diff][difference]")
{
    difference_list differences{
        make_difference(
            value_path{"spec", integer(1)},
            difference_kind::REMOVED,
            some(dynamic("x")),
            none),
        make_difference(
            value_path{"status"},
            difference_kind::TYPE_MISMATCH,
            some(dynamic(dynamic_map())),
            some(dynamic("ready")))};

    REQUIRE(
        to_dynamic(differences[0])
        == test_document(R"(
            path: [spec, 1]
            kind: removed
            desired: x
        )"));

    REQUIRE(
        parse_yaml_value(differences_to_yaml(differences))
        == test_document(R"(
            - path: [spec, 1]
              kind: removed
              desired: x
            - path: [status]
              kind: type_mismatch
              desired: {}
              observed: ready
        )"));

    // Strings that look like other things are quoted so that they read back
    // the same way.
    difference_list tricky{make_difference(
        value_path{"data", "flag"},
        difference_kind::CHANGED,
        some(dynamic("true")),
        some(dynamic(true)))};
    REQUIRE(
        parse_yaml_value(differences_to_yaml(tricky)) == to_dynamic(tricky));

    REQUIRE(differences_to_yaml(difference_list()) == "[]");
}

#include <catch2/catch_test_macros.hpp>
#include "parser/parse_context.hpp"
#include "parser/rules.hpp"
#include "kdl_fixture.hpp"

#include <vector>

using namespace motya;
using test::KdlFixture;

TEST_CASE("Rules: empty rule list passes", "[parser][rules]") {
    KdlFixture kdl("anything 1 k=2 { child; }\n");
    CHECK(kdl.node().validate({}).is_ok());
}

TEST_CASE("Rules: validate needs a node", "[parser][rules]") {
    KdlFixture kdl("a\n");
    const std::vector<Rule> rules{Rule::no_children()};
    auto result = kdl.root().validate(rules);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::STRUCTURAL_ERROR);
}

TEST_CASE("Rules: no_children", "[parser][rules]") {
    KdlFixture kdl("flat 1\nnested { x; }\n");
    const std::vector<Rule> rules{Rule::no_children()};

    CHECK(kdl.node(0).validate(rules).is_ok());

    auto nested = kdl.node(1).validate(rules);
    REQUIRE(nested.is_error());
    CHECK(nested.error_category() == ErrorCategory::STRUCTURAL_ERROR);
    CHECK(nested.error_message() == "Directive 'nested' does not accept a children block");
    CHECK(nested.diagnostic().column() == 8);
}

TEST_CASE("Rules: no_positional_args", "[parser][rules]") {
    KdlFixture kdl("ok k=1\nbad k=1 \"pos\"\n");
    const std::vector<Rule> rules{Rule::no_positional_args()};

    CHECK(kdl.node(0).validate(rules).is_ok());

    auto bad = kdl.node(1).validate(rules);
    REQUIRE(bad.is_error());
    CHECK(bad.error_message() == R"(Directive 'bad' does not accept positional arguments, found String("pos"))");
}

TEST_CASE("Rules: only_keys_typed rejects unknown keys", "[parser][rules]") {
    KdlFixture kdl("l cert-path=\"a\" colour=\"red\"\n");
    const std::vector<Rule> rules{Rule::only_keys_typed({
        {"cert-path", ValueKind::STRING},
        {"key-path", ValueKind::STRING},
    })};

    auto result = kdl.node().validate(rules);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::UNKNOWN_KEY);
    CHECK(result.error_message() ==
          R"(Unknown configuration key: 'colour'. Allowed keys are: ["cert-path", "key-path"])");
}

TEST_CASE("Rules: only_keys_typed checks value kinds", "[parser][rules]") {
    KdlFixture kdl("l offer-h2=\"yes\"\n");
    const std::vector<Rule> rules{Rule::only_keys_typed({{"offer-h2", ValueKind::BOOLEAN}})};

    auto result = kdl.node().validate(rules);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::TYPE_MISMATCH);
    CHECK(result.error_message() == R"(Property 'offer-h2' must be of type Boolean, found String("yes"))");
}

TEST_CASE("Rules: only_keys_typed ignores positional entries and absent keys", "[parser][rules]") {
    KdlFixture kdl("l \"pos\" 5\n");
    const std::vector<Rule> rules{Rule::only_keys_typed({{"offer-h2", ValueKind::BOOLEAN}})};
    CHECK(kdl.node().validate(rules).is_ok());
}

TEST_CASE("Rules: name predicate", "[parser][rules]") {
    KdlFixture kdl("\"127.0.0.1:8080\"\n\"not-an-address\"\ncom.example.auth\n");

    const std::vector<Rule> addr{Rule::name(NamePredicate::SOCKET_ADDR)};
    CHECK(kdl.node(0).validate(addr).is_ok());

    auto bad = kdl.node(1).validate(addr);
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::FORMAT_ERROR);
    CHECK(bad.error_message() ==
          "Invalid SocketAddr 'not-an-address'. Reason: invalid socket address syntax");

    const std::vector<Rule> fqdn{Rule::name(NamePredicate::FQDN)};
    CHECK(kdl.node(2).validate(fqdn).is_ok());
}

TEST_CASE("Rules: first violation wins", "[parser][rules]") {
    KdlFixture kdl("x \"pos\" { c; }\n");
    const std::vector<Rule> rules{Rule::no_positional_args(), Rule::no_children()};

    auto result = kdl.node().validate(rules);
    REQUIRE(result.is_error());
    CHECK(result.error_message().starts_with("Directive 'x' does not accept positional arguments"));
}

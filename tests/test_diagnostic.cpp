#include <catch2/catch_test_macros.hpp>
#include "core/error.hpp"
#include "kdl_fixture.hpp"

#include <string>

using namespace motya;

TEST_CASE("Diagnostic: help points at line and column", "[diagnostic]") {
    const std::string text = "a\nfoo bar\n";
    const auto d = Diagnostic::in_text(ErrorCategory::FORMAT_ERROR, "boom", text, Span{6, 3}, "test");

    CHECK(d.category() == ErrorCategory::FORMAT_ERROR);
    CHECK(d.message() == "boom");
    CHECK(d.source_name() == "test");
    CHECK(d.line() == 2);
    CHECK(d.column() == 5);
    REQUIRE(d.span().has_value());
    CHECK(d.span()->offset == 6);
    CHECK(d.help() ==
        "error: boom\n"
        "  --> test:2:5\n"
        "  |\n"
        "2 | foo bar\n"
        "  |     ^^^");
}

TEST_CASE("Diagnostic: underline is clamped to the offending line", "[diagnostic]") {
    const std::string text = "first\nsecond\nthird";
    const auto d = Diagnostic::in_text(ErrorCategory::STRUCTURAL_ERROR, "x", text, Span{6, 100}, "f.kdl");
    CHECK(d.line() == 2);
    CHECK(d.column() == 1);
    CHECK(d.help().ends_with("2 | second\n  | ^^^^^^"));
}

TEST_CASE("Diagnostic: empty span still gets one caret", "[diagnostic]") {
    const std::string text = "node\n";
    const auto d = Diagnostic::in_text(ErrorCategory::STRUCTURAL_ERROR, "x", text, Span{2, 0}, "f.kdl");
    CHECK(d.help().ends_with("  |   ^"));
}

TEST_CASE("Diagnostic: gutter widens with the line number", "[diagnostic]") {
    std::string text;
    for (int i = 0; i < 11; ++i) text += "n\n";
    text += "bad";
    const auto d = Diagnostic::in_text(ErrorCategory::SYNTAX_ERROR, "x", text, Span{22, 3}, "f.kdl");
    CHECK(d.line() == 12);
    CHECK(d.help() ==
        "error: x\n"
        "   --> f.kdl:12:1\n"
        "   |\n"
        "12 | bad\n"
        "   | ^^^");
}

TEST_CASE("Diagnostic: detached diagnostic has no location", "[diagnostic]") {
    const auto d = Diagnostic::detached(ErrorCategory::IO_ERROR, "cannot open", "main.kdl");
    CHECK_FALSE(d.span().has_value());
    CHECK(d.line() == 0);
    CHECK(d.help() == "error: cannot open\n --> main.kdl");
}

TEST_CASE("Diagnostic: context error anchors at the focused node", "[diagnostic]") {
    test::KdlFixture kdl("first 1\nsecond 2\n", "cfg.kdl");
    const auto d = kdl.node(1).error("bad node");
    CHECK(d.category() == ErrorCategory::STRUCTURAL_ERROR);
    CHECK(d.line() == 2);
    CHECK(d.column() == 1);
    CHECK(d.help().find("cfg.kdl:2:1") != std::string::npos);
    CHECK(d.help().ends_with("2 | second 2\n  | ^^^^^^^^"));
}

TEST_CASE("Diagnostic: category names", "[diagnostic]") {
    CHECK(std::string(error_category_to_string(ErrorCategory::UNKNOWN_DIRECTIVE)) == "unknown directive");
    CHECK(std::string(error_category_to_string(ErrorCategory::MUTUAL_EXCLUSION)) == "mutual exclusion");
    CHECK(std::string(error_category_to_string(ErrorCategory::IO_ERROR)) == "i/o error");
}

TEST_CASE("Result: ok and error states", "[diagnostic]") {
    auto ok = Result<int>::ok(7);
    CHECK(ok.is_ok());
    CHECK(ok.value() == 7);

    auto err = Result<int>::error(Diagnostic::detached(ErrorCategory::IO_ERROR, "nope", "x"));
    CHECK(err.is_error());
    CHECK(err.error_category() == ErrorCategory::IO_ERROR);
    CHECK(err.error_message() == "nope");

    CHECK(Result<void>::ok().is_ok());
}

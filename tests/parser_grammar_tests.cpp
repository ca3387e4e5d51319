#include "sqlchain/catalog/object_name.hpp"
#include "sqlchain/core/chain_errors.hpp"
#include "sqlchain/parser/object_name_grammar.hpp"
#include "sqlchain/parser/parameter_scanner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <system_error>
#include <vector>

using namespace sqlchain::parser;

TEST_CASE("parse_object_name accepts bare and qualified names")
{
    const auto bare = parse_object_name("Employee");
    REQUIRE(bare.success());
    CHECK(bare.ast->schema.empty());
    CHECK(bare.ast->name == "Employee");

    const auto qualified = parse_object_name("  HR . Employee ");
    REQUIRE(qualified.success());
    CHECK(qualified.ast->schema == "HR");
    CHECK(qualified.ast->name == "Employee");
}

TEST_CASE("parse_object_name unwraps every quoting style")
{
    const auto bracketed = parse_object_name("[Sales].[Order Detail]");
    REQUIRE(bracketed.success());
    CHECK(bracketed.ast->schema == "Sales");
    CHECK(bracketed.ast->name == "Order Detail");

    const auto quoted = parse_object_name("\"public\".\"say \"\"hi\"\"\"");
    REQUIRE(quoted.success());
    CHECK(quoted.ast->schema == "public");
    CHECK(quoted.ast->name == "say \"hi\"");

    const auto backticked = parse_object_name("`shop`.`line``items`");
    REQUIRE(backticked.success());
    CHECK(backticked.ast->schema == "shop");
    CHECK(backticked.ast->name == "line`items");

    const auto escaped_bracket = parse_object_name("[odd]]name]");
    REQUIRE(escaped_bracket.success());
    CHECK(escaped_bracket.ast->name == "odd]name");
}

TEST_CASE("parse_object_name reports malformed names")
{
    for (const auto* text : {"", "a.b.c", "[unterminated", "Employee.", "two words"}) {
        const auto result = parse_object_name(text);
        CHECK_FALSE(result.success());
        CHECK_FALSE(result.diagnostics.empty());
    }
}

TEST_CASE("catalog::parse_object_name raises InvalidObjectName")
{
    const auto name = sqlchain::catalog::parse_object_name("dbo.Widget");
    CHECK(name.to_string() == "dbo.Widget");
    CHECK(name == sqlchain::catalog::ObjectName{"DBO", "widget"});

    try {
        (void)sqlchain::catalog::parse_object_name("a.b.c");
        FAIL("expected InvalidObjectName");
    } catch (const std::system_error& error) {
        CHECK(error.code() == sqlchain::core::ChainErrc::InvalidObjectName);
    }
}

TEST_CASE("scan_parameter_markers collects distinct named markers")
{
    const auto scan = scan_parameter_markers(
        "SELECT * FROM Employee WHERE FirstName = @First AND LastName = @Last OR FirstName = @first");
    REQUIRE(scan.success());
    CHECK(scan.ast->named == std::vector<std::string>{"First", "Last"});
    CHECK(scan.ast->positional == 0U);
}

TEST_CASE("scan_parameter_markers ignores literals, identifiers and comments")
{
    const auto scan = scan_parameter_markers("SELECT '@NotAParam', [@Bracket], \"@Quoted\", `@Tick` -- @Line\n"
                                             "FROM T /* @Block */ WHERE Id = @Id AND @@ROWCOUNT > 0 AND x = ?");
    REQUIRE(scan.success());
    CHECK(scan.ast->named == std::vector<std::string>{"Id"});
    CHECK(scan.ast->positional == 1U);
}

TEST_CASE("scan_parameter_markers handles doubled quotes inside literals")
{
    const auto scan = scan_parameter_markers("UPDATE T SET Note = 'it''s @late' WHERE Id = @Id");
    REQUIRE(scan.success());
    CHECK(scan.ast->named == std::vector<std::string>{"Id"});
}

TEST_CASE("scan_parameter_markers reports unterminated literals")
{
    const auto scan = scan_parameter_markers("SELECT 'open FROM T WHERE Id = @Id");
    CHECK_FALSE(scan.success());
    REQUIRE_FALSE(scan.diagnostics.empty());
    CHECK(scan.diagnostics.front().line == 1U);
}

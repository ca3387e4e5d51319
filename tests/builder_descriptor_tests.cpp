#include "sqlchain/builder/operation_descriptor.hpp"

#include "support/test_models.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace sqlchain;
using namespace sqlchain::builder;
using sqlchain::catalog::ObjectName;
using sqlchain::core::Value;
using sqlchain::model::ArgumentValue;

namespace {

[[nodiscard]] ArgumentValue widget_values()
{
    return ArgumentValue::from_map({{"Id", Value{std::int64_t{1}}}, {"Name", Value{"gear"}}});
}

const ObjectName kWidgets{"dbo", "Widget"};

}  // namespace

TEST_CASE("Descriptor modifiers return new descriptors")
{
    const auto base = OperationDescriptor::query(kWidgets);
    const auto sorted = base.with_sorting({SortExpression{"Name", SortDirection::Descending}});
    const auto paged = sorted.with_limits(10, 5);
    const auto filtered = paged.with_filter(ArgumentValue::from_map({{"Active", Value{true}}}));

    CHECK(base.sort().empty());
    CHECK_FALSE(base.has_filter());
    CHECK(base.paging().strategy == LimitStrategy::None);

    REQUIRE(sorted.sort().size() == 1U);
    CHECK(sorted.sort().front().direction == SortDirection::Descending);
    CHECK_FALSE(sorted.paging().take.has_value());

    CHECK(paged.paging().skip == 10);
    CHECK(paged.paging().take == 5);
    CHECK(paged.paging().strategy == LimitStrategy::Offset);
    CHECK_FALSE(paged.has_filter());

    CHECK(filtered.has_filter());
    CHECK(std::holds_alternative<StructuredFilter>(filtered.filter()));
    CHECK(filtered.sort().size() == 1U);
}

TEST_CASE("Later filters replace earlier ones")
{
    const auto structured = OperationDescriptor::delete_set(kWidgets).with_filter(
        ArgumentValue::from_map({{"Active", Value{false}}}), FilterOptions::IgnoreNullProperties);
    REQUIRE(std::holds_alternative<StructuredFilter>(structured.filter()));
    CHECK(std::get<StructuredFilter>(structured.filter()).options == FilterOptions::IgnoreNullProperties);

    const auto raw = structured.with_where("Price > @Minimum",
                                           {execution::SqlParameter{"@Minimum", Value{5.0}, std::nullopt}});
    REQUIRE(std::holds_alternative<RawFilter>(raw.filter()));
    const auto& filter = std::get<RawFilter>(raw.filter());
    CHECK(filter.where_clause == "Price > @Minimum");
    CHECK(filter.parameters.size() == 1U);
    CHECK(std::holds_alternative<StructuredFilter>(structured.filter()));
}

TEST_CASE("Update and Delete expect one row unless told otherwise")
{
    CHECK(OperationDescriptor::update(kWidgets, widget_values()).expected_row_count() == 1);
    CHECK(OperationDescriptor::remove(kWidgets, widget_values()).expected_row_count() == 1);
    CHECK_FALSE(OperationDescriptor::update(kWidgets, widget_values(), WriteOptions::IgnoreRowsAffected)
                    .expected_row_count()
                    .has_value());
    CHECK_FALSE(OperationDescriptor::insert(kWidgets, widget_values()).expected_row_count().has_value());
    CHECK_FALSE(OperationDescriptor::update_set(kWidgets, widget_values()).expected_row_count().has_value());

    const auto relaxed = OperationDescriptor::remove(kWidgets, widget_values())
                             .with_options(WriteOptions::IgnoreRowsAffected);
    CHECK_FALSE(relaxed.expected_row_count().has_value());
    CHECK(relaxed.with_options(WriteOptions::None).expected_row_count() == 1);

    const auto counted = OperationDescriptor::update_set(kWidgets, widget_values()).with_expected_row_count(3);
    CHECK(counted.expected_row_count() == 3);
    CHECK(counted.kind() == OperationKind::UpdateSet);
}

TEST_CASE("Factories validate their arguments")
{
    CHECK_THROWS_AS(OperationDescriptor::query(ObjectName{}), std::invalid_argument);
    CHECK_THROWS_AS(OperationDescriptor::insert(kWidgets, ArgumentValue{}), std::invalid_argument);
    CHECK_THROWS_AS(OperationDescriptor::update_set(kWidgets, RawExpression{}), std::invalid_argument);
    CHECK_THROWS_AS(OperationDescriptor::update(kWidgets, widget_values(), WriteOptions::UseKeyAttribute),
                    std::invalid_argument);

    tests::EmployeeByName person;
    CHECK_NOTHROW(OperationDescriptor::update(ObjectName{"HR", "Employee"}, ArgumentValue::from_object(person),
                                              WriteOptions::UseKeyAttribute));
}

TEST_CASE("Modifiers reject combinations that make no sense")
{
    const auto insert = OperationDescriptor::insert(kWidgets, widget_values());
    const auto upsert = OperationDescriptor::upsert(kWidgets, widget_values());
    const auto query = OperationDescriptor::query(kWidgets);

    CHECK_THROWS_AS(insert.with_filter(widget_values()), std::invalid_argument);
    CHECK_THROWS_AS(upsert.with_where("Id = 1"), std::invalid_argument);
    CHECK_THROWS_AS(insert.with_sorting({SortExpression{"Name"}}), std::invalid_argument);
    CHECK_THROWS_AS(insert.with_limits(0, 1), std::invalid_argument);
    CHECK_THROWS_AS(query.with_sorting({SortExpression{}}), std::invalid_argument);
    CHECK_THROWS_AS(query.with_limits(-1, 1), std::invalid_argument);
    CHECK_THROWS_AS(query.with_limits(std::nullopt, 5, LimitStrategy::Top, 42), std::invalid_argument);
    CHECK_THROWS_AS(query.with_limits(1, 5, LimitStrategy::None), std::invalid_argument);
    CHECK_THROWS_AS(query.with_where(""), std::invalid_argument);
    CHECK_THROWS_AS(query.with_expected_row_count(1), std::invalid_argument);
    CHECK_THROWS_AS(query.with_options(WriteOptions::IgnoreRowsAffected), std::invalid_argument);
    CHECK_THROWS_AS(insert.with_expected_row_count(-1), std::invalid_argument);
    CHECK_THROWS_AS(insert.with_match_columns({"Name"}), std::invalid_argument);
    CHECK_THROWS_AS(upsert.with_match_columns({}), std::invalid_argument);
    CHECK_THROWS_AS(upsert.with_options(WriteOptions::UseKeyAttribute), std::invalid_argument);

    CHECK_NOTHROW(query.with_limits(std::nullopt, 5, LimitStrategy::RandomSample, 42));
    CHECK(upsert.with_match_columns({"Name"}).match_columns().size() == 1U);
}

TEST_CASE("Operation kinds have readable names")
{
    CHECK(to_string(OperationKind::Query) == "Query");
    CHECK(to_string(OperationKind::UpdateSet) == "UpdateSet");
    CHECK(to_string(OperationKind::DeleteSet) == "DeleteSet");
    CHECK_FALSE(is_mutation(OperationKind::Query));
    CHECK(is_mutation(OperationKind::Upsert));
}

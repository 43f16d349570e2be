#include <catch2/catch_test_macros.hpp>

#include "fixtures/logistics_fixture.hpp"

#include <cashlog/store/schema_catalog.hpp>

#include <algorithm>

using namespace cashlog;
using namespace cashlog::testing;

namespace {

TableName Table(const std::string& name) {
    return TableName::Create(name).Value();
}

const ColumnInfo* FindColumn(const std::vector<ColumnInfo>& columns,
                             const std::string& name) {
    auto it = std::find_if(columns.begin(), columns.end(),
                           [&](const ColumnInfo& c) { return c.name == name; });
    return it == columns.end() ? nullptr : &*it;
}

} // anonymous namespace

// ===========================================================================
// ListTables
// ===========================================================================

TEST_CASE("ListTables: user tables in name order", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    auto tables = ListTables(*executor);
    REQUIRE(tables.IsOk());
    const std::vector<std::string> expected{
        "carrier_invoices", "carriers", "deposits", "locations",
        "pickup_schedules", "scheduled_pickups"};
    CHECK(tables.Value() == expected);
}

TEST_CASE("ListTables: reflects schema changes", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    Exec(*executor, "CREATE TABLE audit_notes (id INTEGER PRIMARY KEY, note TEXT)");
    // AUTOINCREMENT creates sqlite_sequence, which stays hidden.
    Exec(*executor, "CREATE TABLE routes (id INTEGER PRIMARY KEY AUTOINCREMENT)");

    auto tables = ListTables(*executor);
    REQUIRE(tables.IsOk());
    CHECK(tables.Value().front() == "audit_notes");
    CHECK(std::count(tables.Value().begin(), tables.Value().end(), "routes") == 1);
    CHECK(std::none_of(tables.Value().begin(), tables.Value().end(),
                       [](const std::string& t) { return t.rfind("sqlite_", 0) == 0; }));
}

TEST_CASE("ListTables: empty database", "[store][catalog]") {
    ExecutorOptions options;
    options.create_if_missing = true;
    auto executor = QueryExecutor::Open(":memory:", options);
    REQUIRE(executor.IsOk());
    auto tables = ListTables(*executor.Value());
    REQUIRE(tables.IsOk());
    CHECK(tables.Value().empty());
}

// ===========================================================================
// DescribeTable
// ===========================================================================

TEST_CASE("DescribeTable: columns in declaration order", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    auto columns = DescribeTable(*executor, Table("pickup_schedules"));
    REQUIRE(columns.IsOk());
    const auto& cols = columns.Value();
    REQUIRE(cols.size() == 7);
    CHECK(cols[0].name == "id");
    CHECK(cols[0].primary_key_position == 1);
    CHECK(cols[3].name == "day_of_week");
    CHECK(cols[3].declared_type == "INTEGER");
    CHECK_FALSE(cols[3].nullable);
    CHECK(cols[5].name == "route_sequence");
    CHECK(cols[5].nullable);

    const auto* active = FindColumn(cols, "active");
    REQUIRE(active != nullptr);
    REQUIRE(active->default_value.has_value());
    CHECK(*active->default_value == "1");
}

TEST_CASE("DescribeTable: every listed table is describable", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    auto tables = ListTables(*executor);
    REQUIRE(tables.IsOk());
    for (const auto& name : tables.Value()) {
        INFO(name);
        auto columns = DescribeTable(*executor, Table(name));
        REQUIRE(columns.IsOk());
        CHECK_FALSE(columns.Value().empty());
    }
}

TEST_CASE("DescribeTable: unknown table is NotFound", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    auto columns = DescribeTable(*executor, Table("vaults"));
    REQUIRE(columns.IsErr());
    CHECK(columns.Error().kind == ErrorKind::NotFound);
    CHECK(columns.Error().message == "Table 'vaults' does not exist");
}

TEST_CASE("DescribeTable: names are bound, not spliced", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    auto columns = DescribeTable(*executor, Table("locations'); DROP TABLE deposits; --"));
    REQUIRE(columns.IsErr());
    CHECK(columns.Error().kind == ErrorKind::NotFound);

    auto still_there = DescribeTable(*executor, Table("deposits"));
    CHECK(still_there.IsOk());
}

// ===========================================================================
// HasColumn
// ===========================================================================

TEST_CASE("HasColumn: optional coordinate columns", "[store][catalog]") {
    auto with = OpenMemoryStore();
    CHECK(HasColumn(*with, Table("locations"), "latitude").Value());
    CHECK(HasColumn(*with, Table("locations"), "LONGITUDE").Value());

    SchemaOptions plain;
    plain.with_coordinates = false;
    auto without = OpenMemoryStore(plain);
    CHECK_FALSE(HasColumn(*without, Table("locations"), "latitude").Value());
}

TEST_CASE("HasColumn: missing table is false", "[store][catalog]") {
    auto executor = OpenMemoryStore();
    auto result = HasColumn(*executor, Table("vaults"), "id");
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value());
}

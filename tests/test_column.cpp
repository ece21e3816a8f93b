#include <parity/core/column.hpp>
#include <parity/table/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using parity::DataType;
using parity::Value;
using parity::table::ColumnMeta;
using parity::table::GroupKey;
using parity::table::KeyEntry;
using parity::table::Table;

TEST_CASE("Column<int64_t> basic operations", "[core][column]") {
    parity::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE(col[0] == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back and emplace_back grow the column") {
        col.push_back(6);
        col.emplace_back();
        REQUIRE(col.size() == 7);
        REQUIRE(col[5] == 6);
        REQUIRE(col[6] == 0);
    }
}

TEST_CASE("Column gather", "[core][column]") {
    parity::Column<std::int64_t> col{1, 2, 3, 4, 5, 6};

    auto picked = col.gather({5, 0, 0});
    REQUIRE(picked == parity::Column<std::int64_t>{6, 1, 1});
    REQUIRE(col.gather({}).size() == 0);
}

TEST_CASE("Column<bool> behaves like the other element types", "[core][column]") {
    parity::Column<bool> col;
    REQUIRE(col.size() == 0);
    col.push_back(true);
    col.emplace_back();
    REQUIRE(col[0]);
    REQUIRE_FALSE(col[1]);
    REQUIRE(col.gather({1, 0}) == parity::Column<bool>{false, true});
}

TEST_CASE("Table append_row checks width and types", "[table]") {
    Table t;
    t.add_column(ColumnMeta{.name = "host", .type = DataType::String});
    t.add_column(ColumnMeta{.name = "value", .type = DataType::Float});

    REQUIRE(t.append_row({Value{std::string("a")}, Value{1.5}}));
    REQUIRE(t.append_row({Value{std::string("b")}, Value{}}));
    REQUIRE_FALSE(t.append_row({Value{std::string("c")}}));
    REQUIRE_FALSE(t.append_row({Value{std::string("c")}, Value{std::int64_t{2}}}));

    REQUIRE(t.rows() == 2);
    REQUIRE(std::get<double>(t.value_at(1, 0)) == 1.5);
    REQUIRE(parity::is_null(t.value_at(1, 1)));
    REQUIRE(parity::table::is_null(*t.find("value"), 1));
}

TEST_CASE("Table gather keeps key and validity", "[table]") {
    Table t;
    t.key.add(ColumnMeta{.name = "host", .type = DataType::String}, Value{std::string("a")});
    t.add_column(ColumnMeta{.name = "host", .type = DataType::String});
    t.add_column(ColumnMeta{.name = "value", .type = DataType::Int});
    REQUIRE(t.append_row({Value{std::string("a")}, Value{std::int64_t{1}}}));
    REQUIRE(t.append_row({Value{std::string("a")}, Value{}}));
    REQUIRE(t.append_row({Value{std::string("a")}, Value{std::int64_t{3}}}));

    auto picked = t.gather({2, 1});
    REQUIRE(picked.rows() == 2);
    REQUIRE(picked.key == t.key);
    REQUIRE(std::get<std::int64_t>(picked.value_at(1, 0)) == 3);
    REQUIRE(parity::is_null(picked.value_at(1, 1)));
}

TEST_CASE("GroupKey equality ignores entry order", "[table]") {
    ColumnMeta host{.name = "host", .type = DataType::String};
    ColumnMeta region{.name = "region", .type = DataType::String};

    GroupKey a({KeyEntry{host, Value{std::string("a")}},
                KeyEntry{region, Value{std::string("east")}}});
    GroupKey b({KeyEntry{region, Value{std::string("east")}},
                KeyEntry{host, Value{std::string("a")}}});
    GroupKey c({KeyEntry{host, Value{std::string("a")}}});

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE(a.format() == "host=a,region=east");
    REQUIRE(GroupKey{}.format() == "{}");
}

TEST_CASE("GroupKey compares types as well as values", "[table]") {
    GroupKey text({KeyEntry{ColumnMeta{.name = "n", .type = DataType::String},
                            Value{std::string("1")}}});
    GroupKey number({KeyEntry{ColumnMeta{.name = "n", .type = DataType::Int},
                              Value{std::int64_t{1}}}});
    REQUIRE_FALSE(text == number);
}

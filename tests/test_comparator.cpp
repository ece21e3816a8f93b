#include <parity/codec/annotated_csv.hpp>
#include <parity/compare/comparator.hpp>

#include <catch2/catch_test_macros.hpp>

#include "counting_source.hpp"

#include <parity/io/byte_source.hpp>

#include <cmath>
#include <string>
#include <vector>

using parity::DataType;
using parity::Value;
using parity::compare::compare;
using parity::compare::render;
using parity::table::ColumnMeta;
using parity::table::NamedTable;
using parity::table::ResultStream;
using parity::table::Table;

namespace {

// host (group key) + _value, one row per value.
auto series(const std::string& host, const std::vector<Value>& values,
            DataType type = DataType::Int) -> Table {
    Table t;
    t.add_column(ColumnMeta{.name = "host", .type = DataType::String});
    t.add_column(ColumnMeta{.name = "_value", .type = type});
    t.key.add(ColumnMeta{.name = "host", .type = DataType::String}, Value{host});
    for (const auto& v : values) {
        REQUIRE(t.append_row({Value{host}, v}));
    }
    return t;
}

auto i64(std::int64_t v) -> Value { return Value{v}; }

auto stream_of(std::vector<Table> tables, const std::string& result = "_result")
    -> ResultStream {
    std::vector<NamedTable> named;
    for (auto& t : tables) {
        named.push_back(NamedTable{.result = result, .table = std::move(t)});
    }
    return ResultStream::from_tables(std::move(named));
}

auto verdict(std::vector<Table> want, std::vector<Table> got) -> parity::compare::Verdict {
    auto lhs = stream_of(std::move(want));
    auto rhs = stream_of(std::move(got));
    auto out = compare(lhs, rhs);
    REQUIRE(out.has_value());
    REQUIRE(lhs.released());
    REQUIRE(rhs.released());
    return *out;
}

}  // namespace

TEST_CASE("Identical streams are equal", "[compare]") {
    auto v = verdict({series("a", {i64(1), i64(2)})}, {series("a", {i64(1), i64(2)})});
    REQUIRE(v.is_equal());
    REQUIRE(v.description().empty());
}

TEST_CASE("Table order, column order and result names are not significant", "[compare]") {
    Table reordered;
    reordered.add_column(ColumnMeta{.name = "_value", .type = DataType::Int});
    reordered.add_column(ColumnMeta{.name = "host", .type = DataType::String});
    reordered.key.add(ColumnMeta{.name = "host", .type = DataType::String},
                      Value{std::string("b")});
    REQUIRE(reordered.append_row({i64(5), Value{std::string("b")}}));

    auto want = stream_of({series("a", {i64(1)}), series("b", {i64(5)})}, "_result");
    auto got = stream_of({reordered, series("a", {i64(1)})}, "0");
    auto out = compare(want, got);
    REQUIRE(out.has_value());
    REQUIRE(out->is_equal());
}

TEST_CASE("Tables of the same series are concatenated", "[compare]") {
    auto v = verdict({series("a", {i64(1), i64(2), i64(3)})},
                     {series("a", {i64(1)}), series("a", {i64(2), i64(3)})});
    REQUIRE(v.is_equal());
}

TEST_CASE("Row order within a series is significant", "[compare]") {
    auto v = verdict({series("a", {i64(1), i64(2)})}, {series("a", {i64(2), i64(1)})});
    REQUIRE_FALSE(v.is_equal());
    REQUIRE(v.description().starts_with(
        "series {host=a} [_value:int,host:string]: row 0 column '_value': want 1 (int), got 2 (int)\n"));
    REQUIRE(v.description().find("--- want\n+++ got\n") != std::string::npos);
}

TEST_CASE("Missing and unexpected series are reported", "[compare]") {
    SECTION("missing") {
        auto v = verdict({series("a", {i64(1)}), series("b", {i64(1)})}, {series("a", {i64(1)})});
        REQUIRE_FALSE(v.is_equal());
        REQUIRE(v.description().starts_with("missing series {host=b}"));
    }

    SECTION("unexpected") {
        auto v = verdict({series("a", {i64(1)})}, {series("a", {i64(1)}), series("c", {i64(1)})});
        REQUIRE_FALSE(v.is_equal());
        REQUIRE(v.description().starts_with("unexpected series {host=c}"));
    }

    SECTION("row count") {
        auto v = verdict({series("a", {i64(1)})}, {series("a", {i64(1), i64(1)})});
        REQUIRE(v.description().starts_with("series {host=a} [_value:int,host:string]: want 1 rows, got 2"));
    }
}

TEST_CASE("Comparison is symmetric", "[compare]") {
    std::vector<std::pair<std::vector<Table>, std::vector<Table>>> pairs = {
        {{series("a", {i64(1)})}, {series("a", {i64(1)})}},
        {{series("a", {i64(1)})}, {series("a", {i64(2)})}},
        {{series("a", {i64(1)})}, {}},
        {{series("a", {i64(1)})}, {series("a", {Value{1.0}}, DataType::Float)}},
    };
    for (const auto& [lhs, rhs] : pairs) {
        REQUIRE(verdict(lhs, rhs).is_equal() == verdict(rhs, lhs).is_equal());
    }
}

TEST_CASE("Values compare exactly by type", "[compare]") {
    SECTION("int and float columns differ") {
        auto v = verdict({series("a", {i64(1)})}, {series("a", {Value{1.0}}, DataType::Float)});
        REQUIRE_FALSE(v.is_equal());
    }

    SECTION("floats are not rounded") {
        auto v = verdict({series("a", {Value{0.3}}, DataType::Float)},
                         {series("a", {Value{0.1 + 0.2}}, DataType::Float)});
        REQUIRE_FALSE(v.is_equal());
    }

    SECTION("NaN equals NaN and null equals null") {
        auto v = verdict({series("a", {Value{std::nan("")}, Value{}}, DataType::Float)},
                         {series("a", {Value{std::nan("")}, Value{}}, DataType::Float)});
        REQUIRE(v.is_equal());
    }

    SECTION("null differs from a value") {
        auto v = verdict({series("a", {Value{}})}, {series("a", {i64(0)})});
        REQUIRE_FALSE(v.is_equal());
        REQUIRE(v.description().find("want null, got 0 (int)") != std::string::npos);
    }
}

TEST_CASE("Tables without rows are series of their own", "[compare]") {
    SECTION("an extra empty table") {
        auto v = verdict({}, {series("z", {})});
        REQUIRE_FALSE(v.is_equal());
        REQUIRE(v.description().starts_with("unexpected series {host=z} [_value:int,host:string]\n"));
    }

    SECTION("a missing empty table") {
        auto v = verdict({series("a", {i64(1)}), series("b", {})}, {series("a", {i64(1)})});
        REQUIRE_FALSE(v.is_equal());
        REQUIRE(v.description().starts_with("missing series {host=b}"));
    }

    SECTION("empty on both sides") {
        REQUIRE(verdict({series("b", {})}, {series("b", {})}).is_equal());
    }

    SECTION("empty against rows") {
        auto v = verdict({series("a", {})}, {series("a", {i64(1)})});
        REQUIRE(v.description().starts_with("series {host=a} [_value:int,host:string]: want 0 rows, got 1"));
    }
}

TEST_CASE("Decode errors are returned and both streams are released", "[compare][lifecycle]") {
    auto want_stats = std::make_shared<parity::testing::SourceStats>();
    auto got_stats = std::make_shared<parity::testing::SourceStats>();
    parity::codec::AnnotatedCsvDecoder decoder;
    auto want = decoder.decode(parity::testing::counting_source(
        "#datatype,string,long,long\n,result,table,_value\n,,0,1\n,,1,2\n", want_stats));
    auto got = decoder.decode(parity::testing::counting_source(
        "#datatype,string,long,long\n,result,table,_value\n,,0,1\n,,1,two\n", got_stats));
    REQUIRE(want.has_value());
    REQUIRE(got.has_value());

    auto out = compare(*want, *got);
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == parity::ErrorKind::Decode);
    REQUIRE(out.error().line == 4);
    REQUIRE(want_stats->closes == 1);
    REQUIRE(got_stats->closes == 1);
}

TEST_CASE("Rendering is deterministic", "[compare][render]") {
    auto first = stream_of({series("b", {i64(2)}), series("a", {i64(1)})});
    auto second = stream_of({series("a", {i64(1)}), series("b", {i64(2)})});
    auto lhs = render(first);
    auto rhs = render(second);
    REQUIRE(lhs.has_value());
    REQUIRE(rhs.has_value());
    REQUIRE(*lhs == *rhs);
    REQUIRE(first.released());
    REQUIRE(lhs->starts_with("#datatype,string,long,long,string\n"));
    REQUIRE(lhs->find(",_result,0,1,a\n") != std::string::npos);
    REQUIRE(lhs->find(",_result,1,2,b\n") != std::string::npos);
}

TEST_CASE("A rendered stream decodes to an equal stream", "[compare][render]") {
    const std::string text =
        "#datatype,string,long,string,double,duration,unsignedLong\n"
        "#group,false,false,true,false,false,false\n"
        "#default,_result,,,,,\n"
        ",result,table,host,_value,span,n\n"
        ",,0,a,NaN,1h30m,18446744073709551615\n"
        ",,0,a,,,0\n"
        ",,1,b,-0.5,-5ms,\n"
        "\n"
        "#datatype,string,long,string,boolean\n"
        "#group,false,false,true,false\n"
        "#default,other,0,z,\n"
        ",result,table,region,up\n";

    parity::codec::AnnotatedCsvDecoder decoder;
    auto first = decoder.decode(parity::io::from_string(text));
    REQUIRE(first.has_value());
    auto rendered = render(*first);
    REQUIRE(rendered.has_value());
    INFO(*rendered);

    auto want = decoder.decode(parity::io::from_string(text));
    auto got = decoder.decode(parity::io::from_string(*rendered));
    REQUIRE(want.has_value());
    REQUIRE(got.has_value());
    auto out = compare(*want, *got);
    REQUIRE(out.has_value());
    CHECK(out->description().empty());
    REQUIRE(out->is_equal());
}

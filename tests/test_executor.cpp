#include <parity/codec/annotated_csv.hpp>
#include <parity/compare/comparator.hpp>
#include <parity/compiler/compiler.hpp>
#include <parity/io/byte_source.hpp>
#include <parity/runtime/executor.hpp>
#include <parity/runtime/ops.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <sstream>
#include <string>

namespace {

using namespace parity;

const std::string kData = PARITY_SOURCE_DIR "/tests/data/executor";
constexpr std::int64_t kSecond = 1'000'000'000;

auto plan_for(const std::string& query, std::optional<compiler::InputOverride> input = {})
    -> compiler::Plan {
    auto plan = compiler::compile(compiler::NativeCompiler{.query = query}, std::move(input),
                                  codec::Dialect::csv());
    REQUIRE(plan.has_value());
    return std::move(*plan);
}

auto cpu_service() -> runtime::ExecutionService {
    runtime::ExecutionService service;
    service.add_bucket("db0/autogen", kData + "/cpu.csv");
    service.add_bucket(compiler::Id(0x2000), kData + "/cpu.csv");
    return service;
}

auto evaluate(const runtime::ExecutionService& service, const std::string& query)
    -> ops::TableSet {
    auto plan = plan_for(query);
    auto tables = service.evaluate(*plan.program.pipelines.at(0).root, plan.input);
    REQUIRE(tables.has_value());
    return std::move(*tables);
}

auto run(const runtime::ExecutionService& service, const compiler::Plan& plan) -> std::string {
    std::ostringstream out;
    auto rows = service.execute(plan, out);
    REQUIRE(rows.has_value());
    return out.str();
}

auto decode(std::string text) -> table::ResultStream {
    auto stream = codec::AnnotatedCsvDecoder().decode(io::from_string(std::move(text)));
    REQUIRE(stream.has_value());
    return std::move(*stream);
}

auto int_table(const std::string& name, DataType type, const std::vector<Value>& values)
    -> table::Table {
    table::Table t;
    t.add_column(table::ColumnMeta{.name = name, .type = type});
    for (const auto& v : values) {
        REQUIRE(t.append_row({v}));
    }
    return t;
}

}  // namespace

TEST_CASE("Counting an input override produces one row", "[runtime][executor]") {
    runtime::ExecutionService service;
    auto plan = plan_for(R"(from(bucket: "db0/autogen") |> count())",
                         compiler::InputOverride{.path = kData + "/count.in.csv"});

    std::ostringstream out;
    auto rows = service.execute(plan, out);
    REQUIRE(rows.has_value());
    REQUIRE(*rows == 1);
    REQUIRE(out.str() ==
            "#datatype,string,long,long\n"
            "#group,false,false,false\n"
            "#default,,,\n"
            ",result,table,count\n"
            ",_result,0,2\n");

    auto got = decode(out.str());
    auto want = codec::decode_file(kData + "/count.out.csv");
    REQUIRE(want.has_value());
    auto verdict = compare::compare(*want, got);
    REQUIRE(verdict.has_value());
    REQUIRE(verdict->is_equal());
}

TEST_CASE("Filter and count per series", "[runtime][executor]") {
    auto service = cpu_service();
    auto tables = evaluate(service, R"(from(bucket: "db0/autogen")
        |> filter(fn: _measurement == "cpu")
        |> group(columns: ["_measurement", "host"])
        |> count(column: "value"))");
    REQUIRE(tables.size() == 2);
    REQUIRE(tables[0].key.format() == "_measurement=cpu,host=a");
    REQUIRE(tables[0].rows() == 1);
    REQUIRE(tables[0].columns.back().meta.name == "count");
    REQUIRE(std::get<std::int64_t>(tables[0].value_at(2, 0)) == 3);
    REQUIRE(std::get<std::int64_t>(tables[1].value_at(2, 0)) == 2);
}

TEST_CASE("Windowed aggregates start windows on period boundaries", "[runtime][executor]") {
    auto service = cpu_service();
    auto tables = evaluate(service, R"(from(bucket: "db0/autogen")
        |> filter(fn: _measurement == "cpu")
        |> aggregateWindow(every: 1m, fn: sum, column: "value"))");
    REQUIRE(tables.size() == 2);

    const auto& a = tables[0];
    REQUIRE(a.schema() == std::vector<table::ColumnMeta>{
                              {.name = "_measurement", .type = DataType::String},
                              {.name = "host", .type = DataType::String},
                              {.name = "_time", .type = DataType::Time},
                              {.name = "sum", .type = DataType::Float},
                          });
    REQUIRE(a.rows() == 2);
    REQUIRE(std::get<Timestamp>(a.value_at(2, 0)).nanos == 1527018780 * kSecond);
    REQUIRE(std::get<double>(a.value_at(3, 0)) == 4.0);
    REQUIRE(std::get<Timestamp>(a.value_at(2, 1)).nanos == 1527018840 * kSecond);
    REQUIRE(std::get<double>(a.value_at(3, 1)) == 5.0);

    REQUIRE(std::get<double>(tables[1].value_at(3, 1)) == 20.0);
}

TEST_CASE("Regrouping merges tables in order of first appearance", "[runtime][executor]") {
    auto service = cpu_service();
    auto tables = evaluate(service, R"(from(bucket: "db0/autogen") |> group(columns: ["host"]))");
    REQUIRE(tables.size() == 2);
    REQUIRE(tables[0].key.format() == "host=a");
    REQUIRE(tables[0].rows() == 4);
    REQUIRE(std::get<std::string>(tables[0].value_at(tables[0].index.at("_measurement"), 3)) ==
            "mem");
    REQUIRE(tables[1].key.format() == "host=b");

    auto ungrouped = evaluate(service, R"(from(bucket: "db0/autogen") |> group())");
    REQUIRE(ungrouped.size() == 1);
    REQUIRE(ungrouped[0].key.empty());
    REQUIRE(ungrouped[0].rows() == 6);
}

TEST_CASE("Sort, limit and projection", "[runtime][executor]") {
    auto service = cpu_service();
    auto tables = evaluate(service, R"(from(bucket: "db0/autogen")
        |> filter(fn: _measurement == "cpu" and host == "a")
        |> sort(columns: ["_time"], desc: true)
        |> limit(n: 2, offset: 1)
        |> keep(columns: ["value", "host"]))");
    REQUIRE(tables.size() == 1);
    const auto& t = tables[0];
    REQUIRE(t.columns.size() == 2);
    REQUIRE(t.key.format() == "host=a");
    REQUIRE(t.rows() == 2);
    REQUIRE(std::get<double>(t.value_at(0, 0)) == 3.0);
    REQUIRE(std::get<double>(t.value_at(0, 1)) == 1.0);

    auto dropped = evaluate(service, R"(from(bucket: "db0/autogen") |> drop(columns: ["host"]))");
    REQUIRE(dropped.size() == 3);
    REQUIRE(dropped[0].find("host") == nullptr);
    REQUIRE(dropped[0].key.format() == "_measurement=cpu");
}

TEST_CASE("Missing columns never match a comparison", "[runtime][executor]") {
    auto service = cpu_service();
    REQUIRE(evaluate(service, R"(from(bucket: "db0/autogen") |> filter(fn: region == "us"))")
                .empty());
    auto negated =
        evaluate(service, R"(from(bucket: "db0/autogen") |> filter(fn: not region == "us"))");
    REQUIRE(negated.size() == 3);

    auto ranged = evaluate(service, R"(from(bucket: "db0/autogen")
        |> range(start: time"2018-05-22T19:54:00Z"))");
    REQUIRE(ranged.size() == 2);
    REQUIRE(ranged[0].rows() == 1);
}

TEST_CASE("Legacy and native queries agree", "[runtime][executor][legacy]") {
    auto service = cpu_service();
    compiler::StaticMappingService mappings;
    REQUIRE(mappings.add(compiler::Mapping{.cluster = "cluster", .database = "db0",
                                           .retention_policy = "autogen", .is_default = true,
                                           .organization_id = compiler::Id(0x1000),
                                           .bucket_id = compiler::Id(0x2000)}));

    auto legacy = compiler::compile(
        compiler::TranspilingCompiler{.query = "SELECT count(value) FROM cpu GROUP BY host",
                                      .cluster = "cluster",
                                      .database = "db0",
                                      .retention_policy = "",
                                      .mappings = &mappings},
        std::nullopt, codec::Dialect::csv());
    REQUIRE(legacy.has_value());
    auto native = plan_for(R"(from(bucket: "db0/autogen")
        |> filter(fn: _measurement == "cpu")
        |> group(columns: ["_measurement", "host"])
        |> count(column: "value"))");

    auto lhs = decode(run(service, *legacy));
    auto rhs = decode(run(service, native));
    auto verdict = compare::compare(lhs, rhs);
    REQUIRE(verdict.has_value());
    INFO(verdict->description());
    REQUIRE(verdict->is_equal());
}

TEST_CASE("Execution errors", "[runtime][executor][error]") {
    auto service = cpu_service();

    SECTION("unknown bucket") {
        auto plan = plan_for(R"(from(bucket: "db9/autogen"))");
        std::ostringstream out;
        auto rows = service.execute(plan, out);
        REQUIRE_FALSE(rows.has_value());
        REQUIRE(rows.error().kind == ErrorKind::Execution);
        REQUIRE(rows.error().message == "unknown bucket db9/autogen");
    }

    SECTION("unknown bucket id") {
        auto plan = plan_for(R"(from(bucketID: "0000000000009999"))");
        std::ostringstream out;
        auto rows = service.execute(plan, out);
        REQUIRE_FALSE(rows.has_value());
        REQUIRE(rows.error().message == "unknown bucket id 0000000000009999");
    }

    SECTION("missing aggregate column") {
        auto plan = plan_for(R"(from(bucket: "db0/autogen") |> count(column: "nope"))");
        std::ostringstream out;
        auto rows = service.execute(plan, out);
        REQUIRE_FALSE(rows.has_value());
        REQUIRE(rows.error().message ==
                "column 'nope' not found for count() in table _measurement=cpu,host=a");
    }

    SECTION("unreadable input") {
        auto plan = plan_for(R"(from(bucket: "db0/autogen"))",
                             compiler::InputOverride{.path = kData + "/absent.csv"});
        std::ostringstream out;
        auto rows = service.execute(plan, out);
        REQUIRE_FALSE(rows.has_value());
        REQUIRE(rows.error().kind == ErrorKind::Execution);
    }
}

TEST_CASE("Compile errors carry the query location", "[runtime][compiler][error]") {
    auto plan = compiler::compile(compiler::NativeCompiler{.query = "from(bucket: \"a\") |> pivot()"},
                                  std::nullopt, codec::Dialect::csv());
    REQUIRE_FALSE(plan.has_value());
    REQUIRE(plan.error().kind == ErrorKind::Compile);
    REQUIRE(plan.error().format() == "1:22: unknown function 'pivot'");

    auto bad = compiler::compile(compiler::NativeCompiler{.query = "from(bucket: \"a\""},
                                 std::nullopt, codec::Dialect::csv());
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().kind == ErrorKind::Compile);

    REQUIRE(compiler::backend_name(compiler::NativeCompiler{}) == "native");
    REQUIRE(compiler::backend_name(compiler::TranspilingCompiler{}) == "transpiling");
}

TEST_CASE("Aggregate edge cases", "[runtime][ops]") {
    SECTION("an empty table reduces to one row") {
        ops::TableSet tables{int_table("_value", DataType::Int, {})};
        auto out = ops::aggregate(tables,
                                  {{.func = ir::AggFunc::Count, .column = "_value", .alias = "n"},
                                   {.func = ir::AggFunc::Mean, .column = "_value", .alias = "m"}},
                                  std::nullopt);
        REQUIRE(out.has_value());
        REQUIRE(out->at(0).rows() == 1);
        REQUIRE(std::get<std::int64_t>(out->at(0).value_at(0, 0)) == 0);
        REQUIRE(is_null(out->at(0).value_at(1, 0)));
    }

    SECTION("integer sums wrap") {
        ops::TableSet tables{int_table(
            "_value", DataType::Int,
            {Value{std::numeric_limits<std::int64_t>::max()}, Value{std::int64_t{1}}})};
        auto out = ops::aggregate(
            tables, {{.func = ir::AggFunc::Sum, .column = "_value", .alias = "sum"}}, std::nullopt);
        REQUIRE(out.has_value());
        REQUIRE(std::get<std::int64_t>(out->at(0).value_at(0, 0)) ==
                std::numeric_limits<std::int64_t>::min());
    }

    SECTION("min, max, first and last keep the input type and skip nulls") {
        ops::TableSet tables{int_table(
            "_value", DataType::UInt,
            {Value{}, Value{std::uint64_t{7}}, Value{std::uint64_t{3}}, Value{std::uint64_t{9}}})};
        auto out = ops::aggregate(tables,
                                  {{.func = ir::AggFunc::Min, .column = "_value", .alias = "min"},
                                   {.func = ir::AggFunc::Max, .column = "_value", .alias = "max"},
                                   {.func = ir::AggFunc::First, .column = "_value", .alias = "first"},
                                   {.func = ir::AggFunc::Last, .column = "_value", .alias = "last"}},
                                  std::nullopt);
        REQUIRE(out.has_value());
        const auto& t = out->at(0);
        REQUIRE(std::get<std::uint64_t>(t.value_at(0, 0)) == 3);
        REQUIRE(std::get<std::uint64_t>(t.value_at(1, 0)) == 9);
        REQUIRE(std::get<std::uint64_t>(t.value_at(2, 0)) == 7);
        REQUIRE(std::get<std::uint64_t>(t.value_at(3, 0)) == 9);
    }

    SECTION("mean needs a numeric column") {
        ops::TableSet tables{int_table("_value", DataType::String, {Value{std::string("x")}})};
        auto out = ops::aggregate(
            tables, {{.func = ir::AggFunc::Mean, .column = "_value", .alias = "mean"}},
            std::nullopt);
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().message == "mean() is not supported on string column '_value'");
    }
}

TEST_CASE("Grouping rejects conflicting column types", "[runtime][ops]") {
    ops::TableSet tables{int_table("v", DataType::Int, {Value{std::int64_t{1}}}),
                         int_table("v", DataType::Float, {Value{1.5}})};
    auto out = ops::group(tables, {});
    REQUIRE_FALSE(out.has_value());
    REQUIRE(out.error().kind == ErrorKind::Execution);
    REQUIRE(out.error().message == "column 'v' has conflicting types int and float");
}

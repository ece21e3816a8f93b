#include <parity/compiler/mapping.hpp>
#include <parity/legacy/parser.hpp>
#include <parity/legacy/transpile.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

using namespace parity;
using compiler::Id;
using compiler::Mapping;

auto require_parse(const char* source) -> legacy::Query {
    auto result = legacy::parse(source);
    REQUIRE(result.has_value());
    return std::move(result.value());
}

auto parse_error(const char* source) -> legacy::ParseError {
    auto result = legacy::parse(source);
    REQUIRE_FALSE(result.has_value());
    return result.error();
}

auto mappings() -> compiler::StaticMappingService {
    compiler::StaticMappingService service;
    REQUIRE(service.add(Mapping{.cluster = "cluster", .database = "db0",
                                .retention_policy = "autogen", .is_default = true,
                                .organization_id = Id(0x1000), .bucket_id = Id(0x2000)}));
    REQUIRE(service.add(Mapping{.cluster = "cluster", .database = "db0",
                                .retention_policy = "1week", .is_default = false,
                                .organization_id = Id(0x1000), .bucket_id = Id(0x2001)}));
    return service;
}

auto config(const compiler::MappingService* service) -> legacy::TranspileConfig {
    return legacy::TranspileConfig{.cluster = "cluster", .default_database = "db0",
                                   .default_retention_policy = "",
                                   .mappings = service};
}

auto describe(const char* source) -> std::string {
    auto service = mappings();
    auto program = legacy::transpile(source, config(&service));
    REQUIRE(program.has_value());
    return ir::describe(*program);
}

auto transpile_error(const char* source) -> Error {
    auto service = mappings();
    auto program = legacy::transpile(source, config(&service));
    REQUIRE_FALSE(program.has_value());
    REQUIRE(program.error().kind == ErrorKind::Compile);
    return program.error();
}

}  // namespace

TEST_CASE("Parse a SELECT statement", "[legacy][parser]") {
    auto query = require_parse(
        "select mean(Value) as m, max(value) from db0.\"1week\".cpu "
        "where (host = 'a' or host <> 'b') and usage > -1.5 "
        "group by time(5m), host order by time desc limit 10 offset 2");
    REQUIRE(query.statements.size() == 1);
    const auto& stmt = query.statements.front();

    REQUIRE(stmt.fields.size() == 2);
    REQUIRE(stmt.fields[0].func == ir::AggFunc::Mean);
    REQUIRE(stmt.fields[0].column == "Value");
    REQUIRE(stmt.fields[0].alias == "m");
    REQUIRE(stmt.fields[1].alias == "max");

    REQUIRE(stmt.from.database == "db0");
    REQUIRE(stmt.from.retention_policy == "1week");
    REQUIRE(stmt.from.name == "cpu");

    const auto* top = std::get_if<legacy::Logical>(&stmt.where->node);
    REQUIRE(top != nullptr);
    REQUIRE(top->conjunction);
    const auto* inner = std::get_if<legacy::Logical>(&top->left->node);
    REQUIRE(inner != nullptr);
    REQUIRE_FALSE(inner->conjunction);
    const auto* usage = std::get_if<legacy::Comparison>(&top->right->node);
    REQUIRE(usage != nullptr);
    REQUIRE(usage->op == ir::CompareOp::Gt);
    REQUIRE(std::get<double>(std::get<Value>(usage->right)) == -1.5);

    REQUIRE(stmt.group_time.has_value());
    REQUIRE(stmt.group_time->nanos == 300'000'000'000LL);
    REQUIRE(stmt.group_tags == std::vector<std::string>{"host"});
    REQUIRE(stmt.descending);
    REQUIRE(stmt.limit == 10);
    REQUIRE(stmt.offset == 2);
}

TEST_CASE("Measurement qualifiers", "[legacy][parser]") {
    auto from = [](const char* source) { return require_parse(source).statements[0].from; };

    auto plain = from("SELECT * FROM cpu");
    REQUIRE(plain.database.empty());
    REQUIRE(plain.retention_policy.empty());

    auto rp = from("SELECT * FROM autogen.cpu");
    REQUIRE(rp.database.empty());
    REQUIRE(rp.retention_policy == "autogen");

    auto default_rp = from("SELECT * FROM db0..cpu");
    REQUIRE(default_rp.database == "db0");
    REQUIRE(default_rp.retention_policy.empty());
    REQUIRE(default_rp.name == "cpu");
}

TEST_CASE("Statements, comments and quoting", "[legacy][parser]") {
    auto query = require_parse(
        "-- two statements\n"
        "SELECT \"used space\" FROM disk WHERE path = 'it\\'s';\n"
        "SELECT * FROM mem WHERE up = true;");
    REQUIRE(query.statements.size() == 2);
    REQUIRE(query.statements[0].fields[0].column == "used space");
    REQUIRE(query.statements[0].line == 2);
    const auto& cmp = std::get<legacy::Comparison>(query.statements[0].where->node);
    REQUIRE(std::get<std::string>(std::get<Value>(cmp.right)) == "it's");
    const auto& flag = std::get<legacy::Comparison>(query.statements[1].where->node);
    REQUIRE(std::get<bool>(std::get<Value>(flag.right)));
}

TEST_CASE("Legacy parse errors", "[legacy][parser][error]") {
    REQUIRE(parse_error("  ").message == "query contains no statements");
    REQUIRE(parse_error("SELECT FROM cpu").message == "expected FROM, found 'cpu'");
    REQUIRE(parse_error("SELECT value FROM cpu extra").message == "unexpected 'extra'");
    REQUIRE(parse_error("SELECT value FROM cpu ORDER BY host").message ==
            "only ORDER BY time is supported");
    REQUIRE(parse_error("SELECT value AS v FROM cpu").message ==
            "AS is only supported on aggregates");
    REQUIRE(parse_error("SELECT value FROM a.b.c.d").message ==
            "measurement has too many qualifiers");
    REQUIRE(parse_error("SELECT value FROM cpu LIMIT x").message == "expected integer after LIMIT");
    REQUIRE(parse_error("SELECT value FROM cpu WHERE host").message ==
            "expected comparison operator, found end of query");
    REQUIRE(parse_error("SELECT mean(value) FROM cpu GROUP BY time(1m), time(5m)").message ==
            "time() appears more than once in GROUP BY");

    auto err = parse_error("SELECT median(value) FROM cpu");
    REQUIRE(err.message == "unknown function 'median'");
    REQUIRE(err.line == 1);
    REQUIRE(err.column == 8);
}

TEST_CASE("Transpile an aggregate grouped by tag", "[legacy][transpile]") {
    REQUIRE(describe("SELECT count(value) FROM cpu GROUP BY host") ==
            "pipeline _result\n"
            "  aggregate count(value) as count\n"
            "    group _measurement,host\n"
            "      filter _measurement == \"cpu\"\n"
            "        scan bucketID 0000000000002000\n");
}

TEST_CASE("Transpile a raw field selection", "[legacy][transpile]") {
    REQUIRE(describe("SELECT value, host FROM db0.autogen.cpu "
                     "WHERE host = 'a' AND time >= '2018-05-22T19:53:00Z' "
                     "ORDER BY time DESC LIMIT 2 OFFSET 1") ==
            "pipeline _result\n"
            "  limit 2 offset 1\n"
            "    sort _time desc\n"
            "      keep _time,_measurement,value,host\n"
            "        group _measurement\n"
            "          filter (_measurement == \"cpu\" and "
            "(host == \"a\" and _time >= 2018-05-22T19:53:00Z))\n"
            "            scan bucketID 0000000000002000\n");
}

TEST_CASE("Transpile windows, retention policies and statement names", "[legacy][transpile]") {
    SECTION("windowed aggregates on a named retention policy") {
        REQUIRE(describe("SELECT mean(value) AS m, max(value) FROM \"1week\".cpu "
                         "GROUP BY time(1m), host") ==
                "pipeline _result\n"
                "  aggregate mean(value) as m max(value) as max every 1m\n"
                "    group _measurement,host\n"
                "      filter _measurement == \"cpu\"\n"
                "        scan bucketID 0000000000002001\n");
    }

    SECTION("several statements are named by position") {
        REQUIRE(describe("SELECT * FROM cpu; SELECT * FROM mem OFFSET 3") ==
                "pipeline 0\n"
                "  group _measurement\n"
                "    filter _measurement == \"cpu\"\n"
                "      scan bucketID 0000000000002000\n"
                "pipeline 1\n"
                "  limit 9223372036854775807 offset 3\n"
                "    group _measurement\n"
                "      filter _measurement == \"mem\"\n"
                "        scan bucketID 0000000000002000\n");
    }

    SECTION("integer time literals are nanoseconds") {
        REQUIRE(describe("SELECT * FROM cpu WHERE time < 1527018780000000000") ==
                "pipeline _result\n"
                "  group _measurement\n"
                "    filter (_measurement == \"cpu\" and _time < 2018-05-22T19:53:00Z)\n"
                "      scan bucketID 0000000000002000\n");
    }
}

TEST_CASE("Transpile errors", "[legacy][transpile][error]") {
    SECTION("parse errors become compile errors") {
        auto err = transpile_error("SELECT value FROM cpu LIMIT x");
        REQUIRE(err.format() == "1:29: expected integer after LIMIT");
    }

    SECTION("unknown database") {
        auto err = transpile_error("SELECT value FROM nodb..cpu");
        REQUIRE(err.message ==
                "no database mapping for cluster=cluster database=nodb "
                "retention_policy=<default>");
        REQUIRE(err.line == 1);
        REQUIRE(err.column == 1);
    }

    SECTION("unknown retention policy") {
        REQUIRE(transpile_error("SELECT value FROM db0.daily.cpu").message ==
                "no database mapping for cluster=cluster database=db0 retention_policy=daily");
    }

    SECTION("statement shapes") {
        REQUIRE(transpile_error("SELECT mean(value), host FROM cpu").message ==
                "mixing aggregate and non-aggregate fields is not supported");
        REQUIRE(transpile_error("SELECT value FROM cpu GROUP BY time(1m)").message ==
                "GROUP BY time() requires an aggregate function");
        REQUIRE(transpile_error("SELECT count(*) FROM cpu").message ==
                "count(*) is not supported");
        REQUIRE(transpile_error("SELECT max(value), max(other) FROM cpu").message ==
                "duplicate output column 'max'");
        REQUIRE(transpile_error("SELECT * FROM cpu WHERE time > 'yesterday'").message ==
                "invalid time literal 'yesterday'");
    }

    SECTION("missing configuration") {
        auto query = require_parse("SELECT * FROM cpu");
        auto no_service = legacy::transpile(query, config(nullptr));
        REQUIRE_FALSE(no_service.has_value());
        REQUIRE(no_service.error().message == "no mapping service configured");

        auto service = mappings();
        auto cfg = config(&service);
        cfg.default_database.clear();
        auto no_database = legacy::transpile(query, cfg);
        REQUIRE_FALSE(no_database.has_value());
        REQUIRE(no_database.error().message == "database name required");
    }
}

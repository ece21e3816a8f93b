#include <parity/ir/builder.hpp>
#include <parity/ir/node.hpp>
#include <parity/ir/program.hpp>

#include <catch2/catch_test_macros.hpp>

TEST_CASE("Builder creates nodes with unique IDs", "[ir][builder]") {
    parity::ir::Builder builder;

    auto scan = builder.scan(
        parity::ir::Source{.kind = parity::ir::Source::Kind::BucketName, .value = "db0/autogen"});
    auto filter = builder.filter(parity::ir::filter_cmp(parity::ir::CompareOp::Gt,
                                                        parity::ir::filter_col("value"),
                                                        parity::ir::filter_lit(100.0)));

    REQUIRE(scan->id() != filter->id());
    REQUIRE(scan->kind() == parity::ir::NodeKind::Scan);
    REQUIRE(filter->kind() == parity::ir::NodeKind::Filter);
}

TEST_CASE("ScanNode stores its source", "[ir][scan]") {
    parity::ir::Builder builder;
    auto node = builder.scan(
        parity::ir::Source{.kind = parity::ir::Source::Kind::BucketId, .value = "0000000000002000"});

    auto* scan = dynamic_cast<parity::ir::ScanNode*>(node.get());
    REQUIRE(scan != nullptr);
    REQUIRE(scan->source().kind == parity::ir::Source::Kind::BucketId);
    REQUIRE(scan->source().value == "0000000000002000");
    REQUIRE(scan->children().empty());
}

TEST_CASE("FilterNode stores predicate", "[ir][filter]") {
    parity::ir::Builder builder;

    auto node = builder.filter(parity::ir::filter_cmp(parity::ir::CompareOp::Ge,
                                                      parity::ir::filter_col("volume"),
                                                      parity::ir::filter_lit(std::int64_t{1000})));

    auto* filter_node = dynamic_cast<parity::ir::FilterNode*>(node.get());
    REQUIRE(filter_node != nullptr);
    const auto* cmp = std::get_if<parity::ir::FilterCmp>(&filter_node->predicate().node);
    REQUIRE(cmp != nullptr);
    REQUIRE(cmp->op == parity::ir::CompareOp::Ge);
    const auto* col = std::get_if<parity::ir::FilterColumn>(&cmp->left->node);
    REQUIRE(col != nullptr);
    REQUIRE(col->name == "volume");
}

TEST_CASE("Keep and drop share the projection node", "[ir][project]") {
    parity::ir::Builder builder;

    auto keep = builder.keep({"_time", "value"});
    auto drop = builder.drop({"host"});

    auto* kept = dynamic_cast<parity::ir::ProjectNode*>(keep.get());
    REQUIRE(kept != nullptr);
    REQUIRE(kept->kind() == parity::ir::NodeKind::Keep);
    REQUIRE(kept->columns().size() == 2);
    REQUIRE(kept->columns()[0] == "_time");

    auto* dropped = dynamic_cast<parity::ir::ProjectNode*>(drop.get());
    REQUIRE(dropped != nullptr);
    REQUIRE(dropped->kind() == parity::ir::NodeKind::Drop);
}

TEST_CASE("Aggregate function names", "[ir][aggregate]") {
    REQUIRE(parity::ir::parse_agg_func("mean") == parity::ir::AggFunc::Mean);
    REQUIRE(parity::ir::agg_func_name(parity::ir::AggFunc::Last) == "last");
    REQUIRE_FALSE(parity::ir::parse_agg_func("median").has_value());
}

TEST_CASE("Chained nodes describe as an indented tree", "[ir][describe]") {
    parity::ir::Builder builder;

    auto root = builder.scan(
        parity::ir::Source{.kind = parity::ir::Source::Kind::BucketName, .value = "db0/autogen"});
    root = parity::ir::Builder::chain(
        std::move(root),
        builder.filter(parity::ir::filter_or(
            parity::ir::filter_not(parity::ir::filter_cmp(parity::ir::CompareOp::Eq,
                                                          parity::ir::filter_col("host"),
                                                          parity::ir::filter_lit(std::string("a")))),
            parity::ir::filter_cmp(parity::ir::CompareOp::Le, parity::ir::filter_col("value"),
                                   parity::ir::filter_lit(std::int64_t{3})))));
    root = parity::ir::Builder::chain(
        std::move(root),
        builder.aggregate({{.func = parity::ir::AggFunc::Sum, .column = "value", .alias = "total"}},
                          parity::Duration{.nanos = 300'000'000'000}));

    REQUIRE(root->kind() == parity::ir::NodeKind::Aggregate);
    REQUIRE(root->children().size() == 1);

    parity::ir::Program program;
    program.pipelines.push_back(parity::ir::Pipeline{.result_name = "0", .root = std::move(root)});
    REQUIRE(parity::ir::describe(program) ==
            "pipeline 0\n"
            "  aggregate sum(value) as total every 5m\n"
            "    filter (not (host == \"a\") or value <= 3)\n"
            "      scan bucket db0/autogen\n");
}

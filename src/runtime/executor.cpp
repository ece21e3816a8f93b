#include <parity/codec/codec.hpp>
#include <parity/runtime/executor.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace parity::runtime {

namespace {

auto execution_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(make_error(ErrorKind::Execution, std::move(message)));
}

auto decode_tables(const std::filesystem::path& path) -> Expected<ops::TableSet> {
    auto stream = codec::decode_file(path);
    if (!stream.has_value()) {
        return std::unexpected(make_error(ErrorKind::Execution, stream.error().format()));
    }
    auto named = stream->materialize();
    if (!named.has_value()) {
        return std::unexpected(make_error(ErrorKind::Execution, named.error().format()));
    }
    ops::TableSet tables;
    tables.reserve(named->size());
    for (auto& entry : *named) {
        tables.push_back(std::move(entry.table));
    }
    return tables;
}

}  // namespace

void ExecutionService::add_bucket(std::string name, std::filesystem::path fixture) {
    by_name_[std::move(name)] = std::move(fixture);
}

void ExecutionService::add_bucket(compiler::Id id, std::filesystem::path fixture) {
    by_id_[id.format()] = std::move(fixture);
}

auto ExecutionService::load(const ir::Source& source,
                            const std::optional<compiler::InputOverride>& input) const
    -> Expected<ops::TableSet> {
    if (input.has_value()) {
        return decode_tables(input->path);
    }
    const auto& buckets = source.kind == ir::Source::Kind::BucketId ? by_id_ : by_name_;
    auto it = buckets.find(source.value);
    if (it == buckets.end()) {
        return execution_error(fmt::format(
            "unknown bucket {}{}", source.kind == ir::Source::Kind::BucketId ? "id " : "",
            source.value));
    }
    return decode_tables(it->second);
}

// NOLINTBEGIN cppcoreguidelines-pro-type-static-cast-downcast
auto ExecutionService::evaluate(const ir::Node& node,
                                const std::optional<compiler::InputOverride>& input) const
    -> Expected<ops::TableSet> {
    if (node.kind() == ir::NodeKind::Scan) {
        return load(static_cast<const ir::ScanNode&>(node).source(), input);
    }
    if (node.children().empty()) {
        return execution_error("operator has no input");
    }
    auto child = evaluate(*node.children().front(), input);
    if (!child) {
        return child;
    }
    switch (node.kind()) {
        case ir::NodeKind::Filter:
            return ops::filter(*child, static_cast<const ir::FilterNode&>(node).predicate());
        case ir::NodeKind::Group:
            return ops::group(*child, static_cast<const ir::GroupNode&>(node).columns());
        case ir::NodeKind::Keep:
            return ops::keep(*child, static_cast<const ir::ProjectNode&>(node).columns());
        case ir::NodeKind::Drop:
            return ops::drop(*child, static_cast<const ir::ProjectNode&>(node).columns());
        case ir::NodeKind::Sort: {
            const auto& sort = static_cast<const ir::SortNode&>(node);
            return ops::sort(*child, sort.columns(), sort.descending());
        }
        case ir::NodeKind::Limit: {
            const auto& limit = static_cast<const ir::LimitNode&>(node);
            return ops::limit(*child, limit.count(), limit.offset());
        }
        case ir::NodeKind::Aggregate: {
            const auto& agg = static_cast<const ir::AggregateNode&>(node);
            return ops::aggregate(*child, agg.aggregations(), agg.every());
        }
        case ir::NodeKind::Scan:
            break;
    }
    return execution_error("unsupported operator");
}
// NOLINTEND cppcoreguidelines-pro-type-static-cast-downcast

auto ExecutionService::execute(const compiler::Plan& plan, std::ostream& out) const
    -> Expected<std::int64_t> {
    std::vector<table::NamedTable> results;
    for (const auto& pipeline : plan.program.pipelines) {
        if (!pipeline.root) {
            return execution_error(fmt::format("pipeline {} is empty", pipeline.result_name));
        }
        auto tables = evaluate(*pipeline.root, plan.input);
        if (!tables.has_value()) {
            return std::unexpected(std::move(tables.error()));
        }
        spdlog::debug("pipeline {}: {} tables", pipeline.result_name, tables->size());
        for (auto& t : *tables) {
            results.push_back(
                table::NamedTable{.result = pipeline.result_name, .table = std::move(t)});
        }
    }
    auto stream = table::ResultStream::from_tables(std::move(results));
    auto encoder = codec::make_encoder(plan.dialect);
    auto rows = encoder->encode(stream, out);
    if (!rows.has_value()) {
        return std::unexpected(make_error(ErrorKind::Execution, rows.error().message));
    }
    return rows;
}

}  // namespace parity::runtime

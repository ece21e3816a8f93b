#include <parity/compiler/mapping.hpp>

#include <fmt/core.h>

#include <charconv>

namespace parity::compiler {

auto Id::parse(std::string_view text) -> std::optional<Id> {
    if (text.size() != 16) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return Id(value);
}

auto Id::format() const -> std::string {
    return fmt::format("{:016x}", value_);
}

auto MappingFilter::matches(const Mapping& mapping) const -> bool {
    return (!cluster.has_value() || *cluster == mapping.cluster) &&
           (!database.has_value() || *database == mapping.database) &&
           (!retention_policy.has_value() || *retention_policy == mapping.retention_policy) &&
           (!is_default.has_value() || *is_default == mapping.is_default);
}

auto MappingService::find_default_mapping(std::string_view cluster, std::string_view database,
                                          std::string_view retention_policy) const
    -> Expected<Mapping> {
    MappingFilter filter{.cluster = std::string(cluster), .database = std::string(database)};
    if (retention_policy.empty()) {
        filter.is_default = true;
    } else {
        filter.retention_policy = std::string(retention_policy);
    }
    return find_mapping(filter);
}

auto MappingService::find_mapping(const MappingFilter& filter) const -> Expected<Mapping> {
    auto found = find_all_mappings(filter);
    if (!found.has_value()) {
        return std::unexpected(std::move(found.error()));
    }
    auto& [mappings, count] = *found;
    const auto describe = [&filter]() {
        return fmt::format("cluster={} database={} retention_policy={}",
                           filter.cluster.value_or("*"), filter.database.value_or("*"),
                           filter.retention_policy.value_or(filter.is_default.value_or(false)
                                                                ? "<default>"
                                                                : "*"));
    };
    if (count == 0) {
        return std::unexpected(make_error(
            ErrorKind::Compile, fmt::format("no database mapping for {}", describe())));
    }
    if (count > 1) {
        return std::unexpected(make_error(
            ErrorKind::Compile,
            fmt::format("{} database mappings match {}", count, describe())));
    }
    return std::move(mappings.front());
}

auto StaticMappingService::add(Mapping mapping) -> Expected<void> {
    for (const auto& existing : mappings_) {
        if (existing.cluster != mapping.cluster || existing.database != mapping.database) {
            continue;
        }
        if (existing.retention_policy == mapping.retention_policy) {
            return std::unexpected(make_error(
                ErrorKind::Compile,
                fmt::format("mapping {}/{} already exists on cluster {}", mapping.database,
                            mapping.retention_policy, mapping.cluster)));
        }
        if (existing.is_default && mapping.is_default) {
            return std::unexpected(make_error(
                ErrorKind::Compile,
                fmt::format("database {} already has a default retention policy ({})",
                            mapping.database, existing.retention_policy)));
        }
    }
    mappings_.push_back(std::move(mapping));
    return {};
}

auto StaticMappingService::find_all_mappings(const MappingFilter& filter) const
    -> Expected<std::pair<std::vector<Mapping>, std::size_t>> {
    std::vector<Mapping> out;
    for (const auto& mapping : mappings_) {
        if (filter.matches(mapping)) {
            out.push_back(mapping);
        }
    }
    std::size_t count = out.size();
    return std::pair{std::move(out), count};
}

}  // namespace parity::compiler

#pragma once

#include <parity/core/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace parity::compiler {

/// 64-bit platform identifier, written as 16 lowercase hex digits.
class Id {
   public:
    constexpr Id() = default;
    constexpr explicit Id(std::uint64_t value) : value_(value) {}

    [[nodiscard]] static auto parse(std::string_view text) -> std::optional<Id>;

    [[nodiscard]] constexpr auto value() const noexcept -> std::uint64_t { return value_; }
    [[nodiscard]] constexpr auto valid() const noexcept -> bool { return value_ != 0; }
    [[nodiscard]] auto format() const -> std::string;

    friend constexpr auto operator==(const Id&, const Id&) -> bool = default;

   private:
    std::uint64_t value_ = 0;
};

/// Association of a legacy (cluster, database, retention policy) with a bucket.
struct Mapping {
    std::string cluster;
    std::string database;
    std::string retention_policy;
    bool is_default = false;
    Id organization_id;
    Id bucket_id;
};

/// Unset fields match anything.
struct MappingFilter {
    std::optional<std::string> cluster;
    std::optional<std::string> database;
    std::optional<std::string> retention_policy;
    std::optional<bool> is_default;

    [[nodiscard]] auto matches(const Mapping& mapping) const -> bool;
};

/// Lookup of legacy database mappings. Read-only once a run starts.
class MappingService {
   public:
    virtual ~MappingService() = default;

    /// Mapping for (cluster, database, retention policy). An empty retention
    /// policy selects the default mapping of the database.
    [[nodiscard]] virtual auto find_default_mapping(std::string_view cluster,
                                                    std::string_view database,
                                                    std::string_view retention_policy) const
        -> Expected<Mapping>;

    /// The single mapping matching `filter`.
    [[nodiscard]] virtual auto find_mapping(const MappingFilter& filter) const -> Expected<Mapping>;

    /// Every mapping matching `filter`, with the match count.
    [[nodiscard]] virtual auto find_all_mappings(const MappingFilter& filter) const
        -> Expected<std::pair<std::vector<Mapping>, std::size_t>> = 0;
};

/// In-memory mapping table, filled before a run and then only read.
class StaticMappingService final : public MappingService {
   public:
    StaticMappingService() = default;
    explicit StaticMappingService(std::vector<Mapping> mappings) : mappings_(std::move(mappings)) {}

    /// Register a mapping. Fails when the (cluster, database, retention policy)
    /// triple is already taken or a second default is added for a database.
    [[nodiscard]] auto add(Mapping mapping) -> Expected<void>;

    [[nodiscard]] auto find_all_mappings(const MappingFilter& filter) const
        -> Expected<std::pair<std::vector<Mapping>, std::size_t>> override;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return mappings_.size(); }

   private:
    std::vector<Mapping> mappings_;
};

}  // namespace parity::compiler

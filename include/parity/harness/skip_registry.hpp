#pragma once

#include <parity/core/error.hpp>

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace parity::harness {

struct SkipEntry {
    std::string name;
    std::string reason;
};

/// Case name or case stem -> reason for not running it.
///
/// Filled before a run starts and only read while cases execute, so it is
/// shared between workers without locking.
class SkipRegistry {
   public:
    SkipRegistry() = default;
    SkipRegistry(std::initializer_list<SkipEntry> entries);

    /// Parse `name<TAB>reason` lines. Blank lines and lines starting with `#`
    /// are ignored.
    [[nodiscard]] static auto parse(std::string_view text) -> Expected<SkipRegistry>;
    [[nodiscard]] static auto load(const std::filesystem::path& path) -> Expected<SkipRegistry>;

    /// Register a case; a later entry for the same name replaces the reason.
    void add(std::string name, std::string reason);

    /// Reason for skipping `name`, or nullptr when the case should run.
    [[nodiscard]] auto find(std::string_view name) const -> const std::string*;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }

   private:
    std::map<std::string, std::string, std::less<>> entries_;
};

}  // namespace parity::harness

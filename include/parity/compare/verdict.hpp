#pragma once

#include <string>
#include <utility>

namespace parity::compare {

/// Outcome of comparing two result streams. Immutable once built.
class Verdict {
   public:
    [[nodiscard]] static auto equal() -> Verdict { return Verdict(true, {}); }
    [[nodiscard]] static auto unequal(std::string description) -> Verdict {
        return Verdict(false, std::move(description));
    }

    [[nodiscard]] auto is_equal() const noexcept -> bool { return equal_; }
    [[nodiscard]] auto description() const noexcept -> const std::string& { return description_; }

   private:
    Verdict(bool equal, std::string description)
        : equal_(equal), description_(std::move(description)) {}

    bool equal_;
    std::string description_;
};

}  // namespace parity::compare

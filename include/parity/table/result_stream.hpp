#pragma once

#include <parity/core/error.hpp>
#include <parity/table/table.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parity::table {

/// A table tagged with the name of the result it belongs to.
struct NamedTable {
    std::string result;
    Table table;
};

/// Pull-based producer of tables, implemented by each wire-format decoder.
class TableReader {
   public:
    virtual ~TableReader() = default;

    /// Next table in arrival order; std::nullopt at end of input.
    [[nodiscard]] virtual auto read() -> Expected<std::optional<NamedTable>> = 0;

    /// Release the byte source behind the reader. Called once by the owning stream.
    virtual void close() = 0;
};

class ResultStream;

/// One named result: a forward-only sequence of tables.
///
/// A Result is a handle into its ResultStream and is valid only while the
/// stream is alive and has not moved on to the following result.
class Result {
   public:
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }

    /// Whether another table of this result is ready.
    [[nodiscard]] auto more() const -> bool;

    /// Next table of this result; std::nullopt once the result is exhausted.
    [[nodiscard]] auto next() -> Expected<std::optional<Table>>;

   private:
    friend class ResultStream;
    struct State;

    Result(State* state, std::string name, std::uint64_t ordinal)
        : state_(state), name_(std::move(name)), ordinal_(ordinal) {}

    State* state_;
    std::string name_;
    std::uint64_t ordinal_;
};

/// Lazy, single-pass sequence of results backed by a TableReader.
///
/// Consecutive tables carrying the same result name form one Result. The
/// underlying reader is closed exactly once: at end of input, on the first
/// error, on release() or on destruction, whichever comes first.
class ResultStream {
   public:
    /// Prime the stream by reading its first table. A failure here closes the
    /// reader and no stream is returned.
    [[nodiscard]] static auto open(std::unique_ptr<TableReader> reader) -> Expected<ResultStream>;

    /// Stream over already-materialized tables.
    [[nodiscard]] static auto from_tables(std::vector<NamedTable> tables) -> ResultStream;

    ResultStream(ResultStream&&) noexcept;
    auto operator=(ResultStream&&) noexcept -> ResultStream&;
    ResultStream(const ResultStream&) = delete;
    auto operator=(const ResultStream&) -> ResultStream& = delete;
    ~ResultStream();

    /// Whether another result is available. Skips the rest of the current result.
    [[nodiscard]] auto more() -> bool;

    /// Next result; std::nullopt at end of stream. Tables of the current
    /// result that were not consumed are skipped.
    [[nodiscard]] auto next() -> Expected<std::optional<Result>>;

    /// The error that ended the stream, if any.
    [[nodiscard]] auto err() const -> const std::optional<Error>&;

    /// Close the underlying reader. Safe to call more than once.
    void release();

    [[nodiscard]] auto released() const noexcept -> bool;

    /// Drain every remaining table, in arrival order, and release the stream.
    [[nodiscard]] auto materialize() -> Expected<std::vector<NamedTable>>;

   private:
    explicit ResultStream(std::unique_ptr<Result::State> state);

    std::unique_ptr<Result::State> state_;
};

}  // namespace parity::table

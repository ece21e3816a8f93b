#include <parity/table/result_stream.hpp>

#include <deque>
#include <iterator>

namespace parity::table {

struct Result::State {
    std::unique_ptr<TableReader> reader;
    std::optional<NamedTable> pending;
    std::optional<Error> error;
    std::string current;
    std::uint64_t ordinal = 0;
    bool in_result = false;
    bool released = false;

    void release() {
        if (released) {
            return;
        }
        released = true;
        pending.reset();
        in_result = false;
        reader->close();
    }

    // Read the next table into `pending`. End of input and errors release
    // the reader.
    void advance() {
        pending.reset();
        if (released) {
            return;
        }
        auto frame = reader->read();
        if (!frame.has_value()) {
            error = std::move(frame.error());
            release();
            return;
        }
        if (!frame->has_value()) {
            release();
            return;
        }
        pending = std::move(**frame);
    }

    [[nodiscard]] auto pending_in_current() const -> bool {
        return in_result && pending.has_value() && pending->result == current;
    }

    void skip_current() {
        while (pending_in_current()) {
            advance();
        }
        in_result = false;
    }
};

namespace {

class VectorReader final : public TableReader {
   public:
    explicit VectorReader(std::vector<NamedTable> tables)
        : tables_(std::make_move_iterator(tables.begin()), std::make_move_iterator(tables.end())) {}

    auto read() -> Expected<std::optional<NamedTable>> override {
        if (tables_.empty()) {
            return std::optional<NamedTable>{};
        }
        NamedTable out = std::move(tables_.front());
        tables_.pop_front();
        return std::optional<NamedTable>{std::move(out)};
    }

    void close() override { tables_.clear(); }

   private:
    std::deque<NamedTable> tables_;
};

}  // namespace

auto Result::more() const -> bool {
    return state_->ordinal == ordinal_ && state_->pending_in_current();
}

auto Result::next() -> Expected<std::optional<Table>> {
    if (state_->ordinal != ordinal_) {
        return std::optional<Table>{};
    }
    if (state_->pending_in_current()) {
        Table out = std::move(state_->pending->table);
        state_->advance();
        return std::optional<Table>{std::move(out)};
    }
    if (state_->error.has_value()) {
        return std::unexpected(*state_->error);
    }
    state_->in_result = false;
    return std::optional<Table>{};
}

ResultStream::ResultStream(std::unique_ptr<Result::State> state) : state_(std::move(state)) {}

ResultStream::ResultStream(ResultStream&&) noexcept = default;

auto ResultStream::operator=(ResultStream&& other) noexcept -> ResultStream& {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
    }
    return *this;
}

ResultStream::~ResultStream() {
    release();
}

auto ResultStream::open(std::unique_ptr<TableReader> reader) -> Expected<ResultStream> {
    auto state = std::make_unique<Result::State>();
    state->reader = std::move(reader);
    state->advance();
    if (state->error.has_value()) {
        return std::unexpected(*state->error);
    }
    return ResultStream(std::move(state));
}

auto ResultStream::from_tables(std::vector<NamedTable> tables) -> ResultStream {
    auto state = std::make_unique<Result::State>();
    state->reader = std::make_unique<VectorReader>(std::move(tables));
    state->advance();
    return ResultStream(std::move(state));
}

auto ResultStream::more() -> bool {
    if (!state_) {
        return false;
    }
    state_->skip_current();
    return state_->pending.has_value();
}

auto ResultStream::next() -> Expected<std::optional<Result>> {
    if (!state_) {
        return std::optional<Result>{};
    }
    state_->skip_current();
    if (!state_->pending.has_value()) {
        if (state_->error.has_value()) {
            return std::unexpected(*state_->error);
        }
        return std::optional<Result>{};
    }
    state_->current = state_->pending->result;
    state_->in_result = true;
    state_->ordinal += 1;
    return std::optional<Result>{Result(state_.get(), state_->current, state_->ordinal)};
}

auto ResultStream::err() const -> const std::optional<Error>& {
    static const std::optional<Error> kNone;
    return state_ ? state_->error : kNone;
}

void ResultStream::release() {
    if (state_) {
        state_->release();
    }
}

auto ResultStream::released() const noexcept -> bool {
    return !state_ || state_->released;
}

auto ResultStream::materialize() -> Expected<std::vector<NamedTable>> {
    std::vector<NamedTable> out;
    while (true) {
        auto result = next();
        if (!result.has_value()) {
            release();
            return std::unexpected(std::move(result.error()));
        }
        if (!result->has_value()) {
            break;
        }
        while (true) {
            auto table = (*result)->next();
            if (!table.has_value()) {
                release();
                return std::unexpected(std::move(table.error()));
            }
            if (!table->has_value()) {
                break;
            }
            out.push_back(NamedTable{.result = (*result)->name(), .table = std::move(**table)});
        }
    }
    release();
    return out;
}

}  // namespace parity::table

#pragma once

#include "execution_state.hpp"
#include "parameter_binder.hpp"
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace sqlgraph::data {

using ReaderCallback = std::function<void(ResultCursor&)>;

// One step of a suspend-capable consumer: Yielded after consuming a row,
// Pending while a fetch is still executing, Ready once it has consumed
// everything it needs from the cursor
using AsyncReaderCallback = std::function<PollStatus(ResultCursor&)>;

// Produces a per-row materializer once the cursor is open (the cursor's
// columns are known at that point)
template<typename T>
using RowMaterializer = std::function<T(ResultCursor&)>;

template<typename T>
using RowsFrom = std::function<RowMaterializer<T>(ResultCursor&)>;

template<typename T>
class RowStream;

// Executes exactly one command (text or stored procedure) with bound
// parameters. The connection is opened when closed and, in that case only,
// closed again when the execution ends.
class QueryExecutor {
public:
    QueryExecutor(ExecutionContext context, std::string command_text,
                  CommandType type = CommandType::Text);

    // Input parameter; declared type follows T
    template<typename T>
    QueryExecutor& add_parameter(const std::string& name, const T& value) {
        add_typed<T>(name, SqlTypeOf<T>::to_value(value), ParameterDirection::Input, 0, 0, 0);
        return *this;
    }

    // Input/output parameter
    template<typename T>
    QueryExecutor& add_parameter(const std::string& name, const T& value,
                                 OutputParameter<T>& out, int size = 0,
                                 uint8_t precision = 0, uint8_t scale = 0) {
        out = OutputParameter<T>(add_typed<T>(name, SqlTypeOf<T>::to_value(value),
                                              ParameterDirection::InputOutput,
                                              size, precision, scale));
        return *this;
    }

    template<typename T>
    QueryExecutor& add_output_parameter(const std::string& name, OutputParameter<T>& out,
                                        int size = 0, uint8_t precision = 0, uint8_t scale = 0) {
        out = OutputParameter<T>(add_typed<T>(name, SqlValue{}, ParameterDirection::Output,
                                              size, precision, scale));
        return *this;
    }

    // Return value of a stored procedure
    template<typename T>
    QueryExecutor& return_value(OutputParameter<T>& out) {
        out = OutputParameter<T>(add_typed<T>(kReturnValueName, SqlValue{},
                                              ParameterDirection::ReturnValue, 0, 0, 0));
        return *this;
    }

    // Declared type follows the value's runtime kind
    QueryExecutor& add_parameter(const std::string& name, const SqlValue& value);

    // Untyped form
    QueryExecutor& add_parameter(const std::string& name, SqlValue value, DbType type,
                                 ParameterDirection direction = ParameterDirection::Input,
                                 int size = 0, uint8_t precision = 0, uint8_t scale = 0);

    // Pre-configured parameter, added as is
    QueryExecutor& add_raw_parameter(QueryParameter parameter);

    // Every entry of a bag or record as an input parameter
    QueryExecutor& add_parameters(const ParameterBag& bag);

    template<typename Source>
    QueryExecutor& add_parameters(const Source& source) {
        for (auto& param : ParameterBinder::bind(source)) {
            add_raw_parameter(std::move(param));
        }
        return *this;
    }

    QueryExecutor& set_timeout(int seconds);

    void execute(const ReaderCallback& callback);

    AsyncOperation<void> execute_async(AsyncReaderCallback callback,
                                       CancellationToken token = {});

    int64_t execute_non_query();
    AsyncOperation<int64_t> execute_non_query_async(CancellationToken token = {});

    // First column of the first row; SQL null or an empty result gives T{}
    template<typename T>
    T execute_scalar() {
        SqlValue scalar;
        execute([&](ResultCursor& cursor) { scalar = read_scalar(cursor); });
        return scalar_cast<T>(scalar);
    }

    template<typename T>
    AsyncOperation<T> execute_scalar_async(CancellationToken token = {}) {
        auto scalar = std::make_shared<SqlValue>();
        auto outer = std::make_shared<AsyncOperation<void>>(execute_async(
            [scalar](ResultCursor& cursor) {
                bool has_row = false;
                if (PollStatus status = cursor.read_async(has_row); status != PollStatus::Ready) {
                    return status;
                }
                if (has_row && cursor.field_count() > 0 && !cursor.is_null(0)) {
                    *scalar = cursor.get_value(0);
                }
                return PollStatus::Ready;
            },
            std::move(token)));
        return AsyncOperation<T>([outer, scalar](T& result) {
            if (PollStatus status = outer->poll(); status != PollStatus::Ready) {
                return status;
            }
            result = scalar_cast<T>(*scalar);
            return PollStatus::Ready;
        });
    }

    // Lazy sequence of T; execution starts with the first pull
    template<typename T>
    RowStream<T> execute_stream(RowsFrom<T> rows_from, CancellationToken token = {}) {
        if (!rows_from) {
            throw core::ContractViolation("Row materializer factory must not be empty");
        }
        return RowStream<T>(state_, std::move(rows_from), std::move(token));
    }

    const std::vector<QueryParameterPtr>& parameters() const noexcept { return state_->parameters(); }
    const CommandDefinition& command() const noexcept { return state_->definition(); }

    static constexpr const char* kReturnValueName = "_retParam";

private:
    template<typename T>
    std::shared_ptr<const QueryParameter> add_typed(const std::string& name, SqlValue value,
                                                    ParameterDirection direction, int size,
                                                    uint8_t precision, uint8_t scale) {
        QueryParameter param;
        param.name = name;
        param.value = std::move(value);
        param.direction = direction;
        param.type = SqlTypeOf<T>::type;
        param.nullable = SqlTypeOf<T>::nullable;
        param.size = size;
        param.precision = precision;
        param.scale = scale;
        return push(std::move(param));
    }

    template<typename T>
    static T scalar_cast(const SqlValue& value) {
        if (is_null(value)) {
            return T{};
        }
        return value_cast<T>(value);
    }

    static SqlValue read_scalar(ResultCursor& cursor);

    QueryParameterPtr push(QueryParameter param);
    void check_not_started() const;

    std::shared_ptr<ExecutionState> state_;
};

// Pull-based, finite, single-pass sequence of rows produced by one
// execution. Abandoning it before the end cancels the remote operation
// before its cursor is released. The pull position lives in shared state,
// so iterators stay valid when the stream object is moved.
template<typename T>
class RowStream {
    class Pull;

public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        iterator() = default;
        explicit iterator(std::shared_ptr<Pull> pull) : pull_(std::move(pull)) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& other) const noexcept { return pull_ == other.pull_; }
        bool operator!=(const iterator& other) const noexcept { return !(*this == other); }

    private:
        void advance() {
            current_ = pull_->next();
            if (!current_) {
                pull_.reset();
            }
        }

        std::shared_ptr<Pull> pull_;
        std::optional<T> current_;
    };

    RowStream(std::shared_ptr<ExecutionState> state, RowsFrom<T> rows_from, CancellationToken token)
        : pull_(std::make_shared<Pull>(std::move(state), std::move(rows_from), std::move(token))) {}

    RowStream(RowStream&& other) noexcept : pull_(std::move(other.pull_)) {}

    RowStream& operator=(RowStream&& other) noexcept {
        if (this != &other) {
            abandon();
            pull_ = std::move(other.pull_);
        }
        return *this;
    }

    RowStream(const RowStream&) = delete;
    RowStream& operator=(const RowStream&) = delete;

    ~RowStream() { abandon(); }

    // Blocking pull; std::nullopt once the rows are exhausted
    std::optional<T> next() { return pull().next(); }

    // Suspend-capable pull. Ready with `row` set for each row and left empty
    // once the rows are exhausted; cancellation is checked on every poll.
    PollStatus poll_next(std::optional<T>& row) { return pull().poll_next(row); }

    iterator begin() { return iterator(pull_); }
    iterator end() { return iterator(); }

    // A moved-from stream reports finished
    bool is_finished() const noexcept { return !pull_ || pull_->is_finished(); }

private:
    class Pull {
    public:
        Pull(std::shared_ptr<ExecutionState> state, RowsFrom<T> rows_from, CancellationToken token)
            : state_(std::move(state)), rows_from_(std::move(rows_from)), token_(std::move(token)) {}

        std::optional<T> next() {
            if (done_) {
                return std::nullopt;
            }
            try {
                throw_if_cancelled();
                if (!materialize_) {
                    begin_once();
                    materialize_ = rows_from_(state_->open_cursor());
                }
                ResultCursor& cursor = *state_->cursor();
                if (!cursor.read()) {
                    finish();
                    return std::nullopt;
                }
                return materialize_(cursor);
            } catch (...) {
                fail();
                throw;
            }
        }

        PollStatus poll_next(std::optional<T>& row) {
            row.reset();
            if (done_) {
                return PollStatus::Ready;
            }
            try {
                throw_if_cancelled();
                if (!materialize_) {
                    begin_once();
                    ResultCursor* opened = nullptr;
                    if (PollStatus status = state_->open_cursor_async(opened); status != PollStatus::Ready) {
                        return status;
                    }
                    materialize_ = rows_from_(*opened);
                }
                ResultCursor& cursor = *state_->cursor();
                bool has_row = false;
                if (PollStatus status = cursor.read_async(has_row); status != PollStatus::Ready) {
                    return status;
                }
                if (!has_row) {
                    finish();
                    return PollStatus::Ready;
                }
                row = materialize_(cursor);
                return PollStatus::Ready;
            } catch (...) {
                fail();
                throw;
            }
        }

        // Stream dropped before the end
        void abandon() noexcept {
            done_ = true;
            if (begun_ && !state_->is_finished()) {
                state_->abort();
            }
        }

        bool is_finished() const noexcept { return done_; }

    private:
        void begin_once() {
            if (!begun_) {
                state_->begin();
                begun_ = true;
            }
        }

        void throw_if_cancelled() {
            if (!token_.is_cancellation_requested()) {
                return;
            }
            done_ = true;
            if (!begun_) {
                throw core::OperationCancelled();
            }
            state_->cancel_and_throw();
        }

        void finish() {
            done_ = true;
            state_->complete();
        }

        void fail() noexcept {
            done_ = true;
            if (begun_) {
                state_->abort();
            }
        }

        std::shared_ptr<ExecutionState> state_;
        RowsFrom<T> rows_from_;
        RowMaterializer<T> materialize_;
        CancellationToken token_;
        bool begun_ = false;
        bool done_ = false;
    };

    Pull& pull() {
        if (!pull_) {
            throw core::InvalidStateError("Row stream was moved from");
        }
        return *pull_;
    }

    void abandon() noexcept {
        if (pull_) {
            pull_->abandon();
        }
    }

    std::shared_ptr<Pull> pull_;
};

} // namespace sqlgraph::data

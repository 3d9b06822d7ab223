#include "query_executor.hpp"
#include "core/logger.hpp"

namespace sqlgraph::data {

QueryExecutor::QueryExecutor(ExecutionContext context, std::string command_text, CommandType type) {
    core::require_name(command_text, "Command text");

    CommandDefinition definition;
    definition.text = std::move(command_text);
    definition.type = type;
    state_ = std::make_shared<ExecutionState>(context, std::move(definition));
}

QueryExecutor& QueryExecutor::add_parameter(const std::string& name, const SqlValue& value) {
    return add_parameter(name, value, db_type_of(value));
}

QueryExecutor& QueryExecutor::add_parameter(const std::string& name, SqlValue value, DbType type,
                                            ParameterDirection direction, int size,
                                            uint8_t precision, uint8_t scale) {
    QueryParameter param;
    param.name = name;
    param.nullable = is_null(value);
    param.value = std::move(value);
    param.type = type;
    param.direction = direction;
    param.size = size;
    param.precision = precision;
    param.scale = scale;
    push(std::move(param));
    return *this;
}

QueryExecutor& QueryExecutor::add_raw_parameter(QueryParameter parameter) {
    push(std::move(parameter));
    return *this;
}

QueryExecutor& QueryExecutor::add_parameters(const ParameterBag& bag) {
    for (auto& param : ParameterBinder::bind(bag)) {
        push(std::move(param));
    }
    return *this;
}

QueryExecutor& QueryExecutor::set_timeout(int seconds) {
    check_not_started();
    state_->definition().timeout_seconds = seconds;
    return *this;
}

void QueryExecutor::execute(const ReaderCallback& callback) {
    if (!callback) {
        throw core::ContractViolation("Reader callback must not be empty");
    }

    ExecutionState& state = *state_;
    state.begin();
    try {
        callback(state.open_cursor());
        state.complete();
    } catch (...) {
        state.abort();
        throw;
    }
}

AsyncOperation<void> QueryExecutor::execute_async(AsyncReaderCallback callback,
                                                  CancellationToken token) {
    if (!callback) {
        throw core::ContractViolation("Reader callback must not be empty");
    }

    auto state = state_;
    state->begin();

    return AsyncOperation<void>([state, callback = std::move(callback), token]() {
        try {
            // Checked at every suspension point: open, execute, each fetch
            if (token.is_cancellation_requested()) {
                state->cancel_and_throw();
            }

            ResultCursor* cursor = nullptr;
            if (PollStatus status = state->open_cursor_async(cursor); status != PollStatus::Ready) {
                return status;
            }
            if (PollStatus status = callback(*cursor); status != PollStatus::Ready) {
                return status;
            }

            state->complete();
            return PollStatus::Ready;
        } catch (...) {
            // The callback failed or the caller cancelled mid-stream: the
            // server operation is cancelled before the cursor is released
            state->abort();
            throw;
        }
    });
}

int64_t QueryExecutor::execute_non_query() {
    ExecutionState& state = *state_;
    state.begin();
    try {
        int64_t affected = state.run_non_query();
        state.complete();
        LOG_DEBUG("Rows affected: " + std::to_string(affected));
        return affected;
    } catch (...) {
        state.abort();
        throw;
    }
}

AsyncOperation<int64_t> QueryExecutor::execute_non_query_async(CancellationToken token) {
    auto state = state_;
    state->begin();

    return AsyncOperation<int64_t>([state, token](int64_t& affected) {
        try {
            if (token.is_cancellation_requested()) {
                state->cancel_and_throw();
            }
            if (PollStatus status = state->run_non_query_async(affected); status != PollStatus::Ready) {
                return status;
            }
            state->complete();
            LOG_DEBUG("Rows affected: " + std::to_string(affected));
            return PollStatus::Ready;
        } catch (...) {
            state->abort();
            throw;
        }
    });
}

SqlValue QueryExecutor::read_scalar(ResultCursor& cursor) {
    if (cursor.read() && cursor.field_count() > 0 && !cursor.is_null(0)) {
        return cursor.get_value(0);
    }
    return SqlValue{};
}

QueryParameterPtr QueryExecutor::push(QueryParameter param) {
    check_not_started();
    core::require_name(param.name, "Parameter name");

    LOG_TRACE("Adding " + std::string(direction_name(param.direction)) + " parameter @" +
              param.name + " (" + db_type_name(param.type) + ")");

    auto ptr = std::make_shared<QueryParameter>(std::move(param));
    state_->parameters().push_back(ptr);
    return ptr;
}

void QueryExecutor::check_not_started() const {
    if (state_->is_started()) {
        throw core::InvalidStateError("QueryExecutor is single-use and has already executed");
    }
}

} // namespace sqlgraph::data

#include "execution_state.hpp"
#include "core/logger.hpp"

namespace sqlgraph::data {

ConnectionGuard::~ConnectionGuard() {
    try {
        release();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Failed to close owned connection: ") + e.what());
    }
}

void ConnectionGuard::acquire() {
    if (acquired_) {
        return;
    }
    if (connection_.is_open()) {
        LOG_DEBUG("Connection already open, not owned by this execution");
    } else {
        connection_.open();
        owns_ = true;
        LOG_DEBUG("Opened connection, owned by this execution");
    }
    acquired_ = true;
}

PollStatus ConnectionGuard::acquire_async() {
    if (acquired_) {
        return PollStatus::Ready;
    }
    if (!opening_) {
        if (connection_.is_open()) {
            LOG_DEBUG("Connection already open, not owned by this execution");
            acquired_ = true;
            return PollStatus::Ready;
        }
        opening_ = true;
    }

    if (PollStatus status = connection_.open_async(); status != PollStatus::Ready) {
        return status;
    }

    opening_ = false;
    owns_ = true;
    acquired_ = true;
    LOG_DEBUG("Opened connection asynchronously, owned by this execution");
    return PollStatus::Ready;
}

void ConnectionGuard::release() {
    if (opening_) {
        opening_ = false;
        connection_.cancel_open();
        LOG_DEBUG("Cancelled pending connection open");
        return;
    }
    if (!owns_) {
        return;
    }
    owns_ = false;
    connection_.close();
    LOG_DEBUG("Closed owned connection");
}

ExecutionState::ExecutionState(ExecutionContext context, CommandDefinition definition)
    : context_(context), definition_(std::move(definition)) {
    definition_.timeout_seconds = context_.timeout_seconds();
    definition_.transaction = context_.transaction();
}

ExecutionState::~ExecutionState() {
    if (started_ && !finished_) {
        LOG_DEBUG("Execution abandoned before completion");
        abort();
    }
}

void ExecutionState::begin() {
    if (started_) {
        throw core::InvalidStateError("QueryExecutor is single-use and has already executed");
    }
    DbTransaction* transaction = context_.transaction();
    if (transaction && !transaction->is_active()) {
        throw core::ContractViolation("Transaction is no longer active");
    }
    started_ = true;
    guard_.emplace(context_.connection());
    LOG_DEBUG("Executing " +
              std::string(definition_.type == CommandType::StoredProcedure ? "procedure " : "text ") +
              definition_.text);
}

void ExecutionState::open_connection() {
    guard_->acquire();
}

PollStatus ExecutionState::open_connection_async() {
    return guard_->acquire_async();
}

DbCommand& ExecutionState::command() {
    if (!command_) {
        command_ = context_.connection().create_command(definition_);
    }
    return *command_;
}

ResultCursor& ExecutionState::open_cursor() {
    open_connection();
    in_flight_ = true;
    cursor_ = &command().execute_reader(parameters_);
    return *cursor_;
}

PollStatus ExecutionState::open_cursor_async(ResultCursor*& cursor) {
    if (cursor_) {
        cursor = cursor_;
        return PollStatus::Ready;
    }
    if (PollStatus status = open_connection_async(); status != PollStatus::Ready) {
        return status;
    }
    in_flight_ = true;
    ResultCursor* opened = nullptr;
    if (PollStatus status = command().execute_reader_async(parameters_, opened); status != PollStatus::Ready) {
        return status;
    }
    cursor_ = opened;
    cursor = cursor_;
    return PollStatus::Ready;
}

int64_t ExecutionState::run_non_query() {
    open_connection();
    in_flight_ = true;
    int64_t affected = command().execute_non_query(parameters_);
    in_flight_ = false;
    return affected;
}

PollStatus ExecutionState::run_non_query_async(int64_t& affected_rows) {
    if (PollStatus status = open_connection_async(); status != PollStatus::Ready) {
        return status;
    }
    in_flight_ = true;
    if (PollStatus status = command().execute_non_query_async(parameters_, affected_rows);
        status != PollStatus::Ready) {
        return status;
    }
    in_flight_ = false;
    return PollStatus::Ready;
}

void ExecutionState::complete() {
    if (finished_) {
        return;
    }
    if (cursor_) {
        command_->close_cursor();
        cursor_ = nullptr;
    }
    in_flight_ = false;
    for (auto& param : parameters_) {
        param->value_available = true;
    }
    finished_ = true;
    command_.reset();
    if (guard_) {
        guard_->release();
    }
}

void ExecutionState::abort() noexcept {
    if (finished_) {
        return;
    }
    finished_ = true;

    // Releasing a cursor waits for the server operation to finish, so the
    // operation is cancelled first
    if (command_ && in_flight_) {
        LOG_WARN("Cancelling in-flight command before releasing its cursor");
        try {
            command_->cancel();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Command cancellation failed: ") + e.what());
        }
    }
    release();
}

void ExecutionState::cancel_and_throw() {
    LOG_INFO("Cancellation requested for: " + definition_.text);
    abort();
    throw core::OperationCancelled();
}

void ExecutionState::release() noexcept {
    if (cursor_) {
        try {
            command_->close_cursor();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Failed to release cursor: ") + e.what());
        }
        cursor_ = nullptr;
    }
    in_flight_ = false;
    command_.reset();
    if (guard_) {
        try {
            guard_->release();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Failed to close owned connection: ") + e.what());
        }
    }
}

} // namespace sqlgraph::data

#pragma once

#include "db_connection.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace sqlgraph::data {

// Caller-supplied environment of an execution
class ExecutionContext {
public:
    explicit ExecutionContext(DbConnection& connection,
                              DbTransaction* transaction = nullptr,
                              int timeout_seconds = 0)
        : connection_(&connection), transaction_(transaction), timeout_seconds_(timeout_seconds) {}

    DbConnection& connection() const noexcept { return *connection_; }
    DbTransaction* transaction() const noexcept { return transaction_; }
    int timeout_seconds() const noexcept { return timeout_seconds_; }

    ExecutionContext with_transaction(DbTransaction& transaction) const {
        return ExecutionContext(*connection_, &transaction, timeout_seconds_);
    }

private:
    DbConnection* connection_;
    DbTransaction* transaction_;
    int timeout_seconds_;
};

// Opens the connection if it is closed and remembers whether it did so.
// release() (or destruction) closes the connection only in that case.
class ConnectionGuard {
public:
    explicit ConnectionGuard(DbConnection& connection) noexcept
        : connection_(connection) {}
    ~ConnectionGuard();

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;

    void acquire();
    PollStatus acquire_async();
    void release();

    bool owns_connection() const noexcept { return owns_; }

private:
    DbConnection& connection_;
    bool owns_ = false;
    bool opening_ = false;
    bool acquired_ = false;
};

// State of the single execution a QueryExecutor performs. Shared between
// the executor and the asynchronous operations or row streams it returns,
// so those outlive the executor object itself.
class ExecutionState {
public:
    ExecutionState(ExecutionContext context, CommandDefinition definition);
    ~ExecutionState();

    ExecutionState(const ExecutionState&) = delete;
    ExecutionState& operator=(const ExecutionState&) = delete;

    const ExecutionContext& context() const noexcept { return context_; }
    CommandDefinition& definition() noexcept { return definition_; }
    const CommandDefinition& definition() const noexcept { return definition_; }
    std::vector<QueryParameterPtr>& parameters() noexcept { return parameters_; }
    const std::vector<QueryParameterPtr>& parameters() const noexcept { return parameters_; }

    // Marks the one permitted execution. Throws InvalidStateError when the
    // executor was already used.
    void begin();

    void open_connection();
    PollStatus open_connection_async();

    ResultCursor& open_cursor();
    PollStatus open_cursor_async(ResultCursor*& cursor);

    int64_t run_non_query();
    PollStatus run_non_query_async(int64_t& affected_rows);

    // Normal completion: closes the cursor, publishes output values, then
    // releases the command and the owned connection
    void complete();

    // Failure or cancellation path: requests remote cancellation while a
    // command is in flight, then releases cursor, command and connection
    void abort() noexcept;

    // abort() followed by OperationCancelled
    [[noreturn]] void cancel_and_throw();

    bool is_started() const noexcept { return started_; }
    bool is_finished() const noexcept { return finished_; }
    ResultCursor* cursor() const noexcept { return cursor_; }

private:
    DbCommand& command();
    void release() noexcept;

    ExecutionContext context_;
    CommandDefinition definition_;
    std::vector<QueryParameterPtr> parameters_;

    std::optional<ConnectionGuard> guard_;
    std::unique_ptr<DbCommand> command_;
    ResultCursor* cursor_ = nullptr;
    bool in_flight_ = false;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace sqlgraph::data

#pragma once

#include "async_operation.hpp"
#include "query_parameter.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sqlgraph::data {

enum class CommandType {
    Text,
    StoredProcedure
};

class DbTransaction;

struct CommandDefinition {
    std::string text;
    CommandType type = CommandType::Text;
    int timeout_seconds = 0;              // 0 = driver default
    const DbTransaction* transaction = nullptr;
};

// Forward-only, single-pass view over the rows of one result set.
// Column ordinals are zero-based.
class ResultCursor {
public:
    virtual ~ResultCursor() = default;

    virtual size_t field_count() const = 0;
    virtual const std::string& field_name(size_t ordinal) const = 0;

    // Advances to the next row; false once the rows are exhausted
    virtual bool read() = 0;

    // Suspend-capable advance. Ready with has_row set once the fetch
    // completed; Pending while the backend is still working.
    virtual PollStatus read_async(bool& has_row) = 0;

    virtual bool is_null(size_t ordinal) const = 0;
    virtual SqlValue get_value(size_t ordinal) const = 0;

    std::vector<std::string> field_names() const {
        std::vector<std::string> names;
        names.reserve(field_count());
        for (size_t i = 0; i < field_count(); ++i) {
            names.push_back(field_name(i));
        }
        return names;
    }
};

// One command against a connection. Parameters stay owned by the caller;
// output values are written back into them by close_cursor() or when a
// non-query execution completes.
class DbCommand {
public:
    virtual ~DbCommand() = default;

    virtual ResultCursor& execute_reader(const std::vector<QueryParameterPtr>& params) = 0;
    virtual PollStatus execute_reader_async(const std::vector<QueryParameterPtr>& params,
                                            ResultCursor*& cursor) = 0;

    virtual int64_t execute_non_query(const std::vector<QueryParameterPtr>& params) = 0;
    virtual PollStatus execute_non_query_async(const std::vector<QueryParameterPtr>& params,
                                               int64_t& affected_rows) = 0;

    // Requests cancellation of the in-flight server operation
    virtual void cancel() = 0;

    // Releases the open cursor, draining remaining results and publishing
    // output parameter values
    virtual void close_cursor() = 0;
};

class DbTransaction {
public:
    virtual ~DbTransaction() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual bool is_active() const noexcept = 0;
};

class DbConnection {
public:
    virtual ~DbConnection() = default;

    virtual bool is_open() const noexcept = 0;
    virtual void open() = 0;
    virtual PollStatus open_async() = 0;
    // Abandons an open_async() that has not reached Ready. No-op otherwise.
    virtual void cancel_open() = 0;
    virtual void close() = 0;

    virtual std::unique_ptr<DbCommand> create_command(const CommandDefinition& definition) = 0;
    virtual std::unique_ptr<DbTransaction> begin_transaction() = 0;
};

} // namespace sqlgraph::data
